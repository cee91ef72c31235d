#include "arena/AgentRegistry.hpp"

#include "arena/AnthropicClient.hpp"
#include "arena/Exceptions.hpp"
#include "arena/OpenAiClient.hpp"

#include <algorithm>
#include <memory>

namespace arena {

namespace {

void add_openai_compatible(AgentRegistry& registry, const std::vector<std::string>& names,
                           const OpenAiClient::Params& params) {
  for (const std::string& name : names) {
    registry.add(name, [params](const std::string& n) {
      return std::make_shared<OpenAiClient>(n, params);
    });
  }
}

}  // namespace

AgentRegistry::AgentRegistry(const std::vector<std::string>& allow_list)
    : allow_list_(allow_list) {}

AgentRegistry AgentRegistry::make_default(const ArenaConfig& config) {
  AgentRegistry registry(config.models);

  AnthropicClient::Params claude;
  claude.api_key = config.anthropic_api_key;
  claude.temperature = config.temperature;
  claude.timeout = config.timeout();
  for (const char* name : {"claude-opus-4-1-20250805", "claude-sonnet-4-5", "claude-haiku-4-5"}) {
    registry.add(name, [claude](const std::string& n) {
      return std::make_shared<AnthropicClient>(n, claude);
    });
  }

  OpenAiClient::Params gpt;
  gpt.base_url = "https://api.openai.com/v1";
  gpt.api_key = config.openai_api_key;
  gpt.reasoning_effort = "low";
  gpt.timeout = config.timeout();
  add_openai_compatible(registry, {"gpt-5", "gpt-5-mini", "gpt-5-nano"}, gpt);

  OpenAiClient::Params gemini;
  gemini.base_url = "https://generativelanguage.googleapis.com/v1beta/openai/";
  gemini.api_key = config.google_api_key;
  gemini.timeout = config.timeout();
  add_openai_compatible(registry, {"gemini-2.5-flash", "gemini-2.5-flash-lite", "gemini-2.5-pro"},
                        gemini);

  OpenAiClient::Params ollama;
  ollama.base_url = config.ollama_base_url();
  ollama.api_key = "ollama";
  ollama.strip_think = true;
  ollama.timeout = config.timeout();
  add_openai_compatible(registry, {"llama3.2 local", "gemma2 local", "qwen2.5 local", "phi4 local"},
                        ollama);

  OpenAiClient::Params deepseek;
  deepseek.base_url = "https://api.deepseek.com";
  deepseek.api_key = config.deepseek_api_key;
  deepseek.timeout = config.timeout();
  add_openai_compatible(registry, {"deepseek-chat V3", "deepseek-reasoner R1"}, deepseek);

  OpenAiClient::Params groq;
  groq.base_url = "https://api.groq.com/openai/v1";
  groq.api_key = config.groq_api_key;
  groq.timeout = config.timeout();
  add_openai_compatible(registry, {"openai/gpt-oss-120b via Groq"}, groq);

  return registry;
}

void AgentRegistry::add(const std::string& name, factory_t factory) {
  if (find(name)) {
    throw util::Exception("Agent {} registered twice", name);
  }
  entries_.emplace_back(name, std::move(factory));
}

std::vector<std::string> AgentRegistry::all_supported_names() const {
  std::vector<std::string> names;
  for (const auto& entry : entries_) names.push_back(entry.first);
  return names;
}

std::vector<std::string> AgentRegistry::all_names() const {
  if (allow_list_.empty()) return all_supported_names();

  std::vector<std::string> names;
  for (const std::string& name : allow_list_) {
    if (is_supported(name)) names.push_back(name);
  }
  return names;
}

bool AgentRegistry::is_supported(const std::string& name) const { return find(name) != nullptr; }

bool AgentRegistry::is_offered(const std::string& name) const {
  if (!is_supported(name)) return false;
  if (allow_list_.empty()) return true;
  return std::find(allow_list_.begin(), allow_list_.end(), name) != allow_list_.end();
}

AgentClient_sptr AgentRegistry::create(const std::string& name) const {
  const entry_t* entry = find(name);
  if (!entry) {
    throw UnsupportedAgentException("Unrecognized agent name specified: {}", name);
  }
  if (!is_offered(name)) {
    throw UnsupportedAgentException("Agent {} is not in the configured models list", name);
  }
  return entry->second(name);
}

const AgentRegistry::entry_t* AgentRegistry::find(const std::string& name) const {
  for (const auto& entry : entries_) {
    if (entry.first == name) return &entry;
  }
  return nullptr;
}

}  // namespace arena
