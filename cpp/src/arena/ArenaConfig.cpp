#include "arena/ArenaConfig.hpp"

#include "util/Asserts.hpp"
#include "util/StringUtil.hpp"

#include <fmt/format.h>

#include <cstdlib>

namespace arena {

namespace {

std::string get_secret(const util::Config& config, const std::string& key, const char* env_var) {
  std::string value = config.get(key, "");
  if (!value.empty()) return value;
  const char* env = std::getenv(env_var);
  return env ? env : "";
}

}  // namespace

ArenaConfig ArenaConfig::from_config(const util::Config& config) {
  ArenaConfig out;
  out.models = util::split_csv(config.get("models", ""));
  out.store_path = config.get("store.path", "");

  out.openai_api_key = get_secret(config, "openai.api_key", "OPENAI_API_KEY");
  out.anthropic_api_key = get_secret(config, "anthropic.api_key", "ANTHROPIC_API_KEY");
  out.google_api_key = get_secret(config, "google.api_key", "GOOGLE_API_KEY");
  out.deepseek_api_key = get_secret(config, "deepseek.api_key", "DEEPSEEK_API_KEY");
  out.groq_api_key = get_secret(config, "groq.api_key", "GROQ_API_KEY");

  out.ollama_host = config.get("ollama.host", out.ollama_host);
  if (config.contains("ollama.port")) {
    out.ollama_port = util::atoi_safe(config.get("ollama.port"));
  }
  if (config.contains("agent.temperature")) {
    out.temperature = util::atof_safe(config.get("agent.temperature"));
  }
  if (config.contains("agent.max_tokens")) {
    out.max_tokens = util::atoi_safe(config.get("agent.max_tokens"));
  }
  if (config.contains("agent.timeout_seconds")) {
    out.timeout_seconds = util::atoi_safe(config.get("agent.timeout_seconds"));
  }

  CLEAN_ASSERT(out.ollama_port > 0 && out.ollama_port < 65536, "Bad ollama.port in {}: {}",
               config.source(), out.ollama_port);
  CLEAN_ASSERT(out.temperature >= 0, "Bad agent.temperature in {}: {}", config.source(),
               out.temperature);
  CLEAN_ASSERT(out.max_tokens > 0, "Bad agent.max_tokens in {}: {}", config.source(),
               out.max_tokens);
  CLEAN_ASSERT(out.timeout_seconds > 0, "Bad agent.timeout_seconds in {}: {}", config.source(),
               out.timeout_seconds);
  return out;
}

std::string ArenaConfig::ollama_base_url() const {
  return fmt::format("http://{}:{}/v1", ollama_host, ollama_port);
}

}  // namespace arena
