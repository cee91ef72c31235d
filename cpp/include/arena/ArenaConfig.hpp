#pragma once

#include "util/Config.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace arena {

/*
 * Resolved arena configuration. Built from a util::Config (see the keys below), with provider
 * credentials falling back to their conventional environment variables.
 *
 *   models = gpt-5-mini, claude-haiku-4-5     # allow-list; absent or empty = no restriction
 *   store.path = results.jsonl                # absent or empty = store unavailable
 *   openai.api_key = ...                      # else $OPENAI_API_KEY
 *   anthropic.api_key = ...                   # else $ANTHROPIC_API_KEY
 *   google.api_key = ...                      # else $GOOGLE_API_KEY
 *   deepseek.api_key = ...                    # else $DEEPSEEK_API_KEY
 *   groq.api_key = ...                        # else $GROQ_API_KEY
 *   ollama.host = localhost
 *   ollama.port = 11434
 *   agent.temperature = 0.5
 *   agent.max_tokens = 3000
 *   agent.timeout_seconds = 120               # deadline per connect/read/write of one attempt
 */
struct ArenaConfig {
  static ArenaConfig from_config(const util::Config& config);

  std::string ollama_base_url() const;

  std::vector<std::string> models;
  std::string store_path;

  std::string openai_api_key;
  std::string anthropic_api_key;
  std::string google_api_key;
  std::string deepseek_api_key;
  std::string groq_api_key;

  std::string ollama_host = "localhost";
  int ollama_port = 11434;

  double temperature = 0.5;
  int max_tokens = 3000;
  int timeout_seconds = 120;

  std::chrono::seconds timeout() const { return std::chrono::seconds(timeout_seconds); }
};

}  // namespace arena
