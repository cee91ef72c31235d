#pragma once

#include "arena/AgentClient.hpp"
#include "arena/HttpClient.hpp"

#include <boost/json.hpp>

#include <string>

namespace arena {

/*
 * Binding for providers that speak the OpenAI chat-completions wire shape: OpenAI itself, and the
 * OpenAI-compatible endpoints of Gemini, DeepSeek, Groq and a local Ollama server.
 */
class OpenAiClient : public AgentClient {
 public:
  struct Params {
    std::string base_url;  // e.g. "https://api.openai.com/v1"; "/chat/completions" is appended
    std::string api_key;
    std::string reasoning_effort;  // omitted from the request when empty
    bool json_response_format = true;

    // Drops a leading "<think>...</think>" section from the reply (local reasoning models).
    bool strip_think = false;

    HttpClient::duration_t timeout = HttpClient::kDefaultTimeout;  // per connect/read/write step
  };

  OpenAiClient(const std::string& name, const Params& params);

  boost::json::object make_request_body(const std::string& system, const std::string& user) const;

  // Extracts choices[0].message.content. Throws arena::AgentException on an unexpected shape.
  std::string parse_response_body(const std::string& body) const;

  const Params& params() const { return params_; }

 protected:
  std::string send_once(const std::string& system, const std::string& user,
                        int max_tokens) override;

 private:
  const Params params_;
  const Url url_;
};

}  // namespace arena
