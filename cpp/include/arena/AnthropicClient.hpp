#pragma once

#include "arena/AgentClient.hpp"
#include "arena/HttpClient.hpp"

#include <boost/json.hpp>

#include <string>

namespace arena {

// Binding for the Anthropic messages API.
class AnthropicClient : public AgentClient {
 public:
  static constexpr const char* kDefaultBaseUrl = "https://api.anthropic.com/v1";
  static constexpr const char* kApiVersion = "2023-06-01";

  struct Params {
    std::string base_url = kDefaultBaseUrl;
    std::string api_key;
    double temperature = 0.5;
    HttpClient::duration_t timeout = HttpClient::kDefaultTimeout;  // per connect/read/write step
  };

  AnthropicClient(const std::string& name, const Params& params);

  boost::json::object make_request_body(const std::string& system, const std::string& user,
                                        int max_tokens) const;

  // Extracts content[0].text. Throws arena::AgentException on an unexpected shape.
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
