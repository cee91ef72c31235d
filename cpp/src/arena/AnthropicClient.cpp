#include "arena/AnthropicClient.hpp"

#include "arena/Exceptions.hpp"

namespace arena {

AnthropicClient::AnthropicClient(const std::string& name, const Params& params)
    : AgentClient(name), params_(params), url_(Url::parse(params.base_url)) {}

boost::json::object AnthropicClient::make_request_body(const std::string& system,
                                                       const std::string& user,
                                                       int max_tokens) const {
  boost::json::array messages;
  messages.push_back(boost::json::object{{"role", "user"}, {"content", user}});

  boost::json::object body;
  body["model"] = api_model_name();
  body["max_tokens"] = max_tokens;
  body["temperature"] = params_.temperature;
  body["system"] = system;
  body["messages"] = std::move(messages);
  return body;
}

std::string AnthropicClient::parse_response_body(const std::string& body) const {
  boost::system::error_code ec;
  boost::json::value response = boost::json::parse(body, ec);
  if (ec) {
    throw AgentException("{} returned unparsable json: {}", name(), ec.message());
  }

  try {
    const auto& block = response.as_object().at("content").as_array().at(0);
    return std::string(block.as_object().at("text").as_string());
  } catch (const std::exception& e) {
    throw AgentException("{} returned no content[0].text ({})", name(), e.what());
  }
}

std::string AnthropicClient::send_once(const std::string& system, const std::string& user,
                                       int max_tokens) {
  HttpClient::header_list_t headers{{"x-api-key", params_.api_key},
                                    {"anthropic-version", kApiVersion}};
  std::string request = boost::json::serialize(make_request_body(system, user, max_tokens));
  HttpResponse response =
    HttpClient::post_json(url_, "/messages", headers, request, params_.timeout);
  if (!response.ok()) {
    throw AgentException("{} returned HTTP {}: {}", name(), response.status, response.body);
  }
  return parse_response_body(response.body);
}

}  // namespace arena
