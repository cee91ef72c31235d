#include "arena/OpenAiClient.hpp"

#include "arena/Exceptions.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/algorithm/string/replace.hpp>

namespace arena {

namespace {

boost::json::object message(const char* role, const std::string& content) {
  return boost::json::object{{"role", role}, {"content", content}};
}

}  // namespace

OpenAiClient::OpenAiClient(const std::string& name, const Params& params)
    : AgentClient(name), params_(params), url_(Url::parse(params.base_url)) {}

boost::json::object OpenAiClient::make_request_body(const std::string& system,
                                                    const std::string& user) const {
  boost::json::array messages;
  messages.push_back(message("system", system));
  messages.push_back(message("user", user));

  boost::json::object body;
  body["model"] = api_model_name();
  body["messages"] = std::move(messages);
  if (params_.json_response_format) {
    body["response_format"] = boost::json::object{{"type", "json_object"}};
  }
  if (!params_.reasoning_effort.empty()) {
    body["reasoning_effort"] = params_.reasoning_effort;
  }
  return body;
}

std::string OpenAiClient::parse_response_body(const std::string& body) const {
  boost::system::error_code ec;
  boost::json::value response = boost::json::parse(body, ec);
  if (ec) {
    throw AgentException("{} returned unparsable json: {}", name(), ec.message());
  }

  std::string reply;
  try {
    const auto& choice = response.as_object().at("choices").as_array().at(0);
    reply = choice.as_object().at("message").as_object().at("content").as_string();
  } catch (const std::exception& e) {
    throw AgentException("{} returned no choices[0].message.content ({})", name(), e.what());
  }
  if (!params_.strip_think) return reply;

  constexpr std::string_view kEndThink = "</think>";
  size_t end = reply.find(kEndThink);
  if (end == std::string::npos) return reply;

  std::string thoughts = reply.substr(0, end);
  boost::algorithm::replace_all(thoughts, "<think>", "");
  LOG_INFO("Thoughts of {}:\n{}", name(), thoughts);

  size_t start = end + kEndThink.size();
  size_t next = reply.find(kEndThink, start);
  return reply.substr(start, next == std::string::npos ? std::string::npos : next - start);
}

std::string OpenAiClient::send_once(const std::string& system, const std::string& user,
                                    int max_tokens) {
  // The chat-completions bindings leave the output length to the provider
  (void)max_tokens;

  HttpClient::header_list_t headers{{"Authorization", "Bearer " + params_.api_key}};
  std::string request = boost::json::serialize(make_request_body(system, user));
  HttpResponse response =
    HttpClient::post_json(url_, "/chat/completions", headers, request, params_.timeout);
  if (!response.ok()) {
    throw AgentException("{} returned HTTP {}: {}", name(), response.status, response.body);
  }
  return parse_response_body(response.body);
}

}  // namespace arena
