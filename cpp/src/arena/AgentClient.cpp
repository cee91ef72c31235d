#include "arena/AgentClient.hpp"

#include "util/LoggingUtil.hpp"

#include <exception>
#include <thread>

namespace arena {

AgentClient::AgentClient(const std::string& name) : name_(name) {}

std::string AgentClient::api_model_name() const { return name_.substr(0, name_.find(' ')); }

std::string AgentClient::send(const std::string& system, const std::string& user,
                              int max_tokens) {
  for (int attempt = 1; attempt <= retry_params_.max_attempts; ++attempt) {
    try {
      return send_once(system, user, max_tokens);
    } catch (const std::exception& e) {
      LOG_ERROR("Exception on calling {} (attempt {}/{}): {}", name_, attempt,
                retry_params_.max_attempts, e.what());
    }
    if (attempt < retry_params_.max_attempts) {
      LOG_WARN("Waiting {}ms and retrying {}", retry_params_.delay.count(), name_);
      waiter_(retry_params_.delay);
    }
  }
  LOG_ERROR("Giving up on {}, replying {}", name_, kEmptyReply);
  return kEmptyReply;
}

void AgentClient::default_waiter(std::chrono::milliseconds delay) {
  std::this_thread::sleep_for(delay);
}

}  // namespace arena
