#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace arena {

/*
 * Abstraction over a remote decision-making service (a language model behind some provider API).
 *
 * send() is the only entry point used by the game. It makes up to RetryParams::max_attempts calls
 * to send_once(), waiting RetryParams::delay between consecutive attempts, and returns kEmptyReply
 * if every attempt failed. It never throws for provider failures.
 *
 * Subclasses implement send_once(), which makes exactly one attempt and throws on failure
 * (typically arena::AgentException).
 */
class AgentClient {
 public:
  struct RetryParams {
    int max_attempts = 3;
    std::chrono::milliseconds delay = std::chrono::seconds(2);
  };

  using waiter_t = std::function<void(std::chrono::milliseconds)>;

  static constexpr const char* kEmptyReply = "{}";

  AgentClient(const std::string& name);
  virtual ~AgentClient() = default;

  // The identifier this client was created under, e.g. "llama3.2 local"
  const std::string& name() const { return name_; }

  // The provider-facing model id: name() up to the first space, e.g. "llama3.2"
  std::string api_model_name() const;

  std::string send(const std::string& system, const std::string& user, int max_tokens);

  void set_retry_params(const RetryParams& params) { retry_params_ = params; }
  const RetryParams& retry_params() const { return retry_params_; }

  // Replaces the function used to wait between attempts (default: sleep on the calling thread)
  void set_waiter(waiter_t waiter) { waiter_ = std::move(waiter); }

 protected:
  virtual std::string send_once(const std::string& system, const std::string& user,
                                int max_tokens) = 0;

 private:
  static void default_waiter(std::chrono::milliseconds delay);

  const std::string name_;
  RetryParams retry_params_;
  waiter_t waiter_ = default_waiter;
};

using AgentClient_sptr = std::shared_ptr<AgentClient>;

}  // namespace arena
