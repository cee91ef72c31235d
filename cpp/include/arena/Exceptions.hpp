#pragma once

#include "util/Exception.hpp"

namespace arena {

// A single attempt to reach an agent failed (transport error, provider error, bad response
// shape). AgentClient::send() retries these.
class AgentException : public util::Exception {
 public:
  using util::Exception::Exception;
};

// An agent reply that does not name a legal column. Never escapes Player::move(), which turns it
// into a forfeit.
class MalformedReplyException : public util::Exception {
 public:
  using util::Exception::Exception;
};

class UnsupportedAgentException : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

}  // namespace arena
