#pragma once

#include "arena/AgentClient.hpp"
#include "arena/ArenaConfig.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace arena {

/*
 * Table mapping agent identifiers to provider bindings, plus an optional allow-list restricting
 * which identifiers are offered.
 *
 * AgentRegistry registry = AgentRegistry::make_default(config);
 * AgentClient_sptr client = registry.create("gpt-5-mini");
 */
class AgentRegistry {
 public:
  using factory_t = std::function<AgentClient_sptr(const std::string& name)>;

  // An empty registry. allow_list may be empty, meaning no restriction.
  explicit AgentRegistry(const std::vector<std::string>& allow_list = {});

  // The built-in provider table, with config.models as allow-list.
  static AgentRegistry make_default(const ArenaConfig& config);

  // Registers name. Throws util::Exception if name is already registered.
  void add(const std::string& name, factory_t factory);

  void set_allow_list(const std::vector<std::string>& allow_list) { allow_list_ = allow_list; }

  // Every registered name, in registration order
  std::vector<std::string> all_supported_names() const;

  // The allow-list restricted to registered names (allow-list order) if an allow-list is set,
  // else all_supported_names()
  std::vector<std::string> all_names() const;

  bool is_supported(const std::string& name) const;
  bool is_offered(const std::string& name) const;

  // Throws arena::UnsupportedAgentException if name is not offered
  AgentClient_sptr create(const std::string& name) const;

 private:
  using entry_t = std::pair<std::string, factory_t>;

  const entry_t* find(const std::string& name) const;

  std::vector<entry_t> entries_;
  std::vector<std::string> allow_list_;
};

}  // namespace arena
