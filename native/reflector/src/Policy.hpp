#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "SystemEventQueue.hpp"

namespace mdns_reflector
{

  using json = nlohmann::json;

  struct InterfaceConfig
  {
    std::string name;
    std::string group;
  };

  struct Filter
  {
    std::vector<std::string> allowedIps;      ///< exact printed source addresses
    std::vector<std::string> allowedServices; ///< substrings of question names
  };

  struct Rule
  {
    std::string from;
    std::vector<std::string> to;
    std::vector<std::string> types; ///< "query" and/or "response"; empty = both
    Filter filter;
  };

  /**
   * @brief In-memory form of the policy file.
   *
   * Example:
   * @code
   * {
   *   "log_level": "info",
   *   "discovery_groups": ["users"],
   *   "interfaces": [{"name": "vlan.10", "group": "users"},
   *                  {"name": "vlan.19", "group": "gl_iot"}],
   *   "rules": [{"from": "users", "to": ["gl_iot"], "types": ["query"],
   *              "filter": {"allowed_services": ["_airplay._tcp"]}}]
   * }
   * @endcode
   */
  struct Policy
  {
    LogLevel logLevel = LogLevel::Info;
    /// Groups whose interfaces only receive responses inside their discovery window.
    std::vector<std::string> discoveryGroups{"users"};
    std::vector<InterfaceConfig> interfaces;
    std::vector<Rule> rules;
  };

  void from_json(const json &j, InterfaceConfig &iface);
  void from_json(const json &j, Filter &filter);
  void from_json(const json &j, Rule &rule);
  void from_json(const json &j, Policy &policy);

  /// Returns an empty string if the policy is valid, otherwise the first problem found.
  std::string validatePolicy(const Policy &policy);

  /// Converts and validates a parsed document. Returns "" on success.
  std::string parsePolicy(const json &j, Policy &policy);

  /// Reads, parses and validates a policy file. Returns "" on success.
  std::string loadPolicy(const std::string &path, Policy &policy);

} // namespace mdns_reflector
