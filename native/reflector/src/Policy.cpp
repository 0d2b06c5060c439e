#include "Policy.hpp"

#include <arpa/inet.h>
#include <fstream>
#include <set>

namespace mdns_reflector
{

  namespace
  {
    template <typename T>
    void optionalField(const json &j, const char *key, T &out)
    {
      auto it = j.find(key);
      if (it != j.end() && !it->is_null())
        it->get_to(out);
    }

    bool isIpAddress(const std::string &text)
    {
      in_addr v4{};
      in6_addr v6{};
      return inet_pton(AF_INET, text.c_str(), &v4) == 1 ||
             inet_pton(AF_INET6, text.c_str(), &v6) == 1;
    }
  } // namespace

  void from_json(const json &j, InterfaceConfig &iface)
  {
    j.at("name").get_to(iface.name);
    j.at("group").get_to(iface.group);
  }

  void from_json(const json &j, Filter &filter)
  {
    optionalField(j, "allowed_ips", filter.allowedIps);
    optionalField(j, "allowed_services", filter.allowedServices);
  }

  void from_json(const json &j, Rule &rule)
  {
    j.at("from").get_to(rule.from);
    j.at("to").get_to(rule.to);
    optionalField(j, "types", rule.types);
    optionalField(j, "filter", rule.filter);
  }

  void from_json(const json &j, Policy &policy)
  {
    optionalField(j, "discovery_groups", policy.discoveryGroups);
    optionalField(j, "interfaces", policy.interfaces);
    optionalField(j, "rules", policy.rules);
  }

  std::string validatePolicy(const Policy &policy)
  {
    std::set<std::string> seen;
    for (size_t i = 0; i < policy.interfaces.size(); ++i)
    {
      const auto &iface = policy.interfaces[i];
      const auto where = "interfaces[" + std::to_string(i) + "]";
      if (iface.name.empty())
        return where + ": name is required";
      if (iface.group.empty())
        return where + ": group is required";
      if (!seen.insert(iface.name).second)
        return where + ": interface " + iface.name + " is assigned to more than one group";
    }

    for (size_t i = 0; i < policy.rules.size(); ++i)
    {
      const auto &rule = policy.rules[i];
      const auto where = "rules[" + std::to_string(i) + "]";
      if (rule.from.empty())
        return where + ": from is required";
      if (rule.to.empty())
        return where + ": to is required";
      for (const auto &group : rule.to)
      {
        if (group.empty())
          return where + ": to contains an empty group";
      }
      for (const auto &type : rule.types)
      {
        if (type != "query" && type != "response")
          return where + ": unknown type '" + type + "'";
      }
      for (const auto &ip : rule.filter.allowedIps)
      {
        if (!isIpAddress(ip))
          return where + ": allowed_ips entry '" + ip + "' is not an IP address";
      }
    }

    for (const auto &group : policy.discoveryGroups)
    {
      if (group.empty())
        return "discovery_groups contains an empty group";
    }
    return "";
  }

  std::string parsePolicy(const json &j, Policy &policy)
  {
    if (!j.is_object())
      return "policy must be a JSON object";

    Policy parsed;
    try
    {
      j.get_to(parsed);
      const auto level = j.value<std::string>("log_level", "info");
      if (!parseLogLevel(level, parsed.logLevel))
        return "log_level '" + level + "' is not one of debug, info, warn, error";
    }
    catch (json::exception &e)
    {
      return std::string("invalid policy: ") + e.what();
    }

    auto error = validatePolicy(parsed);
    if (!error.empty())
      return error;

    policy = std::move(parsed);
    return "";
  }

  std::string loadPolicy(const std::string &path, Policy &policy)
  {
    std::ifstream in(path);
    if (!in)
      return "cannot open policy file " + path;

    json j;
    try
    {
      j = json::parse(in);
    }
    catch (json::parse_error &e)
    {
      return path + ": " + e.what();
    }
    return parsePolicy(j, policy);
  }

} // namespace mdns_reflector
