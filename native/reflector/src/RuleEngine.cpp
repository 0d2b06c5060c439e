#include "RuleEngine.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>

#include "SystemEventQueue.hpp"
#include "util.hpp"

namespace mdns_reflector
{

  RuleEngine::RuleEngine(std::vector<Rule> rules, const TopologyTable &topology,
                         const DiscoveryWindow &window, std::vector<std::string> discoveryGroups,
                         DiscoveryWindow::Clock::duration windowDuration)
      : rules_(std::move(rules)), topology_(topology), window_(window),
        discoveryGroups_(discoveryGroups.begin(), discoveryGroups.end()),
        windowDuration_(windowDuration)
  {
  }

  bool RuleEngine::isHostname(const std::string &name)
  {
    return endsWith(name, ".local.") && name.find('_') == std::string::npos;
  }

  bool RuleEngine::isReverseLookup(const std::string &name)
  {
    return endsWith(name, ".in-addr.arpa.") || endsWith(name, ".ip6.arpa.");
  }

  bool RuleEngine::serviceAllowed(const Filter &filter, const std::vector<std::string> &questionNames)
  {
    if (filter.allowedServices.empty())
      return true;

    for (const auto &name : questionNames)
    {
      for (const auto &service : filter.allowedServices)
      {
        if (name.find(service) != std::string::npos)
          return true;
      }
      if (isHostname(name) || isReverseLookup(name))
        return true;
    }
    return false;
  }

  bool RuleEngine::sourceAllowed(const Filter &filter, const std::string &sourceIp)
  {
    if (filter.allowedIps.empty())
      return true;
    return std::find(filter.allowedIps.begin(), filter.allowedIps.end(), sourceIp) !=
           filter.allowedIps.end();
  }

  bool RuleEngine::typeAllowed(const Rule &rule, const ClassifiedMessage &message) const
  {
    if (rule.types.empty())
      return true;
    return std::find(rule.types.begin(), rule.types.end(), message.typeName()) != rule.types.end();
  }

  std::vector<RuleEngine::Destination> RuleEngine::evaluate(const std::string &sourceInterface,
                                                            const ClassifiedMessage &message,
                                                            const std::string &sourceIp,
                                                            DiscoveryWindow::Clock::time_point now) const
  {
    std::vector<Destination> selected;
    const std::string *sourceGroup = topology_.groupOf(sourceInterface);
    if (sourceGroup == nullptr)
      return selected;

    std::unordered_set<std::string> chosen;
    for (const auto &rule : rules_)
    {
      if (rule.from != *sourceGroup)
        continue;
      if (!typeAllowed(rule, message))
        continue;
      if (!sourceAllowed(rule.filter, sourceIp))
        continue;
      if (!message.isResponse && !serviceAllowed(rule.filter, message.questionNames))
        continue;

      for (const auto &destGroup : rule.to)
      {
        for (const auto &destInterface : topology_.interfacesIn(destGroup))
        {
          if (destInterface == sourceInterface || chosen.count(destInterface))
            continue;

          // Answers only go back to client segments that asked recently.
          if (message.isResponse && discoveryGroups_.count(destGroup) &&
              !window_.isOpen(destInterface, now, windowDuration_))
            continue;

          chosen.insert(destInterface);
          selected.push_back(Destination{destInterface, destGroup});

          if (SystemEventQueue::enabled(LogLevel::Info))
          {
            std::stringstream ss;
            ss << "Reflecting " << (message.isResponse ? "Response" : "Query") << " from "
               << sourceIp << " (" << sourceInterface << ") to " << destInterface << " ("
               << destGroup << ") - " << message.summary();
            SystemEventQueue::push("relay", ss.str());
          }
        }
      }
    }
    return selected;
  }

} // namespace mdns_reflector
