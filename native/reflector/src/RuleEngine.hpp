#pragma once
#include <chrono>
#include <set>
#include <string>
#include <vector>

#include "DiscoveryWindow.hpp"
#include "MessageClassifier.hpp"
#include "Policy.hpp"
#include "TopologyTable.hpp"

namespace mdns_reflector
{

  /**
   * @brief Decides where a classified packet is relayed.
   *
   * Every rule whose `from` group matches the ingress interface is tried in
   * configuration order. Rules do not short-circuit each other, but an
   * interface is selected at most once per packet.
   */
  class RuleEngine
  {
  public:
    struct Destination
    {
      std::string interfaceName;
      std::string group;
    };

    RuleEngine(std::vector<Rule> rules, const TopologyTable &topology,
               const DiscoveryWindow &window, std::vector<std::string> discoveryGroups,
               DiscoveryWindow::Clock::duration windowDuration = DiscoveryWindow::DEFAULT_WINDOW);

    std::vector<Destination> evaluate(const std::string &sourceInterface,
                                      const ClassifiedMessage &message,
                                      const std::string &sourceIp,
                                      DiscoveryWindow::Clock::time_point now) const;

    /// "<label>.local." without any "_" service label.
    static bool isHostname(const std::string &name);
    /// Names under in-addr.arpa. or ip6.arpa.
    static bool isReverseLookup(const std::string &name);
    /// Service gate for queries; an empty allow-list admits everything.
    static bool serviceAllowed(const Filter &filter, const std::vector<std::string> &questionNames);
    /// IP gate; an empty allow-list admits every source.
    static bool sourceAllowed(const Filter &filter, const std::string &sourceIp);

  private:
    bool typeAllowed(const Rule &rule, const ClassifiedMessage &message) const;

    std::vector<Rule> rules_;
    const TopologyTable &topology_;
    const DiscoveryWindow &window_;
    std::set<std::string> discoveryGroups_;
    DiscoveryWindow::Clock::duration windowDuration_;
  };

} // namespace mdns_reflector
