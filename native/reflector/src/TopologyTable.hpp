#pragma once
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "Policy.hpp"

namespace mdns_reflector
{

  /**
   * @brief Interface ⇄ group mapping built once from the validated policy.
   *
   * The index map is filled by the listener while it joins the multicast
   * group, before the read loop starts, and is read-only afterwards.
   */
  class TopologyTable
  {
  public:
    explicit TopologyTable(const std::vector<InterfaceConfig> &interfaces);

    /// Group of an interface, or nullptr if the interface is not configured.
    const std::string *groupOf(const std::string &interfaceName) const;

    /// Interfaces of a group in configuration order; empty for unknown groups.
    const std::vector<std::string> &interfacesIn(const std::string &group) const;

    /// All configured interface names in configuration order.
    const std::vector<std::string> &interfaceNames() const { return names; }

    void bindIndex(int index, const std::string &interfaceName);
    void clearIndexes() { byIndex.clear(); }

    /// Interface name for an OS index, or "" if the index was never bound.
    std::string nameForIndex(int index) const;

    size_t size() const { return names.size(); }

  private:
    std::vector<std::string> names;
    std::unordered_map<std::string, std::string> groupByInterface;
    std::map<std::string, std::vector<std::string>> interfacesByGroup;
    std::unordered_map<int, std::string> byIndex;
  };

} // namespace mdns_reflector
