#include "TopologyTable.hpp"

namespace mdns_reflector
{

  TopologyTable::TopologyTable(const std::vector<InterfaceConfig> &interfaces)
  {
    for (const auto &iface : interfaces)
    {
      // validatePolicy rejects duplicates; keep the first assignment regardless.
      if (!groupByInterface.emplace(iface.name, iface.group).second)
        continue;
      names.push_back(iface.name);
      interfacesByGroup[iface.group].push_back(iface.name);
    }
  }

  const std::string *TopologyTable::groupOf(const std::string &interfaceName) const
  {
    auto it = groupByInterface.find(interfaceName);
    return it == groupByInterface.end() ? nullptr : &it->second;
  }

  const std::vector<std::string> &TopologyTable::interfacesIn(const std::string &group) const
  {
    static const std::vector<std::string> none;
    auto it = interfacesByGroup.find(group);
    return it == interfacesByGroup.end() ? none : it->second;
  }

  void TopologyTable::bindIndex(int index, const std::string &interfaceName)
  {
    byIndex[index] = interfaceName;
  }

  std::string TopologyTable::nameForIndex(int index) const
  {
    auto it = byIndex.find(index);
    return it == byIndex.end() ? std::string() : it->second;
  }

} // namespace mdns_reflector
