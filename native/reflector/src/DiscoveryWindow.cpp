#include "DiscoveryWindow.hpp"

namespace mdns_reflector
{

  void DiscoveryWindow::recordQuery(const std::string &interfaceName, Clock::time_point now)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    lastQuery_[interfaceName] = now;
  }

  bool DiscoveryWindow::isOpen(const std::string &interfaceName, Clock::time_point now,
                               Clock::duration window) const
  {
    Clock::time_point lastQuery;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = lastQuery_.find(interfaceName);
      if (it == lastQuery_.end())
        return false;
      lastQuery = it->second;
    }
    return now - lastQuery <= window;
  }

} // namespace mdns_reflector
