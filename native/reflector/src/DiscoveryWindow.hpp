#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mdns_reflector
{

  /**
   * @brief Remembers when each interface last sent a query.
   *
   * Responses are only relayed into discovery client segments that asked
   * recently, instead of flooding every client segment with every answer.
   * Entries are never removed; an entry is stale once it is older than the
   * window at the time it is read.
   */
  class DiscoveryWindow
  {
  public:
    using Clock = std::chrono::steady_clock;
    static constexpr std::chrono::seconds DEFAULT_WINDOW{60};

    void recordQuery(const std::string &interfaceName, Clock::time_point now);

    /// True iff interfaceName queried and now - lastQuery <= window.
    bool isOpen(const std::string &interfaceName, Clock::time_point now,
                Clock::duration window = DEFAULT_WINDOW) const;

  private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Clock::time_point> lastQuery_;
  };

} // namespace mdns_reflector
