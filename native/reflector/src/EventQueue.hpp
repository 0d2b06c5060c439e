#pragma once
#include <deque>
#include <mutex>
#include <vector>

namespace mdns_reflector
{

  /**
   * @brief Bounded, thread-safe history of events.
   *
   * The oldest entries are discarded once the queue holds more than
   * maxQueueSize events.
   */
  template <typename T>
  class EventQueue
  {
  public:
    explicit EventQueue(size_t maxQueueSize) : maxQueueSize_(maxQueueSize) {}

    void addEvent(const T &event)
    {
      std::lock_guard<std::recursive_mutex> lock(mutex_);
      eventQueue.push_back(event);

      while (eventQueue.size() > maxQueueSize_)
      {
        eventQueue.pop_front();
      }
    }

    std::vector<T> snapshot() const
    {
      std::lock_guard<std::recursive_mutex> lock(mutex_);
      return std::vector<T>(eventQueue.begin(), eventQueue.end());
    }

    void clear()
    {
      std::lock_guard<std::recursive_mutex> lock(mutex_);
      eventQueue.clear();
    }

  protected:
    std::deque<T> eventQueue;
    mutable std::recursive_mutex mutex_;
    size_t maxQueueSize_;
  };

} // namespace mdns_reflector
