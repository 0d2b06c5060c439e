#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "EventQueue.hpp"

namespace mdns_reflector
{

  enum class LogLevel
  {
    Debug = 0,
    Info,
    Warn,
    Error
  };

  /// Parses "debug", "info", "warn" or "error". Returns false for anything else.
  bool parseLogLevel(const std::string &name, LogLevel &level);
  const char *logLevelName(LogLevel level);

  struct SystemEvent
  {
    const int64_t tsMilli;
    const LogLevel level;
    const std::string subsystem;
    const std::string message;
    SystemEvent(int64_t tsMilli, LogLevel level, std::string subsystem, std::string message)
        : tsMilli(tsMilli), level(level), subsystem(std::move(subsystem)), message(std::move(message)) {}
  };

  /**
   * @brief Process-wide event log.
   *
   * Every event at or above the configured level is printed (stdout for
   * debug/info, stderr for warn/error) and kept in a bounded history of the
   * last 200 events.
   */
  class SystemEventQueue : public EventQueue<std::shared_ptr<SystemEvent>>
  {
  public:
    SystemEventQueue() : EventQueue(200) {}
    static SystemEventQueue &instance();

    static void setLevel(LogLevel level);
    static LogLevel level();
    static bool enabled(LogLevel level) { return level >= SystemEventQueue::level(); }

    /// When false, events are recorded but not printed.
    static void setConsoleOutput(bool enable);

    static void push(const std::string &subsystem, const std::string &message)
    {
      push(LogLevel::Info, subsystem, message);
    }
    static void push(LogLevel level, const std::string &subsystem, const std::string &message);

    static void debug(const std::string &subsystem, const std::string &message)
    {
      push(LogLevel::Debug, subsystem, message);
    }
    static void warn(const std::string &subsystem, const std::string &message)
    {
      push(LogLevel::Warn, subsystem, message);
    }
    static void error(const std::string &subsystem, const std::string &message)
    {
      push(LogLevel::Error, subsystem, message);
    }

    static std::vector<std::shared_ptr<SystemEvent>> getEventList()
    {
      return instance().snapshot();
    }

    static void clearEvents() { instance().clear(); }

  private:
    std::atomic<LogLevel> minLevel_{LogLevel::Info};
    std::atomic<bool> console_{true};
  };

} // namespace mdns_reflector
