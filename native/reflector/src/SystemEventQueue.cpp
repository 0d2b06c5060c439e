#include "SystemEventQueue.hpp"

#include <iostream>
#include <mutex>

#include "util.hpp"

namespace mdns_reflector
{

  bool parseLogLevel(const std::string &name, LogLevel &level)
  {
    if (name == "debug")
      level = LogLevel::Debug;
    else if (name == "info")
      level = LogLevel::Info;
    else if (name == "warn")
      level = LogLevel::Warn;
    else if (name == "error")
      level = LogLevel::Error;
    else
      return false;
    return true;
  }

  const char *logLevelName(LogLevel level)
  {
    switch (level)
    {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    }
    return "?";
  }

  SystemEventQueue &SystemEventQueue::instance()
  {
    static SystemEventQueue singleton;
    return singleton;
  }

  void SystemEventQueue::setLevel(LogLevel level) { instance().minLevel_ = level; }

  LogLevel SystemEventQueue::level() { return instance().minLevel_; }

  void SystemEventQueue::setConsoleOutput(bool enable) { instance().console_ = enable; }

  void SystemEventQueue::push(LogLevel level, const std::string &subsystem,
                              const std::string &message)
  {
    if (!enabled(level))
      return;

    const auto now = currentTimeMillis();
    auto &queue = instance();
    if (queue.console_)
    {
      // Serialize console writes from the reader thread and the host thread.
      std::lock_guard<std::recursive_mutex> lock(queue.mutex_);
      auto &os = level >= LogLevel::Warn ? std::cerr : std::cout;
      os << "[" << formatTimestamp(now) << "] " << logLevelName(level) << " "
         << subsystem << ": " << message << std::endl;
    }
    queue.addEvent(std::make_shared<SystemEvent>(now, level, subsystem, message));
  }

} // namespace mdns_reflector
