#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "util.hpp"

namespace mdns_reflector
{

  int64_t currentTimeMillis()
  {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }

  std::string formatTimestamp(int64_t tsMilli)
  {
    std::time_t seconds = static_cast<std::time_t>(tsMilli / 1000);
    std::tm local_time{};
    localtime_r(&seconds, &local_time);

    std::stringstream ss;
    ss << std::setfill('0') << std::setw(4) << (local_time.tm_year + 1900) << "/"
       << std::setw(2) << (local_time.tm_mon + 1) << "/" << std::setw(2)
       << local_time.tm_mday << " " << std::setw(2) << local_time.tm_hour << ":"
       << std::setw(2) << local_time.tm_min << ":" << std::setw(2)
       << local_time.tm_sec << "." << std::setw(3) << (tsMilli % 1000);

    return ss.str();
  }

  std::string formatList(const std::vector<std::string> &items)
  {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i)
    {
      if (i > 0)
        out += " ";
      out += items[i];
    }
    out += "]";
    return out;
  }

  bool endsWith(const std::string &s, const std::string &suffix)
  {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
  }

} // namespace mdns_reflector
