#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace mdns_reflector
{

  /// Milliseconds since the epoch for the system clock.
  int64_t currentTimeMillis();

  /// Formats an epoch millisecond timestamp as local "YYYY/MM/DD HH:MM:SS.mmm".
  std::string formatTimestamp(int64_t tsMilli);

  /// Joins items as "[a b c]".
  std::string formatList(const std::vector<std::string> &items);

  bool endsWith(const std::string &s, const std::string &suffix);

} // namespace mdns_reflector
