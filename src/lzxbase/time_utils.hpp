#pragma once

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace lzx::util {

// seconds since the epoch as "YYYY-MM-DD HH:MM:SS UTC"; the raw number when out of range
inline std::string format_utc_seconds(int64_t seconds) {
  auto time = static_cast<std::time_t>(seconds);
  const std::tm* tm_value = std::gmtime(&time);
  if (tm_value == nullptr) {
    return std::to_string(seconds);
  }

  std::stringstream ss;
  ss << std::put_time(tm_value, "%Y-%m-%d %H:%M:%S") << " UTC";
  return ss.str();
}

} // namespace lzx::util
