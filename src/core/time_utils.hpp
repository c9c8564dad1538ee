#ifndef SWEVAL_CORE_TIME_UTILS_HPP_
#define SWEVAL_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace sweval::core {

// Canonical UTC timestamp formatter used by score artifacts and summaries.
// Millisecond precision keeps artifacts readable across repeated runs.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
  if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// "83.512s" style rendering for build and evaluation log lines.
inline std::string FormatElapsed(std::chrono::steady_clock::duration elapsed) {
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
  std::ostringstream out;
  out << millis / 1000 << '.' << std::setw(3) << std::setfill('0') << millis % 1000 << 's';
  return out.str();
}

} // namespace sweval::core

#endif // SWEVAL_CORE_TIME_UTILS_HPP_
