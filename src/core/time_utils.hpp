#ifndef HWBRIDGE_CORE_TIME_UTILS_HPP_
#define HWBRIDGE_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace hwbridge::core {

// Canonical UTC timestamp formatter used by logs and every wire timestamp.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Queue rows persist epoch milliseconds; these keep the conversions in one place.
inline std::int64_t ToEpochMillis(std::chrono::system_clock::time_point timestamp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch())
      .count();
}

inline std::chrono::system_clock::time_point FromEpochMillis(std::int64_t millis) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

inline std::string FormatUtcTimestampMillis(std::int64_t millis) {
  return FormatUtcTimestamp(FromEpochMillis(millis));
}

inline std::string NowUtcTimestamp() {
  return FormatUtcTimestamp(std::chrono::system_clock::now());
}

} // namespace hwbridge::core

#endif // HWBRIDGE_CORE_TIME_UTILS_HPP_
