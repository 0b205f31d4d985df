#ifndef AGENTWATCH_CORE_TIME_UTILS_HPP_
#define AGENTWATCH_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace agentwatch::core {

// Record timestamps are epoch seconds with sub-second precision. This keeps the
// persisted columns sortable as plain REAL values.
inline double NowEpochSeconds() {
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  return static_cast<double>(micros) / 1'000'000.0;
}

inline std::chrono::system_clock::time_point FromEpochSeconds(const double epoch_seconds) {
  const auto micros = static_cast<std::int64_t>(std::llround(epoch_seconds * 1'000'000.0));
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::microseconds(micros)));
}

// Formats a UTC wall-clock time with a caller-provided strftime pattern.
inline std::string FormatUtc(std::chrono::system_clock::time_point timestamp,
                             std::string_view pattern) {
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
  out << std::put_time(&utc_time, std::string(pattern).c_str());
  return out.str();
}

// Canonical UTC timestamp formatter used by logs and CLI listings.
// Millisecond precision keeps traces readable while preserving triage value.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::string seconds_part = FormatUtc(timestamp, "%Y-%m-%dT%H:%M:%S");
  if (seconds_part.empty()) {
    return "";
  }

  std::ostringstream out;
  out << seconds_part << '.' << std::setw(3) << std::setfill('0') << millis_component << 'Z';
  return out.str();
}

inline std::string FormatUtcTimestamp(const double epoch_seconds) {
  return FormatUtcTimestamp(FromEpochSeconds(epoch_seconds));
}

} // namespace agentwatch::core

#endif // AGENTWATCH_CORE_TIME_UTILS_HPP_
