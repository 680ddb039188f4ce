#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace domainflow::util {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Formats time point to ISO 8601 (YYYY-MM-DDTHH:MM:SSZ)
[[nodiscard]] inline auto format_iso8601(TimePoint tp) -> std::string {
  if (tp == TimePoint{})
    return {};
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

[[nodiscard]] inline auto to_unix_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_unix_millis(std::int64_t millis) -> TimePoint {
  if (millis <= 0) {
    return {};
  }
  return TimePoint{std::chrono::milliseconds{millis}};
}

} // namespace domainflow::util
