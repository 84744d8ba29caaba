#pragma once

/// @file time_util.h
/// @brief Timestamp and calendar-day helpers (all calendar math is UTC)

#include <chrono>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <absl/time/civil_time.h>

namespace runlens {

using Timestamp = std::chrono::system_clock::time_point;

/// @brief UTC calendar day containing the timestamp
absl::CivilDay ToCivilDay(Timestamp ts);

/// @brief First instant of the UTC day
Timestamp StartOfDay(absl::CivilDay day);

/// @brief Last representable second of the UTC day (23:59:59)
Timestamp EndOfDay(absl::CivilDay day);

/// @brief RFC 3339 rendering, e.g. "2026-03-01T10:15:00Z"
std::string FormatTimestamp(Timestamp ts);

/// @brief Parse RFC 3339 ("2026-03-01T10:15:00Z", offsets and fractions allowed)
absl::StatusOr<Timestamp> ParseTimestamp(std::string_view text);

/// @brief "YYYY-MM-DD"
std::string FormatDay(absl::CivilDay day);

/// @brief Parse "YYYY-MM-DD"
absl::StatusOr<absl::CivilDay> ParseDay(std::string_view text);

/// @brief Seconds between two timestamps as a double
inline double SecondsBetween(Timestamp from, Timestamp to) {
    return std::chrono::duration<double>(to - from).count();
}

}  // namespace runlens
