#include "time_util.h"

#include <absl/strings/str_cat.h>
#include <absl/time/time.h>

namespace runlens {

absl::CivilDay ToCivilDay(Timestamp ts) {
    return absl::ToCivilDay(absl::FromChrono(ts), absl::UTCTimeZone());
}

Timestamp StartOfDay(absl::CivilDay day) {
    return absl::ToChronoTime(absl::FromCivil(day, absl::UTCTimeZone()));
}

Timestamp EndOfDay(absl::CivilDay day) {
    return StartOfDay(day + 1) - std::chrono::seconds(1);
}

std::string FormatTimestamp(Timestamp ts) {
    return absl::FormatTime("%Y-%m-%d%ET%H:%M:%E*SZ", absl::FromChrono(ts),
                            absl::UTCTimeZone());
}

absl::StatusOr<Timestamp> ParseTimestamp(std::string_view text) {
    absl::Time parsed;
    std::string error;
    if (!absl::ParseTime(absl::RFC3339_full, text, &parsed, &error)) {
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid timestamp '", text, "': ", error));
    }
    return absl::ToChronoTime(parsed);
}

std::string FormatDay(absl::CivilDay day) {
    return absl::FormatCivilTime(day);
}

absl::StatusOr<absl::CivilDay> ParseDay(std::string_view text) {
    absl::CivilDay day;
    if (!absl::ParseCivilTime(text, &day)) {
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid date '", text, "', expected YYYY-MM-DD"));
    }
    return day;
}

}  // namespace runlens
