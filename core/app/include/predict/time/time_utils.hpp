#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace predict {
namespace time_utils {

// -----------------------------------------------------------------------------
// UTC calendar helpers
// -----------------------------------------------------------------------------
//
// @brief  Conversions between epoch milliseconds and the two text forms the
//         engine persists: the day key "YYYY-MM-DD" (journal file names,
//         daily P&L rollover, equity samples) and ISO-8601 timestamps
//         (snapshot files, journal records).
//
// @details
// Everything is UTC and proleptic Gregorian. No locale, no TZ database and
// no gmtime_r, so results are identical on every host. Pre-1970 inputs are
// handled (negative milliseconds floor toward the earlier day).
// -----------------------------------------------------------------------------

constexpr std::int64_t kMsPerSecond = 1000;
constexpr std::int64_t kMsPerMinute = 60 * kMsPerSecond;
constexpr std::int64_t kMsPerHour = 60 * kMsPerMinute;
constexpr std::int64_t kMsPerDay = 24 * kMsPerHour;

// Days since 1970-01-01 for a civil date.
std::int64_t daysFromCivil(int year, unsigned month, unsigned day);

// Midnight UTC of the day containing ms.
std::int64_t startOfDay(std::int64_t ms);

// "YYYY-MM-DD" of the UTC day containing ms.
std::string dayKey(std::int64_t ms);

// -------------------------------------------------------------------------
// parseDayKey
// -------------------------------------------------------------------------
// @return Epoch ms of midnight UTC, or std::nullopt when the text is not a
//         valid "YYYY-MM-DD" date (month 1-12, day within the month).
// -------------------------------------------------------------------------
std::optional<std::int64_t> parseDayKey(std::string_view key);

// "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string isoTimestamp(std::int64_t ms);

// -------------------------------------------------------------------------
// parseIsoTimestamp
// -------------------------------------------------------------------------
// @brief  Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM[:SS[.fff]]" with an
//         optional "Z" or "+HH:MM" / "-HH:MM" offset. A space may stand in
//         for the 'T'. Fractions beyond milliseconds are truncated.
// @return Epoch ms UTC, or std::nullopt on any malformed input.
// -------------------------------------------------------------------------
std::optional<std::int64_t> parseIsoTimestamp(std::string_view text);

}  // namespace time_utils
}  // namespace predict
