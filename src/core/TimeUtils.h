#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace core::time {

// Parses YYYY-MM-DDTHH:MM:SS[.fraction][Z|+HH:MM|-HH:MM] into UTC epoch milliseconds.
// A timestamp without a zone designator is taken as UTC. Sub-millisecond digits are truncated.
std::optional<std::int64_t> parseIso8601Ms(std::string_view text);

// YYYY-MM-DDTHH:MM:SS.mmmZ
std::string formatIso8601Ms(std::int64_t epochMs);

std::int64_t nowMs();

struct CivilDate {
    int year = 1970;
    int month = 1;
    int day = 1;
};

CivilDate utcDate(std::int64_t epochMs);

// "1h 5m", "3m 12s", "45s"
std::string formatDuration(std::int64_t ms);

}  // namespace core::time
