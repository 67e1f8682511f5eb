#include "core/TimeUtils.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace core::time {
namespace {

constexpr std::int64_t kMillisPerSecond = 1000;

#if defined(_WIN32)
std::time_t timegm_compat(std::tm* tm) {
    return _mkgmtime(tm);
}
#else
std::time_t timegm_compat(std::tm* tm) {
    return timegm(tm);
}
#endif

bool readDigits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const unsigned char ch = static_cast<unsigned char>(text[pos + i]);
        if (!std::isdigit(ch)) {
            return false;
        }
        value = value * 10 + (ch - '0');
    }
    out = value;
    return true;
}

}  // namespace

std::optional<std::int64_t> parseIso8601Ms(std::string_view text) {
    // 2024-01-01T00:00:00
    if (text.size() < 19 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!readDigits(text, 0, 4, year) || !readDigits(text, 5, 2, month) || !readDigits(text, 8, 2, day) ||
        !readDigits(text, 11, 2, hour) || !readDigits(text, 14, 2, minute) || !readDigits(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    int millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }

    int offsetMinutes = 0;
    if (pos < text.size()) {
        const char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            int offHour = 0;
            int offMinute = 0;
            if (!readDigits(text, pos + 1, 2, offHour)) {
                return std::nullopt;
            }
            std::size_t minutePos = pos + 3;
            if (minutePos < text.size() && text[minutePos] == ':') {
                ++minutePos;
            }
            if (!readDigits(text, minutePos, 2, offMinute)) {
                return std::nullopt;
            }
            offsetMinutes = offHour * 60 + offMinute;
            if (zone == '-') {
                offsetMinutes = -offsetMinutes;
            }
            pos = minutePos + 2;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = 0;
    const auto raw = timegm_compat(&tm);
    if (raw == static_cast<std::time_t>(-1) && !(year == 1969 && month == 12 && day == 31)) {
        return std::nullopt;
    }

    return static_cast<std::int64_t>(raw) * kMillisPerSecond + millis -
           static_cast<std::int64_t>(offsetMinutes) * 60 * kMillisPerSecond;
}

std::string formatIso8601Ms(std::int64_t epochMs) {
    std::int64_t seconds = epochMs / kMillisPerSecond;
    std::int64_t millis = epochMs % kMillisPerSecond;
    if (millis < 0) {
        millis += kMillisPerSecond;
        --seconds;
    }

    const std::time_t raw = static_cast<std::time_t>(seconds);
    std::tm utcTime{};
#if defined(_WIN32)
    gmtime_s(&utcTime, &raw);
#else
    gmtime_r(&raw, &utcTime);
#endif

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utcTime.tm_year + 1900,
                  utcTime.tm_mon + 1, utcTime.tm_mday, utcTime.tm_hour, utcTime.tm_min, utcTime.tm_sec,
                  static_cast<int>(millis));
    return buffer;
}

std::int64_t nowMs() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

CivilDate utcDate(std::int64_t epochMs) {
    std::int64_t seconds = epochMs / kMillisPerSecond;
    if (epochMs % kMillisPerSecond < 0) {
        --seconds;
    }
    const std::time_t raw = static_cast<std::time_t>(seconds);
    std::tm utcTime{};
#if defined(_WIN32)
    gmtime_s(&utcTime, &raw);
#else
    gmtime_r(&raw, &utcTime);
#endif
    return CivilDate{utcTime.tm_year + 1900, utcTime.tm_mon + 1, utcTime.tm_mday};
}

std::string formatDuration(std::int64_t ms) {
    if (ms < 0) {
        ms = 0;
    }
    const std::int64_t totalSeconds = ms / kMillisPerSecond;
    const std::int64_t hours = totalSeconds / 3600;
    const std::int64_t minutes = (totalSeconds % 3600) / 60;
    const std::int64_t seconds = totalSeconds % 60;

    char buffer[48];
    if (hours > 0) {
        std::snprintf(buffer, sizeof(buffer), "%lldh %lldm", static_cast<long long>(hours),
                      static_cast<long long>(minutes));
    } else if (minutes > 0) {
        std::snprintf(buffer, sizeof(buffer), "%lldm %llds", static_cast<long long>(minutes),
                      static_cast<long long>(seconds));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%llds", static_cast<long long>(seconds));
    }
    return buffer;
}

}  // namespace core::time
