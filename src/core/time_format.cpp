#include <strata/core/time_format.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <format>

namespace strata {

namespace {

// Reads exactly `width` decimal digits at `pos`, advancing it. Signs are rejected.
bool readDigits(std::string_view s, size_t& pos, size_t width, int& out) {
    if (pos + width > s.size()) {
        return false;
    }
    const char* first = s.data() + pos;
    const char* last = first + width;
    if (!std::all_of(first, last, [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) {
        return false;
    }
    pos += width;
    return true;
}

bool expect(std::string_view s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

} // namespace

std::optional<Timestamp> TimeFormat::parseISO8601(std::string_view isoStr) {
    using namespace std::chrono;

    size_t pos = 0;
    int year = 0, month = 0, day = 0;
    if (!readDigits(isoStr, pos, 4, year) || !expect(isoStr, pos, '-') ||
        !readDigits(isoStr, pos, 2, month) || !expect(isoStr, pos, '-') ||
        !readDigits(isoStr, pos, 2, day)) {
        return std::nullopt;
    }

    year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                       std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    milliseconds timeOfDay{0};
    if (pos < isoStr.size()) {
        if (isoStr[pos] != 'T' && isoStr[pos] != 't' && isoStr[pos] != ' ') {
            return std::nullopt;
        }
        ++pos;

        int hour = 0, minute = 0, second = 0;
        if (!readDigits(isoStr, pos, 2, hour) || !expect(isoStr, pos, ':') ||
            !readDigits(isoStr, pos, 2, minute)) {
            return std::nullopt;
        }
        if (pos < isoStr.size() && isoStr[pos] == ':') {
            ++pos;
            if (!readDigits(isoStr, pos, 2, second)) {
                return std::nullopt;
            }
        }
        if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) {
            return std::nullopt;
        }

        int millis = 0;
        if (pos < isoStr.size() && isoStr[pos] == '.') {
            ++pos;
            size_t digits = 0;
            while (pos < isoStr.size() && isoStr[pos] >= '0' && isoStr[pos] <= '9') {
                // Sub-millisecond digits are truncated
                if (digits < 3) {
                    millis = millis * 10 + (isoStr[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            if (digits == 0) {
                return std::nullopt;
            }
            for (size_t i = digits; i < 3; ++i) {
                millis *= 10;
            }
        }
        timeOfDay = hours{hour} + minutes{minute} + seconds{second} + milliseconds{millis};

        if (pos < isoStr.size()) {
            char tz = isoStr[pos];
            if (tz == 'Z' || tz == 'z') {
                ++pos;
            } else if (tz == '+' || tz == '-') {
                ++pos;
                int offHours = 0, offMinutes = 0;
                if (!readDigits(isoStr, pos, 2, offHours)) {
                    return std::nullopt;
                }
                if (pos < isoStr.size() && isoStr[pos] == ':') {
                    ++pos;
                }
                if (pos < isoStr.size() && !readDigits(isoStr, pos, 2, offMinutes)) {
                    return std::nullopt;
                }
                if (offHours < 0 || offHours > 23 || offMinutes < 0 || offMinutes > 59) {
                    return std::nullopt;
                }
                auto offset = hours{offHours} + minutes{offMinutes};
                timeOfDay += tz == '+' ? -offset : offset;
            } else {
                return std::nullopt;
            }
        }
    }

    if (pos != isoStr.size()) {
        return std::nullopt;
    }

    return Timestamp{sys_days{ymd}.time_since_epoch() + timeOfDay};
}

std::string TimeFormat::formatISO8601(Timestamp tp) {
    using namespace std::chrono;

    auto dayPoint = floor<days>(tp);
    year_month_day ymd{dayPoint};
    hh_mm_ss<milliseconds> tod{tp - dayPoint};

    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       tod.hours().count(), tod.minutes().count(), tod.seconds().count(),
                       tod.subseconds().count());
}

Timestamp TimeFormat::now() {
    return std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

} // namespace strata
