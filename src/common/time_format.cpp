#include "common/time_format.hpp"
#include <spdlog/fmt/fmt.h>
#include <charconv>
#include <ctime>

namespace beacon {

using namespace std::chrono;

std::string format_rfc3339(system_clock::time_point tp) {
    auto secs = time_point_cast<seconds>(tp);
    if (secs > tp) secs -= seconds(1);
    auto millis = duration_cast<milliseconds>(tp - secs).count();

    std::time_t t = system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return fmt::format("{}.{:03}Z", buf, millis);
}

static bool read_int(std::string_view s, std::size_t pos, std::size_t len, int& out) {
    if (pos + len > s.size()) return false;
    const char* first = s.data() + pos;
    const char* last = first + len;
    if (*first == '-' || *first == '+') return false;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

std::optional<system_clock::time_point> parse_rfc3339(std::string_view s) {
    int year, month, day, hour, minute, second;
    if (!read_int(s, 0, 4, year) || s.size() < 19 || s[4] != '-' ||
        !read_int(s, 5, 2, month) || s[7] != '-' ||
        !read_int(s, 8, 2, day) ||
        (s[10] != 'T' && s[10] != 't' && s[10] != ' ') ||
        !read_int(s, 11, 2, hour) || s[13] != ':' ||
        !read_int(s, 14, 2, minute) || s[16] != ':' ||
        !read_int(s, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    int64_t nanos = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        int kept = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (kept < 9) {
                nanos = nanos * 10 + (s[pos] - '0');
                ++kept;
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; kept < 9; ++kept) nanos *= 10;
    }

    if (pos >= s.size()) return std::nullopt;

    int offset_minutes = 0;
    if (s[pos] == 'Z' || s[pos] == 'z') {
        ++pos;
    } else if (s[pos] == '+' || s[pos] == '-') {
        int sign = s[pos] == '-' ? -1 : 1;
        int oh, om;
        if (!read_int(s, pos + 1, 2, oh) || pos + 3 >= s.size() || s[pos + 3] != ':' ||
            !read_int(s, pos + 4, 2, om) || oh > 23 || om > 59) {
            return std::nullopt;
        }
        offset_minutes = sign * (oh * 60 + om);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t t = timegm(&tm);

    return system_clock::from_time_t(t)
        - minutes(offset_minutes)
        + duration_cast<system_clock::duration>(nanoseconds(nanos));
}

} // namespace beacon
