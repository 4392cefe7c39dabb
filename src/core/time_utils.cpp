#include "time_utils.hpp"
#include <fmt/format.h>
#include <ctime>
#include <cstdio>

std::optional<TimePoint> parse_timestamp(const std::string& text) {
    struct tm tm_buf = {};
    char sep = ' ';
    int n = std::sscanf(text.c_str(), "%d-%d-%d%c%d:%d:%d",
                        &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday, &sep,
                        &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec);
    if (n < 6 || (sep != ' ' && sep != 'T')) {
        return std::nullopt;
    }
    if (n == 6) tm_buf.tm_sec = 0;
    if (tm_buf.tm_mon < 1 || tm_buf.tm_mon > 12 || tm_buf.tm_mday < 1 || tm_buf.tm_mday > 31 ||
        tm_buf.tm_hour > 23 || tm_buf.tm_min > 59 || tm_buf.tm_sec > 60) {
        return std::nullopt;
    }
    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;
    std::time_t t = timegm(&tm_buf);
    return std::chrono::system_clock::from_time_t(t);
}

std::string format_timestamp(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string format_duration(std::chrono::seconds d) {
    long long seconds = d.count();
    if (seconds < 0) seconds = -seconds;
    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}
