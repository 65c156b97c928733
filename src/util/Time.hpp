#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace meshirc::util {

using WallClock = std::chrono::system_clock;

inline std::string format_local(WallClock::time_point tp, const char* fmt = "%Y-%m-%d %H:%M:%S") {
    const std::time_t t = WallClock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream os;
    os << std::put_time(&local, fmt);
    return os.str();
}

inline std::string format_utc(WallClock::time_point tp, const char* fmt) {
    const std::time_t t = WallClock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    std::ostringstream os;
    os << std::put_time(&utc, fmt);
    return os.str();
}

inline WallClock::time_point from_epoch_seconds(std::int64_t secs) {
    return WallClock::time_point(std::chrono::seconds(secs));
}

// "H:MM:SS", or "N day(s), H:MM:SS" past a day.
inline std::string format_uptime(std::chrono::seconds uptime) {
    long long total = uptime.count();
    if (total < 0) total = 0;

    const long long days = total / 86400;
    total %= 86400;
    const long long h = total / 3600;
    const long long m = (total % 3600) / 60;
    const long long s = total % 60;

    std::ostringstream os;
    if (days > 0) os << days << (days == 1 ? " day, " : " days, ");
    os << h << ':' << std::setw(2) << std::setfill('0') << m
       << ':' << std::setw(2) << std::setfill('0') << s;
    return os.str();
}

// Parses "YYYY-MM-DDTHH:MM[:SS][Z]" (a space may replace the T) as UTC.
inline std::optional<WallClock::time_point> parse_iso8601_utc(std::string_view text) {
    std::string s(text);
    for (char& c : s) {
        if (c == 'T') c = ' ';
    }
    while (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) s.pop_back();
    if (s.size() >= 6 && (s.compare(s.size() - 6, 6, "+00:00") == 0)) s.resize(s.size() - 6);

    std::tm tm{};
    std::istringstream in(s);
    in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (in.fail()) {
        tm = std::tm{};
        std::istringstream retry(s);
        retry >> std::get_time(&tm, "%Y-%m-%d %H:%M");
        if (retry.fail()) return std::nullopt;
    }
    return WallClock::from_time_t(timegm(&tm));
}

} // namespace meshirc::util
