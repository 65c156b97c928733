#pragma once

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace meshirc::util {

inline bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline std::string trim_copy(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;

    std::size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;

    return std::string(s.substr(start, end - start));
}

inline std::string to_upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// RFC 1459 casemapping: A-Z plus []\~ fold to a-z plus {}|^.
inline std::string irc_lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        else if (c == '[') c = '{';
        else if (c == ']') c = '}';
        else if (c == '\\') c = '|';
        else if (c == '~') c = '^';
    }
    return out;
}

inline bool irc_equals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && irc_lower(a) == irc_lower(b);
}

// Splits off the first whitespace-delimited word. The remainder has its
// leading whitespace removed.
inline std::pair<std::string, std::string> split_first_word(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;
    std::size_t end = start;
    while (end < s.size() && !is_space(s[end])) ++end;

    std::size_t rest = end;
    while (rest < s.size() && is_space(s[rest])) ++rest;

    return {std::string(s.substr(start, end - start)), std::string(s.substr(rest))};
}

inline std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out.append(sep);
        out.append(parts[i]);
    }
    return out;
}

inline std::string format_fixed(double value, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return buf;
}

template <typename T>
std::string or_na(const std::optional<T>& value) {
    if (!value) return "N/A";
    return std::to_string(*value);
}

inline std::string or_na(const std::optional<float>& value, int decimals) {
    return value ? format_fixed(*value, decimals) : std::string("N/A");
}

inline std::string or_na(const std::optional<double>& value, int decimals) {
    return value ? format_fixed(*value, decimals) : std::string("N/A");
}

// Breaks text into wire-safe lines: CR and LF both end a line, NUL is dropped
// and empty lines are skipped. Each line is cut to at most max_bytes without
// splitting a UTF-8 sequence.
inline std::vector<std::string> wire_lines(std::string_view text, std::size_t max_bytes) {
    std::vector<std::string> out;
    std::string cur;
    auto flush = [&] {
        if (cur.size() > max_bytes) {
            std::size_t cut = max_bytes;
            while (cut > 0 && (static_cast<unsigned char>(cur[cut]) & 0xC0) == 0x80) --cut;
            cur.resize(cut);
        }
        if (!cur.empty()) out.push_back(std::move(cur));
        cur.clear();
    };
    for (char c : text) {
        if (c == '\r' || c == '\n') flush();
        else if (c != '\0') cur.push_back(c);
    }
    flush();
    return out;
}

} // namespace meshirc::util
