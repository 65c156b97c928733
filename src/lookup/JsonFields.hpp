#pragma once

#include "util/Strings.hpp"

#include <boost/json.hpp>

#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace meshirc::lookup {

namespace json = boost::json;

inline std::optional<double> as_number(const json::value& v) {
    if (v.is_double()) return v.get_double();
    if (v.is_int64()) return static_cast<double>(v.get_int64());
    if (v.is_uint64()) return static_cast<double>(v.get_uint64());
    if (v.is_string()) {
        const json::string& s = v.get_string();
        const std::string text(s.data(), s.size());
        char* end = nullptr;
        const double d = std::strtod(text.c_str(), &end);
        if (end != text.c_str() && *end == '\0') return d;
    }
    return std::nullopt;
}

inline std::optional<double> number_at(const json::object& obj, std::string_view key) {
    if (const json::value* v = obj.if_contains(key)) return as_number(*v);
    return std::nullopt;
}

inline std::optional<std::string> string_at(const json::object& obj, std::string_view key) {
    if (const json::value* v = obj.if_contains(key)) {
        if (const json::string* s = v->if_string()) return std::string(s->data(), s->size());
    }
    return std::nullopt;
}

// 75 -> "75", 3.14 -> "3.14"; mirrors how the source JSON spelled the number.
inline std::string plain_number(double d) {
    if (std::floor(d) == d && std::fabs(d) < 1e15) return std::to_string(static_cast<long long>(d));
    std::string s = util::format_fixed(d, 6);
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

inline std::string display(const json::value& v) {
    if (const json::string* s = v.if_string()) return std::string(s->data(), s->size());
    if (v.is_null()) return "N/A";
    if (auto n = as_number(v)) return plain_number(*n);
    return json::serialize(v);
}

} // namespace meshirc::lookup
