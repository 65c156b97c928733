#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meshirc::chat {

// One protocol line: [:prefix] VERB params* [:trailing]
struct IrcMessage {
    static constexpr std::size_t kMaxLineBytes = 512;   // including CRLF

    std::string prefix;
    std::string verb;                 // upper-cased
    std::vector<std::string> params;  // trailing param, if any, is last
    bool has_trailing = false;

    // Empty lines and lines without a verb yield nullopt.
    static std::optional<IrcMessage> parse(std::string_view line);

    const std::string& param(std::size_t i) const;
    std::size_t param_count() const noexcept { return params.size(); }
};

// "<num>" padded to three digits, e.g. 1 -> "001".
std::string numeric_code(int code);

// Builds ":server <code> <target> <rest>".
std::string numeric_reply(std::string_view server, int code, std::string_view target, std::string_view rest);

} // namespace meshirc::chat
