#include "chat/User.h"

#include "util/Strings.hpp"

#include <utility>

namespace meshirc::chat {

namespace {

bool is_nick_special(char c) noexcept {
    switch (c) {
        case '[': case ']': case '\\': case '`': case '_': case '^': case '{': case '|': case '}':
            return true;
        default:
            return false;
    }
}

bool is_letter(char c) noexcept { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

} // namespace

User::User(std::string host)
    : host_(host.empty() ? std::string("unknown") : std::move(host)),
      connected_at_(Clock::now()),
      last_seen_(connected_at_) {}

const std::string& User::nickname() const noexcept { return nickname_; }
const std::string& User::username() const noexcept { return username_; }
const std::string& User::realname() const noexcept { return realname_; }
const std::string& User::host() const noexcept { return host_; }

void User::set_nickname(std::string nick) {
    nickname_ = std::move(nick);
}

void User::set_username(std::string user, std::string real) {
    username_ = sanitize_name(std::move(user));
    realname_ = util::trim_copy(real);
}

std::string User::mask() const {
    return (nickname_.empty() ? std::string("*") : nickname_) + "!" + username_ + "@" + host_;
}

User::Clock::time_point User::connected_at() const noexcept { return connected_at_; }
User::Clock::time_point User::last_seen() const noexcept { return last_seen_; }

void User::touch() noexcept {
    last_seen_ = Clock::now();
}

bool User::is_valid_nickname(std::string_view nick) noexcept {
    if (nick.empty() || nick.size() > kMaxNickLen) return false;
    if (!is_letter(nick[0]) && !is_nick_special(nick[0])) return false;
    for (std::size_t i = 1; i < nick.size(); ++i) {
        const char c = nick[i];
        if (!is_letter(c) && !is_digit(c) && !is_nick_special(c) && c != '-') return false;
    }
    return true;
}

std::string User::sanitize_name(std::string s) {
    s = util::trim_copy(s);

    if (s.size() > kMaxNameLen) {
        s.resize(kMaxNameLen);
        s = util::trim_copy(s);
    }

    if (s.empty()) s = "user";
    return s;
}

} // namespace meshirc::chat
