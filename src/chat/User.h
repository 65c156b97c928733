#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace meshirc::chat {

class User {
public:
    using Clock = std::chrono::steady_clock;
    static constexpr std::size_t kMaxNickLen = 30;
    static constexpr std::size_t kMaxNameLen = 64;

    explicit User(std::string host);

    const std::string& nickname() const noexcept;
    const std::string& username() const noexcept;
    const std::string& realname() const noexcept;
    const std::string& host() const noexcept;

    bool has_nickname() const noexcept { return !nickname_.empty(); }
    bool has_username() const noexcept { return !username_.empty(); }

    // Caller validates with is_valid_nickname() first.
    void set_nickname(std::string nick);
    void set_username(std::string user, std::string real);

    // "nick!user@host"
    std::string mask() const;

    Clock::time_point connected_at() const noexcept;
    Clock::time_point last_seen() const noexcept;
    void touch() noexcept;

    // 1-30 chars; first a letter or one of []\`_^{|}, then letters, digits,
    // those specials or '-'.
    static bool is_valid_nickname(std::string_view nick) noexcept;

private:
    static std::string sanitize_name(std::string s);

private:
    std::string nickname_;
    std::string username_;
    std::string realname_;
    std::string host_;
    Clock::time_point connected_at_;
    Clock::time_point last_seen_;
};

} // namespace meshirc::chat
