#include "chat/IrcMessage.h"

#include "util/Strings.hpp"

#include <cstdio>

namespace meshirc::chat {

namespace {

void skip_spaces(std::string_view s, std::size_t& pos) {
    while (pos < s.size() && s[pos] == ' ') ++pos;
}

std::string_view next_token(std::string_view s, std::size_t& pos) {
    const std::size_t start = pos;
    while (pos < s.size() && s[pos] != ' ') ++pos;
    return s.substr(start, pos - start);
}

} // namespace

std::optional<IrcMessage> IrcMessage::parse(std::string_view line) {
    if (line.size() > kMaxLineBytes - 2) line = line.substr(0, kMaxLineBytes - 2);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.remove_suffix(1);

    IrcMessage msg;
    std::size_t pos = 0;
    skip_spaces(line, pos);
    if (pos >= line.size()) return std::nullopt;

    if (line[pos] == ':') {
        ++pos;
        msg.prefix = std::string(next_token(line, pos));
        skip_spaces(line, pos);
    }

    const std::string_view verb = next_token(line, pos);
    if (verb.empty()) return std::nullopt;
    msg.verb = util::to_upper(verb);

    while (true) {
        skip_spaces(line, pos);
        if (pos >= line.size()) break;
        if (line[pos] == ':') {
            msg.params.emplace_back(line.substr(pos + 1));
            msg.has_trailing = true;
            break;
        }
        msg.params.emplace_back(next_token(line, pos));
    }
    return msg;
}

const std::string& IrcMessage::param(std::size_t i) const {
    static const std::string empty;
    return i < params.size() ? params[i] : empty;
}

std::string numeric_code(int code) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%03d", code);
    return buf;
}

std::string numeric_reply(std::string_view server, int code, std::string_view target, std::string_view rest) {
    std::string out;
    out.reserve(server.size() + target.size() + rest.size() + 8);
    out.append(":").append(server).append(" ").append(numeric_code(code)).append(" ");
    out.append(target.empty() ? std::string_view("*") : target);
    if (!rest.empty()) out.append(" ").append(rest);
    return out;
}

} // namespace meshirc::chat
