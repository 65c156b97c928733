#include "chat/ChatServer.h"

#include "util/Log.hpp"
#include "util/Strings.hpp"
#include "util/Time.hpp"

#include <algorithm>
#include <utility>

namespace meshirc::chat {

using networking::ClientId;
using networking::RegistrationState;

ChatServer::ChatServer(networking::Transport& transport, ChatServerOptions options)
    : transport_(transport),
      options_(std::move(options)),
      created_(util::format_local(util::WallClock::now())) {}

void ChatServer::set_command_hook(CommandHook hook) { command_hook_ = std::move(hook); }
void ChatServer::set_departure_hook(DepartureHook hook) { departure_hook_ = std::move(hook); }
void ChatServer::set_rename_hook(RenameHook hook) { rename_hook_ = std::move(hook); }

void ChatServer::accept_connection(ClientId client, std::string host) {
    auto [it, inserted] = sessions_.try_emplace(client, client, std::move(host));
    if (!inserted) {
        util::log_warning("chat") << "Duplicate client id " << client << " ignored";
        return;
    }
    util::log_info("chat") << "Client " << client << " connected from " << it->second.user.host();
}

void ChatServer::handle_line(ClientId client, std::string_view raw) {
    Session* s = find_session_(client);
    if (!s) return;
    s->user.touch();

    auto msg = IrcMessage::parse(raw);
    if (!msg) return;
    util::log_debug("chat") << "<- " << client << " " << raw;

    if (s->registered()) handle_registered_(*s, *msg);
    else handle_unregistered_(*s, *msg);
}

void ChatServer::handle_unregistered_(Session& s, const IrcMessage& msg) {
    const std::string& verb = msg.verb;
    if (verb == "NICK") return on_nick_(s, msg);
    if (verb == "USER") return on_user_(s, msg);
    if (verb == "PASS" || verb == "CAP") return;
    if (verb == "PING") {
        transport_.send(s.client_id, ":" + options_.server_name + " PONG " + options_.server_name + " :" + msg.param(0));
        return;
    }
    if (verb == "QUIT") {
        disconnect(s.client_id, msg.param_count() ? msg.param(0) : std::string("Client Quit"));
        return;
    }
    send_numeric_(s, 451, ":You have not registered");
}

void ChatServer::handle_registered_(Session& s, const IrcMessage& msg) {
    const std::string& verb = msg.verb;
    if (verb == "PRIVMSG") return on_privmsg_(s, msg);
    if (verb == "JOIN") return on_join_(s, msg);
    if (verb == "PART") return on_part_(s, msg);
    if (verb == "NICK") return on_nick_(s, msg);
    if (verb == "USER") return on_user_(s, msg);
    if (verb == "MODE") return on_mode_(s, msg);
    if (verb == "WHO") return on_who_(s, msg);
    if (verb == "NAMES") return send_names_(s);
    if (verb == "TOPIC") {
        if (msg.param_count() && !is_room_(msg.param(0))) {
            send_numeric_(s, 403, msg.param(0) + " :No such channel");
            return;
        }
        send_numeric_(s, 332, options_.room + " :" + options_.topic);
        return;
    }
    if (verb == "PING") {
        transport_.send(s.client_id, ":" + options_.server_name + " PONG " + options_.server_name + " :" + msg.param(0));
        return;
    }
    if (verb == "PONG" || verb == "NOTICE" || verb == "PASS" || verb == "CAP") return;
    if (verb == "QUIT") {
        disconnect(s.client_id, msg.param_count() ? msg.param(0) : std::string("Client Quit"));
        return;
    }
    send_numeric_(s, 421, verb + " :Unknown command");
}

void ChatServer::on_nick_(Session& s, const IrcMessage& msg) {
    if (msg.param_count() == 0 || msg.param(0).empty()) {
        send_numeric_(s, 431, ":No nickname given");
        return;
    }
    const std::string& nick = msg.param(0);
    if (!User::is_valid_nickname(nick)) {
        send_numeric_(s, 432, nick + " :Erroneous nickname");
        return;
    }

    const std::string key = util::irc_lower(nick);
    auto taken = nicks_.find(key);
    if (taken != nicks_.end() && taken->second != s.client_id) {
        send_numeric_(s, 433, nick + " :Nickname is already in use");
        return;
    }

    const std::string old_nick = s.user.nickname();
    if (old_nick == nick) return;
    const std::string old_mask = s.user.mask();

    if (!old_nick.empty()) nicks_.erase(util::irc_lower(old_nick));
    nicks_[key] = s.client_id;
    s.user.set_nickname(nick);

    if (!s.registered()) {
        try_complete_registration_(s);
        return;
    }

    const std::string line = ":" + old_mask + " NICK :" + nick;
    if (s.in_room()) broadcast_room_(line);
    else transport_.send(s.client_id, line);

    util::log_info("chat") << old_nick << " is now known as " << nick;
    if (rename_hook_) rename_hook_(old_nick, nick);
}

void ChatServer::on_user_(Session& s, const IrcMessage& msg) {
    if (s.registered()) {
        send_numeric_(s, 462, ":You may not reregister");
        return;
    }
    if (msg.param_count() < 4) {
        send_numeric_(s, 461, "USER :Not enough parameters");
        return;
    }
    s.user.set_username(msg.param(0), msg.param(3));
    try_complete_registration_(s);
}

void ChatServer::try_complete_registration_(Session& s) {
    if (!s.user.has_nickname() || !s.user.has_username()) return;

    s.state = RegistrationState::Registered;
    util::log_info("chat") << "Client " << s.client_id << " registered as " << s.user.mask();

    send_numeric_(s, 1, ":Welcome to the Mesh IRC Gateway " + s.user.mask());
    send_numeric_(s, 2, ":Your host is " + options_.server_name + ", running version " + options_.version);
    send_numeric_(s, 3, ":This server was created " + created_);
    send_numeric_(s, 4, options_.server_name + " " + options_.version + " o nt");

    send_notice_(s, "*** Welcome to the Mesh IRC Gateway (" + options_.server_name + ")");
    send_notice_(s, "*** Join " + options_.room + " to interact with the mesh.");
    send_notice_(s, "*** Type HELP in the channel for commands.");

    join_room_(s);
}

void ChatServer::join_room_(Session& s) {
    if (s.in_room()) return;
    s.state = RegistrationState::InRoom;
    room_order_.push_back(s.client_id);

    broadcast_room_(":" + s.user.mask() + " JOIN " + options_.room);
    send_numeric_(s, 332, options_.room + " :" + options_.topic);
    send_names_(s);
}

void ChatServer::send_names_(Session& s) {
    send_numeric_(s, 353, "= " + options_.room + " :" + util::join(room_members(), " "));
    send_numeric_(s, 366, options_.room + " :End of /NAMES list.");
}

void ChatServer::on_privmsg_(Session& s, const IrcMessage& msg) {
    if (msg.param_count() < 2) {
        send_numeric_(s, 461, "PRIVMSG :Not enough parameters");
        return;
    }
    const std::string& target = msg.param(0);
    const std::string& text = msg.param(1);

    if (is_room_(target)) {
        if (!s.in_room()) {
            send_numeric_(s, 404, options_.room + " :Cannot send to channel");
            return;
        }
        route_room_message(s.client_id, text);
    } else if (util::irc_equals(target, options_.server_name)) {
        send_notice_(s, "Please send commands inside the control channel.");
    } else {
        util::log_debug("chat") << "Ignoring PRIVMSG from " << s.user.nickname() << " to " << target;
    }
}

void ChatServer::on_join_(Session& s, const IrcMessage& msg) {
    if (msg.param_count() == 0) {
        send_numeric_(s, 461, "JOIN :Not enough parameters");
        return;
    }
    std::string_view list = msg.param(0);
    while (!list.empty()) {
        const std::size_t comma = list.find(',');
        const std::string channel(list.substr(0, comma));
        list = comma == std::string_view::npos ? std::string_view() : list.substr(comma + 1);
        if (channel.empty()) continue;

        if (is_room_(channel)) join_room_(s);
        else send_numeric_(s, 403, channel + " :No such channel");
    }
}

void ChatServer::on_part_(Session& s, const IrcMessage& msg) {
    if (msg.param_count() == 0) {
        send_numeric_(s, 461, "PART :Not enough parameters");
        return;
    }
    const std::string& channel = msg.param(0);
    if (!is_room_(channel)) {
        send_numeric_(s, 403, channel + " :No such channel");
        return;
    }
    if (!s.in_room()) {
        send_numeric_(s, 442, options_.room + " :You're not on that channel");
        return;
    }

    std::string line = ":" + s.user.mask() + " PART " + options_.room;
    if (msg.param_count() > 1) line += " :" + msg.param(1);
    broadcast_room_(line);

    room_order_.erase(std::remove(room_order_.begin(), room_order_.end(), s.client_id), room_order_.end());
    s.state = RegistrationState::Registered;
}

void ChatServer::on_mode_(Session& s, const IrcMessage& msg) {
    if (msg.param_count() == 0) {
        send_numeric_(s, 461, "MODE :Not enough parameters");
        return;
    }
    const std::string& target = msg.param(0);
    if (is_room_(target)) {
        send_numeric_(s, 324, options_.room + " +nt");
    } else if (util::irc_equals(target, s.user.nickname())) {
        send_numeric_(s, 221, "+");
    } else if (!target.empty() && (target[0] == '#' || target[0] == '&')) {
        send_numeric_(s, 403, target + " :No such channel");
    } else {
        send_numeric_(s, 401, target + " :No such nick/channel");
    }
}

void ChatServer::on_who_(Session& s, const IrcMessage& msg) {
    const std::string mask = msg.param_count() ? msg.param(0) : options_.room;
    if (mask.empty() || is_room_(mask)) {
        for (ClientId id : room_order_) {
            const Session* member = find_session_(id);
            if (!member) continue;
            const User& u = member->user;
            send_numeric_(s, 352, options_.room + " " + u.username() + " " + u.host() + " " +
                                      options_.server_name + " " + u.nickname() + " H :0 " + u.realname());
        }
    }
    send_numeric_(s, 315, (mask.empty() ? options_.room : mask) + " :End of /WHO list.");
}

void ChatServer::route_room_message(ClientId client, const std::string& text) {
    Session* s = find_session_(client);
    if (!s || !s->in_room()) return;

    const auto first = util::split_first_word(text).first;
    if (!first.empty() && command_hook_ && command_hook_(s->user.nickname(), text)) return;

    broadcast_room_(":" + s->user.mask() + " PRIVMSG " + options_.room + " :" + text, client);
}

void ChatServer::send_to_room(const std::string& text, std::string_view prefix) {
    std::string body = prefix.empty() ? text : std::string(prefix) + " " + text;
    const std::string head = ":" + options_.server_name + "!" + options_.server_name + "@" +
                             options_.server_name + " PRIVMSG " + options_.room + " :";

    for (auto& part : util::wire_lines(body, line_budget_(head))) broadcast_room_(head + part);
}

void ChatServer::send_to_session(std::string_view nick, const std::string& text) {
    Session* s = find_by_nick_(nick);
    if (!s || !s->in_room()) {
        util::log_debug("chat") << "Dropping notice for " << nick << ", not in " << options_.room;
        return;
    }
    send_notice_(*s, text);
}

void ChatServer::disconnect(ClientId client, const std::string& reason) {
    remove_session_(client, reason, true);
}

void ChatServer::connection_lost(ClientId client) {
    remove_session_(client, "Connection closed", false);
}

void ChatServer::disconnect_all(const std::string& reason) {
    std::vector<ClientId> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, s] : sessions_) ids.push_back(id);
    for (ClientId id : ids) disconnect(id, reason);
}

std::size_t ChatServer::expire_unregistered(Clock::time_point now) {
    std::vector<ClientId> expired;
    for (const auto& [id, s] : sessions_) {
        if (s.state == RegistrationState::Unregistered &&
            now - s.user.connected_at() >= options_.registration_timeout) {
            expired.push_back(id);
        }
    }
    for (ClientId id : expired) {
        util::log_info("chat") << "Client " << id << " did not register in time";
        disconnect(id, "Registration timeout");
    }
    return expired.size();
}

std::vector<std::string> ChatServer::room_members() const {
    std::vector<std::string> nicks;
    nicks.reserve(room_order_.size());
    for (ClientId id : room_order_) {
        auto it = sessions_.find(id);
        if (it != sessions_.end()) nicks.push_back(it->second.user.nickname());
    }
    return nicks;
}

std::optional<RegistrationState> ChatServer::state_of(ClientId client) const {
    auto it = sessions_.find(client);
    if (it == sessions_.end()) return std::nullopt;
    return it->second.state;
}

void ChatServer::remove_session_(ClientId client, const std::string& reason, bool send_error) {
    auto it = sessions_.find(client);
    if (it == sessions_.end()) return;

    Session& s = it->second;
    const bool was_registered = s.registered();
    const bool was_in_room = s.in_room();
    const std::string nick = s.user.nickname();
    const std::string mask = s.user.mask();
    s.state = RegistrationState::Disconnected;

    if (send_error) {
        transport_.send(client, "ERROR :Closing Link: " + s.user.host() + " (" + reason + ")");
        transport_.close(client);
    }

    room_order_.erase(std::remove(room_order_.begin(), room_order_.end(), client), room_order_.end());
    if (!nick.empty()) {
        auto owner = nicks_.find(util::irc_lower(nick));
        if (owner != nicks_.end() && owner->second == client) nicks_.erase(owner);
    }
    sessions_.erase(it);

    if (was_in_room) broadcast_room_(":" + mask + " QUIT :" + reason);
    util::log_info("chat") << "Client " << client << (nick.empty() ? "" : " (" + nick + ")")
                           << " left: " << reason;

    if (was_registered && departure_hook_) departure_hook_(nick);
}

void ChatServer::send_numeric_(const Session& s, int code, std::string_view rest) {
    transport_.send(s.client_id, numeric_reply(options_.server_name, code, s.user.nickname(), rest));
}

void ChatServer::send_notice_(const Session& s, const std::string& text) {
    const std::string target = s.user.has_nickname() ? s.user.nickname() : std::string("*");
    const std::string head = ":" + options_.server_name + " NOTICE " + target + " :";
    for (auto& part : util::wire_lines(text, line_budget_(head))) transport_.send(s.client_id, head + part);
}

std::size_t ChatServer::line_budget_(const std::string& head) {
    const std::size_t limit = IrcMessage::kMaxLineBytes - 2;
    return head.size() < limit ? limit - head.size() : 0;
}

void ChatServer::broadcast_room_(const std::string& line, std::optional<ClientId> except) {
    for (ClientId id : room_order_) {
        if (except && *except == id) continue;
        transport_.send(id, line);
    }
}

ChatServer::Session* ChatServer::find_session_(ClientId client) {
    auto it = sessions_.find(client);
    return it == sessions_.end() ? nullptr : &it->second;
}

ChatServer::Session* ChatServer::find_by_nick_(std::string_view nick) {
    auto it = nicks_.find(util::irc_lower(nick));
    if (it == nicks_.end()) return nullptr;
    return find_session_(it->second);
}

bool ChatServer::is_room_(std::string_view name) const {
    return util::irc_equals(name, options_.room);
}

} // namespace meshirc::chat
