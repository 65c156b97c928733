#pragma once

#include "chat/IrcMessage.h"
#include "networking/Session.hpp"
#include "networking/Transport.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace meshirc::chat {

struct ChatServerOptions {
    std::string server_name = "meshirc.gw";
    std::string room = "#meshtastic-ctrl";
    std::string topic = "Mesh IRC Gateway | Type HELP for commands";
    std::string version = "meshirc";
    std::chrono::seconds registration_timeout{60};
};

// IRC-subset server with a single control room. Owns every client session.
// Not thread-safe: every call happens on the server io_context.
class ChatServer {
public:
    using Clock = chat::User::Clock;

    // Returns true when the room line was a command and has been consumed.
    using CommandHook   = std::function<bool(const std::string& nick, const std::string& text)>;
    using DepartureHook = std::function<void(const std::string& nick)>;
    using RenameHook    = std::function<void(const std::string& old_nick, const std::string& new_nick)>;

    ChatServer(networking::Transport& transport, ChatServerOptions options);

    ChatServer(const ChatServer&) = delete;
    ChatServer& operator=(const ChatServer&) = delete;

    void set_command_hook(CommandHook hook);
    void set_departure_hook(DepartureHook hook);
    void set_rename_hook(RenameHook hook);

    void accept_connection(networking::ClientId client, std::string host);
    void handle_line(networking::ClientId client, std::string_view raw);

    // Room text from a member: a command, or chat relayed to everyone else.
    void route_room_message(networking::ClientId client, const std::string& text);

    // ":server!server@server PRIVMSG <room> :<prefix> <text>" to all members.
    // Text is split on CR/LF and each line is cut to the 512-byte limit, as is
    // every notice.
    void send_to_room(const std::string& text, std::string_view prefix = "[GW]");

    // Server NOTICE to one nickname. Nicknames not in the room are ignored.
    void send_to_session(std::string_view nick, const std::string& text);

    void disconnect(networking::ClientId client, const std::string& reason);

    // The transport noticed the connection is gone.
    void connection_lost(networking::ClientId client);

    void disconnect_all(const std::string& reason);

    // Drops sessions still unregistered after the grace period. Returns how
    // many were dropped.
    std::size_t expire_unregistered(Clock::time_point now);

    std::size_t session_count() const noexcept { return sessions_.size(); }
    std::vector<std::string> room_members() const;
    std::optional<networking::RegistrationState> state_of(networking::ClientId client) const;
    const ChatServerOptions& options() const noexcept { return options_; }

private:
    using Session = networking::Session;

    void handle_unregistered_(Session& s, const IrcMessage& msg);
    void handle_registered_(Session& s, const IrcMessage& msg);

    void on_nick_(Session& s, const IrcMessage& msg);
    void on_user_(Session& s, const IrcMessage& msg);
    void on_privmsg_(Session& s, const IrcMessage& msg);
    void on_join_(Session& s, const IrcMessage& msg);
    void on_part_(Session& s, const IrcMessage& msg);
    void on_mode_(Session& s, const IrcMessage& msg);
    void on_who_(Session& s, const IrcMessage& msg);

    void try_complete_registration_(Session& s);
    void join_room_(Session& s);
    void send_names_(Session& s);
    void remove_session_(networking::ClientId client, const std::string& reason, bool send_error);

    void send_numeric_(const Session& s, int code, std::string_view rest);
    void send_notice_(const Session& s, const std::string& text);
    static std::size_t line_budget_(const std::string& head);
    void broadcast_room_(const std::string& line, std::optional<networking::ClientId> except = std::nullopt);

    Session* find_session_(networking::ClientId client);
    Session* find_by_nick_(std::string_view nick);
    bool is_room_(std::string_view name) const;

private:
    networking::Transport& transport_;
    ChatServerOptions options_;
    std::string created_;

    CommandHook command_hook_;
    DepartureHook departure_hook_;
    RenameHook rename_hook_;

    std::unordered_map<networking::ClientId, Session> sessions_;
    std::unordered_map<std::string, networking::ClientId> nicks_;  // irc_lower(nick) -> client
    std::vector<networking::ClientId> room_order_;                 // join order
};

} // namespace meshirc::chat
