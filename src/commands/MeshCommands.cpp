#include "commands/BuiltinCommands.h"

#include "commands/NodeResolver.h"
#include "mesh/MeshInterface.h"
#include "util/Log.hpp"
#include "util/Strings.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace meshirc::commands {

namespace {

constexpr std::size_t kMaxTextLen  = 240;
constexpr std::size_t kMaxAlarmLen = 230;

std::string join_from(const std::vector<std::string>& args, std::size_t first) {
    std::vector<std::string> tail(args.begin() + static_cast<std::ptrdiff_t>(first), args.end());
    return util::join(tail, " ");
}

class SendCommand : public Command {
public:
    SendCommand() : Command("SEND", "SEND <message> - Sends message to default mesh channel") {}

    void execute(BridgeContext& ctx, const Invocation& inv) override {
        if (inv.args.empty()) return usage(ctx, inv);

        const std::string text = join_from(inv.args, 0);
        if (text.size() > kMaxTextLen) {
            ctx.reply(inv.nick, "Error: Message too long (" + std::to_string(text.size()) +
                                    " chars). Maximum is " + std::to_string(kMaxTextLen) + " characters.");
            return;
        }
        if (util::trim_copy(text).empty()) {
            ctx.reply(inv.nick, "Error: Message cannot be empty.");
            return;
        }

        const int channel = ctx.settings().default_channel;
        ctx.reply(inv.nick, "Sending '" + text + "' to mesh channel " + std::to_string(channel) + "...");
        try {
            ctx.mesh().send_text(mesh::Destination::channel(channel), text, false);
        } catch (const mesh::MeshError& e) {
            util::log_error("SEND") << "Mesh error sending message for " << inv.nick << ": " << e.what();
            ctx.reply(inv.nick, std::string("Mesh Error sending message: ") + e.what());
            return;
        }
        ctx.reply(inv.nick, "Message sent to mesh channel " + std::to_string(channel) + ".");
    }
};

class AlarmCommand : public Command {
public:
    AlarmCommand() : Command("ALARM", "ALARM <message> - Broadcasts an ALARM message to the default mesh channel") {}

    void execute(BridgeContext& ctx, const Invocation& inv) override {
        if (inv.args.empty()) return usage(ctx, inv);

        const std::string text = join_from(inv.args, 0);
        if (text.size() > kMaxAlarmLen) {
            ctx.reply(inv.nick, "Error: Alarm message too long (" + std::to_string(text.size()) +
                                    " chars). Maximum is " + std::to_string(kMaxAlarmLen) + " characters.");
            return;
        }
        if (util::trim_copy(text).empty()) {
            ctx.reply(inv.nick, "Error: Alarm message cannot be empty.");
            return;
        }

        const int channel = ctx.settings().default_channel;
        ctx.reply(inv.nick, "Broadcasting Alarm to mesh channel " + std::to_string(channel) + ": '" + text + "'...");
        try {
            ctx.mesh().send_text(mesh::Destination::channel(channel), "ALARM: " + text, false);
        } catch (const mesh::MeshError& e) {
            util::log_error("ALARM") << "Mesh error sending alarm for " << inv.nick << ": " << e.what();
            ctx.reply(inv.nick, std::string("Mesh Error sending ALARM: ") + e.what());
            return;
        }
        util::log_warning("ALARM") << inv.nick << " broadcast alarm: " << text;
        ctx.reply(inv.nick, "Alarm message sent to mesh channel " + std::to_string(channel) + ".");
    }
};

class DirectMessageCommand : public Command {
public:
    DirectMessageCommand()
        : Command("DM", "DM <node_id|shortname|longname|nodenum> <message> - Sends direct message to a node") {}

    void execute(BridgeContext& ctx, const Invocation& inv) override {
        if (inv.args.size() < 2) return usage(ctx, inv);

        const std::string& token = inv.args[0];
        const std::string text = join_from(inv.args, 1);
        if (text.size() > kMaxTextLen) {
            ctx.reply(inv.nick, "Error: Message too long (" + std::to_string(text.size()) +
                                    " chars). Maximum is " + std::to_string(kMaxTextLen) + " characters.");
            return;
        }
        if (util::trim_copy(text).empty()) {
            ctx.reply(inv.nick, "Error: Message cannot be empty.");
            return;
        }

        auto node = resolve_node(ctx.directory().all(), token);
        if (!node) {
            ctx.reply(inv.nick, "Error: Could not find node matching '" + token + "'.");
            return;
        }

        ctx.reply(inv.nick, "Sending DM '" + text + "' to " + token + " (NodeNum: " + std::to_string(node->num) + ")...");
        mesh::RequestId id = 0;
        try {
            id = ctx.mesh().send_text(mesh::Destination::node(node->num), text, true);
        } catch (const mesh::MeshError& e) {
            util::log_error("DM") << "Mesh error sending DM to " << node->id << " for " << inv.nick << ": " << e.what();
            ctx.reply(inv.nick, std::string("Mesh Error sending DM: ") + e.what());
            return;
        }

        gateway::PendingRequest req;
        req.id = id;
        req.kind = gateway::RequestKind::DirectMessage;
        req.requester = inv.nick;
        req.target = node->num;
        req.target_label = node_label(*node);
        req.created_at = gateway::PendingRequest::Clock::now();
        req.deadline = req.created_at + ctx.settings().ack_timeout;
        if (!ctx.correlator().add(std::move(req))) {
            util::log_warning("DM") << "Request id " << id << " is already being tracked";
        }

        ctx.reply(inv.nick, "DM request sent to " + token + ". Waiting for ACK/NAK...");
    }
};

class PingCommand : public Command {
public:
    PingCommand()
        : Command("PING", "PING <node_id|shortname|longname|nodenum> - Sends a mesh ping request to a node") {}

    void execute(BridgeContext& ctx, const Invocation& inv) override {
        if (inv.args.empty()) return usage(ctx, inv);

        const std::string& token = inv.args[0];
        auto node = resolve_node(ctx.directory().all(), token);
        if (!node) {
            ctx.reply(inv.nick, "Error: Could not find node matching '" + token + "'.");
            return;
        }

        ctx.reply(inv.nick, "Sending mesh ping to " + token + " (" + std::to_string(node->num) + ")...");
        mesh::RequestId id = 0;
        try {
            id = ctx.mesh().ping(node->num);
        } catch (const mesh::MeshError& e) {
            util::log_error("PING") << "Mesh error pinging " << node->id << " for " << inv.nick << ": " << e.what();
            ctx.reply(inv.nick, std::string("Mesh Error sending PING: ") + e.what());
            return;
        }

        gateway::PendingRequest req;
        req.id = id;
        req.kind = gateway::RequestKind::Ping;
        req.requester = inv.nick;
        req.target = node->num;
        req.target_label = node_label(*node);
        req.created_at = gateway::PendingRequest::Clock::now();
        req.deadline = req.created_at + ctx.settings().ping_timeout;
        if (!ctx.correlator().add(std::move(req))) {
            util::log_warning("PING") << "Request id " << id << " is already being tracked";
        }

        ctx.reply(inv.nick, "Ping request sent to " + token + ". Waiting for reply (PONG)...");
    }
};

} // namespace

void register_mesh_commands(CommandRegistry& registry) {
    registry.add(std::make_unique<SendCommand>());
    registry.add(std::make_unique<AlarmCommand>());
    registry.add(std::make_unique<DirectMessageCommand>());
    registry.add(std::make_unique<PingCommand>());
}

} // namespace meshirc::commands
