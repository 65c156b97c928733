#include "commands/BuiltinCommands.h"

#include "mesh/MeshTypes.h"
#include "util/Strings.hpp"
#include "util/Time.hpp"

#include <memory>

namespace meshirc::commands {

namespace {

constexpr std::size_t kMaxHelpLine = 400;

class TimeCommand : public Command {
public:
    TimeCommand() : Command("TIME", "TIME - Shows the current server date and time") {}

    void execute(BridgeContext& ctx, const Invocation& inv) override {
        ctx.reply(inv.nick, "Server time: " + util::format_local(util::WallClock::now(), "%Y-%m-%d %H:%M:%S %Z%z"));
    }
};

class StatsCommand : public Command {
public:
    StatsCommand() : Command("STATS", "STATS - Shows basic mesh and gateway statistics") {}

    void execute(BridgeContext& ctx, const Invocation& inv) override {
        const mesh::NodeNum me = ctx.mesh().my_node_num();
        auto self = ctx.directory().lookup(me);
        const std::string my_id = self ? self->id : mesh::node_id_string(me);

        ctx.reply(inv.nick, std::vector<std::string>{
            "--- Gateway & Mesh Statistics ---",
            "Known Nodes: " + std::to_string(ctx.directory().size()),
            "Gateway Node ID: " + my_id + " (Num: " + std::to_string(me) + ")",
            "Mesh Interface: " + ctx.mesh().describe(),
            "Gateway Uptime: " + util::format_uptime(ctx.uptime()),
            "Connected IRC Clients: " + std::to_string(ctx.chat().session_count()),
            "Pending Mesh Requests: " + std::to_string(ctx.correlator().size()),
            "--- End of Stats ---",
        });
    }
};

class HelpCommand : public Command {
public:
    HelpCommand() : Command("HELP", "HELP [command] - Shows available commands or help for a specific command") {}

    void execute(BridgeContext& ctx, const Invocation& inv) override {
        const CommandRegistry& registry = ctx.registry();

        if (!inv.args.empty()) {
            const std::string& wanted = inv.args[0];
            if (const Command* cmd = registry.find(wanted)) {
                ctx.reply(inv.nick, "Help for " + util::to_upper(wanted) + ": " + cmd->help());
            } else {
                ctx.reply(inv.nick, "Unknown command: '" + wanted + "'. Type HELP for a list.");
            }
            return;
        }

        ctx.reply(inv.nick, "*** Available Commands (Type HELP <command> for details):");
        const auto names = registry.names();
        if (names.empty()) {
            ctx.reply(inv.nick, "(No commands seem to be registered)");
            return;
        }

        std::string line;
        for (const auto& name : names) {
            if (line.empty()) {
                line = name;
            } else if (line.size() + name.size() + 2 < kMaxHelpLine) {
                line += ", " + name;
            } else {
                ctx.reply(inv.nick, line);
                line = name;
            }
        }
        if (!line.empty()) ctx.reply(inv.nick, line);
    }
};

} // namespace

void register_local_commands(CommandRegistry& registry) {
    registry.add(std::make_unique<TimeCommand>());
    registry.add(std::make_unique<StatsCommand>());
    registry.add(std::make_unique<HelpCommand>());
}

} // namespace meshirc::commands
