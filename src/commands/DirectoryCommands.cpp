#include "commands/BuiltinCommands.h"

#include "commands/NodeResolver.h"
#include "util/Strings.hpp"
#include "util/Time.hpp"

#include <algorithm>
#include <memory>

namespace meshirc::commands {

namespace {

using gateway::NodeRecord;

std::string or_na(const std::string& s) { return s.empty() ? std::string("N/A") : s; }

std::string heard_str(const NodeRecord& node) {
    return node.last_heard ? util::format_local(*node.last_heard) : std::string("Never");
}

class NodesCommand : public Command {
public:
    NodesCommand() : Command("NODES", "NODES - Lists known nodes on the mesh") {}

    void execute(BridgeContext& ctx, const Invocation& inv) override {
        ctx.reply(inv.nick, "--- Mesh Nodes ---");

        auto nodes = ctx.directory().all();
        if (nodes.empty()) {
            ctx.reply(inv.nick, "No nodes currently known to the gateway.");
        }
        std::sort(nodes.begin(), nodes.end(), [](const NodeRecord& a, const NodeRecord& b) {
            if (a.last_heard != b.last_heard) {
                if (!a.last_heard) return false;
                if (!b.last_heard) return true;
                return *a.last_heard > *b.last_heard;
            }
            return a.num < b.num;
        });

        for (const auto& node : nodes) {
            ctx.reply(inv.nick, "Num: " + std::to_string(node.num) +
                                    " | ID: " + node.id +
                                    " | Name: " + or_na(node.long_name) + " (" + or_na(node.short_name) + ")" +
                                    " | SNR: " + util::or_na(node.snr, 1) +
                                    " | LastHeard: " + heard_str(node));
        }
        ctx.reply(inv.nick, "--- End of Node List ---");
    }
};

class InfoCommand : public Command {
public:
    InfoCommand() : Command("INFO", "INFO <node_id|shortname|longname|nodenum> - Shows detailed info for a node") {}

    void execute(BridgeContext& ctx, const Invocation& inv) override {
        if (inv.args.empty()) return usage(ctx, inv);

        const std::string& token = inv.args[0];
        auto node = resolve_node(ctx.directory().all(), token);
        if (!node) {
            ctx.reply(inv.nick, "Error: Could not find node matching '" + token + "'.");
            return;
        }

        std::vector<std::string> lines;
        lines.push_back("--- Info for Node " + token + " (" + node->id + ") ---");
        lines.push_back("  Node Number: " + std::to_string(node->num));
        lines.push_back("  ID: " + node->id);
        lines.push_back("  Short Name: " + or_na(node->short_name));
        lines.push_back("  Long Name: " + or_na(node->long_name));
        lines.push_back("  Hardware: " + or_na(node->hw_model));
        lines.push_back("  Last Heard: " + heard_str(*node));
        lines.push_back("  SNR: " + util::or_na(node->snr, 2) + " | RSSI: " + util::or_na(node->rssi) +
                        " | Hops Away: " + util::or_na(node->hops_away));

        if (const auto& pos = node->position) {
            lines.push_back("  Position: Lat " + util::format_fixed(pos->latitude, 5) +
                            ", Lon " + util::format_fixed(pos->longitude, 5) +
                            ", Alt " + util::or_na(pos->altitude) + "m" +
                            " (Time: " + (pos->time ? util::format_local(*pos->time) : std::string("N/A")) + ")");
        }
        if (const auto& m = node->metrics) {
            lines.push_back("  Metrics: Batt " + util::or_na(m->battery_level) + "%" +
                            ", Volt " + util::or_na(m->voltage, 2) + "V" +
                            ", ChUtil " + util::or_na(m->channel_utilization, 1) + "%" +
                            ", AirUtil " + util::or_na(m->air_util_tx, 1) + "%" +
                            ", Uptime " + util::or_na(m->uptime_seconds) + "s");
        }
        lines.push_back("--- End of Info ---");
        ctx.reply(inv.nick, lines);
    }
};

class LocationCommand : public Command {
public:
    LocationCommand() : Command("LOCATION", "LOCATION - Shows the gateway node's GPS location (if available)") {}

    void execute(BridgeContext& ctx, const Invocation& inv) override {
        ctx.reply(inv.nick, "--- Gateway Location ---");

        auto self = ctx.directory().lookup(ctx.mesh().my_node_num());
        if (self && self->position) {
            const mesh::Position& pos = *self->position;
            const std::string lat = util::format_fixed(pos.latitude, 5);
            const std::string lon = util::format_fixed(pos.longitude, 5);
            ctx.reply(inv.nick, "Latitude: " + lat + ", Longitude: " + lon);
            if (pos.altitude) ctx.reply(inv.nick, "Altitude: " + std::to_string(*pos.altitude) + " m");
            if (pos.time) ctx.reply(inv.nick, "Position Time: " + util::format_local(*pos.time, "%Y-%m-%d %H:%M:%S %Z"));
            ctx.reply(inv.nick, "Map Link (approx): https://www.google.com/maps?q=" + lat + "," + lon);
        } else {
            ctx.reply(inv.nick, "Location data not available or incomplete for the gateway node.");
            ctx.reply(inv.nick, "(Node needs a GPS fix and position sharing enabled).");
        }
        ctx.reply(inv.nick, "--- End of Location ---");
    }
};

} // namespace

void register_directory_commands(CommandRegistry& registry) {
    registry.add(std::make_unique<NodesCommand>());
    registry.add(std::make_unique<InfoCommand>());
    registry.add(std::make_unique<LocationCommand>());
}

} // namespace meshirc::commands
