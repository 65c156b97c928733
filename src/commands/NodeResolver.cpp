#include "commands/NodeResolver.h"

#include "util/Strings.hpp"

#include <cstdlib>
#include <functional>
#include <limits>

namespace meshirc::commands {

namespace {

using gateway::NodeRecord;

// Never-heard nodes rank oldest.
bool better_match(const NodeRecord& a, const NodeRecord& b) {
    if (a.last_heard != b.last_heard) {
        if (!a.last_heard) return false;
        if (!b.last_heard) return true;
        return *a.last_heard > *b.last_heard;
    }
    return a.num < b.num;
}

std::optional<NodeRecord> best_of(const std::vector<NodeRecord>& nodes,
                                  const std::function<bool(const NodeRecord&)>& pred) {
    const NodeRecord* best = nullptr;
    for (const auto& node : nodes) {
        if (!pred(node)) continue;
        if (!best || better_match(node, *best)) best = &node;
    }
    if (!best) return std::nullopt;
    return *best;
}

std::optional<mesh::NodeNum> parse_node_num(std::string_view token) {
    if (token.empty() || token.size() > 10) return std::nullopt;
    for (char c : token) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    const unsigned long long value = std::strtoull(std::string(token).c_str(), nullptr, 10);
    if (value > std::numeric_limits<mesh::NodeNum>::max()) return std::nullopt;
    return static_cast<mesh::NodeNum>(value);
}

} // namespace

std::optional<NodeRecord> resolve_node(const std::vector<NodeRecord>& nodes, std::string_view token) {
    if (token.empty()) return std::nullopt;

    if (auto hit = best_of(nodes, [&](const NodeRecord& n) { return n.id == token; })) return hit;
    if (auto hit = best_of(nodes, [&](const NodeRecord& n) {
            return !n.short_name.empty() && util::iequals(n.short_name, token);
        })) {
        return hit;
    }
    if (auto hit = best_of(nodes, [&](const NodeRecord& n) {
            return !n.long_name.empty() && util::iequals(n.long_name, token);
        })) {
        return hit;
    }
    if (auto num = parse_node_num(token)) {
        return best_of(nodes, [&](const NodeRecord& n) { return n.num == *num; });
    }
    return std::nullopt;
}

std::string node_label(const NodeRecord& node) {
    const std::string name = node.display_name();
    return name == node.id ? name : name + " (" + node.id + ")";
}

} // namespace meshirc::commands
