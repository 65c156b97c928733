#pragma once

#include "gateway/NodeDirectory.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meshirc::commands {

// Finds the node a user meant by `token`. Tries, in order: exact node ID,
// short name, long name (both case-insensitive), decimal node number. The
// first step with a match wins; within a step the most recently heard node
// wins, then the lowest node number.
std::optional<gateway::NodeRecord> resolve_node(const std::vector<gateway::NodeRecord>& nodes,
                                                std::string_view token);

// "MK1 (!00bc614e)"
std::string node_label(const gateway::NodeRecord& node);

} // namespace meshirc::commands
