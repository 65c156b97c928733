#pragma once

#include "commands/CommandRegistry.h"

namespace meshirc::commands {

void register_mesh_commands(CommandRegistry& registry);       // SEND, ALARM, DM, PING
void register_directory_commands(CommandRegistry& registry);  // NODES, INFO, LOCATION
void register_local_commands(CommandRegistry& registry);      // TIME, STATS, HELP
void register_lookup_commands(CommandRegistry& registry);     // WEATHER, HFCONDITIONS

// All of the above.
void register_builtin_commands(CommandRegistry& registry);

} // namespace meshirc::commands
