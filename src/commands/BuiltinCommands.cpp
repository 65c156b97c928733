#include "commands/BuiltinCommands.h"

namespace meshirc::commands {

void register_builtin_commands(CommandRegistry& registry) {
    register_mesh_commands(registry);
    register_directory_commands(registry);
    register_local_commands(registry);
    register_lookup_commands(registry);
}

} // namespace meshirc::commands
