#include "commands/CommandRegistry.h"

#include "util/Log.hpp"
#include "util/Strings.hpp"

#include <utility>

namespace meshirc::commands {

void CommandRegistry::add(std::unique_ptr<Command> command) {
    if (!command) return;
    const std::string key = util::to_upper(command->name());
    auto it = commands_.find(key);
    if (it != commands_.end()) {
        util::log_warning("commands") << "Command '" << key << "' registered twice; keeping the latest";
        it->second = std::move(command);
        return;
    }
    util::log_debug("commands") << "Registered command " << key;
    commands_.emplace(key, std::move(command));
}

Command* CommandRegistry::find(std::string_view name) const {
    auto it = commands_.find(util::to_upper(name));
    return it == commands_.end() ? nullptr : it->second.get();
}

std::vector<std::string> CommandRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(commands_.size());
    for (const auto& [name, cmd] : commands_) out.push_back(name);
    return out;
}

} // namespace meshirc::commands
