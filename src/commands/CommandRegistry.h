#pragma once

#include "commands/Command.h"

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace meshirc::commands {

// Case-insensitive name -> command. Filled once at startup.
class CommandRegistry {
public:
    // Replaces (with a warning) a command registered under the same name.
    void add(std::unique_ptr<Command> command);

    Command* find(std::string_view name) const;

    // Upper-cased, sorted.
    std::vector<std::string> names() const;
    std::size_t size() const noexcept { return commands_.size(); }

private:
    std::map<std::string, std::unique_ptr<Command>> commands_;
};

} // namespace meshirc::commands
