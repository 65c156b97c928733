#pragma once

#include "commands/BridgeContext.h"
#include "commands/CommandRegistry.h"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace meshirc::commands {

class ArgumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// POSIX shell-style word splitting: whitespace separates words, quotes group
// them, backslash escapes. Throws ArgumentError on an unmatched quote or a
// dangling backslash.
std::vector<std::string> split_arguments(std::string_view text);

// Turns control-room lines into command executions.
class Dispatcher {
public:
    Dispatcher(const CommandRegistry& registry, BridgeContext& ctx);

    // False when the first word is not a registered command; the caller then
    // treats the line as chat.
    bool handle_room_text(const std::string& nick, const std::string& text);

    // Runs the command registered under verb (any case). False, with nothing
    // sent, when no such command exists.
    bool dispatch(const std::string& nick, const std::string& verb, const std::string& argument_text);

private:
    const CommandRegistry& registry_;
    BridgeContext& ctx_;
};

} // namespace meshirc::commands
