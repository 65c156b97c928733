#pragma once

#include "commands/BridgeContext.h"

#include <string>
#include <utility>
#include <vector>

namespace meshirc::commands {

// One parsed control-room command.
struct Invocation {
    std::string nick;               // requester
    std::string verb;               // upper-cased command name
    std::vector<std::string> args;  // shell-style split
};

class Command {
public:
    Command(std::string name, std::string help)
        : name_(std::move(name)), help_(std::move(help)) {}
    virtual ~Command() = default;

    const std::string& name() const noexcept { return name_; }
    const std::string& help() const noexcept { return help_; }

    // May throw; the dispatcher reports the failure to the requester.
    virtual void execute(BridgeContext& ctx, const Invocation& inv) = 0;

protected:
    // "Usage: <help>" back to the requester.
    void usage(BridgeContext& ctx, const Invocation& inv) const { ctx.reply(inv.nick, "Usage: " + help_); }

private:
    std::string name_;
    std::string help_;
};

} // namespace meshirc::commands
