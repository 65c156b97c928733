#include "commands/BuiltinCommands.h"

#include "util/Log.hpp"

#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace meshirc::commands {

namespace {

// Runs a DataLookup off the server thread and NOTICEs the lines back.
class LookupCommand : public Command {
public:
    using Accessor = lookup::DataLookup* (BridgeContext::*)() const noexcept;

    LookupCommand(std::string name, std::string help, Accessor accessor, std::string failure_text)
        : Command(std::move(name), std::move(help)),
          accessor_(accessor),
          failure_text_(std::move(failure_text)) {}

    void execute(BridgeContext& ctx, const Invocation& inv) override {
        lookup::DataLookup* source = (ctx.*accessor_)();
        if (!source) {
            ctx.reply(inv.nick, name() + " command is not available.");
            return;
        }
        if (auto problem = source->configuration_problem()) {
            util::log_warning(name()) << name() << " executed but not configured";
            ctx.reply(inv.nick, *problem);
            return;
        }

        ctx.reply(inv.nick, source->progress_line());

        auto work = [source, tag = name(), failure = failure_text_]() -> std::vector<std::string> {
            try {
                return source->fetch();
            } catch (const lookup::LookupError& e) {
                return {e.what()};
            } catch (const std::exception& e) {
                util::log_error(tag) << "Lookup failed: " << e.what();
                return {failure};
            }
        };

        networking::BackgroundRunner* runner = ctx.background();
        if (!runner) {
            ctx.reply(inv.nick, work());
            return;
        }
        runner->submit(std::move(work), [&ctx, nick = inv.nick](std::vector<std::string> lines) {
            ctx.reply(nick, lines);
        });
    }

private:
    Accessor accessor_;
    std::string failure_text_;
};

} // namespace

void register_lookup_commands(CommandRegistry& registry) {
    registry.add(std::make_unique<LookupCommand>(
        "WEATHER", "WEATHER - Shows current weather conditions (OpenWeatherMap)",
        &BridgeContext::weather, "Error processing weather data."));
    registry.add(std::make_unique<LookupCommand>(
        "HFCONDITIONS", "HFCONDITIONS - Shows current Solar/HF propagation indicators (NOAA SWPC)",
        &BridgeContext::hf_conditions, "Error processing HF conditions data."));
}

} // namespace meshirc::commands
