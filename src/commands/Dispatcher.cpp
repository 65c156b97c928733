#include "commands/Dispatcher.h"

#include "util/Log.hpp"
#include "util/Strings.hpp"

#include <exception>

namespace meshirc::commands {

std::vector<std::string> split_arguments(std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (util::is_space(c)) {
            if (in_word) {
                words.push_back(std::move(current));
                current.clear();
                in_word = false;
            }
            continue;
        }

        in_word = true;
        if (c == '\\') {
            if (++i >= text.size()) throw ArgumentError("No escaped character");
            current += text[i];
        } else if (c == '\'') {
            const std::size_t close = text.find('\'', i + 1);
            if (close == std::string_view::npos) throw ArgumentError("No closing quotation");
            current.append(text.substr(i + 1, close - i - 1));
            i = close;
        } else if (c == '"') {
            bool closed = false;
            for (++i; i < text.size(); ++i) {
                if (text[i] == '"') {
                    closed = true;
                    break;
                }
                if (text[i] == '\\' && i + 1 < text.size() && (text[i + 1] == '"' || text[i + 1] == '\\')) ++i;
                current += text[i];
            }
            if (!closed) throw ArgumentError("No closing quotation");
        } else {
            current += c;
        }
    }
    if (in_word) words.push_back(std::move(current));
    return words;
}

Dispatcher::Dispatcher(const CommandRegistry& registry, BridgeContext& ctx)
    : registry_(registry), ctx_(ctx) {}

bool Dispatcher::handle_room_text(const std::string& nick, const std::string& text) {
    auto [word, rest] = util::split_first_word(text);
    if (word.empty()) return false;
    return dispatch(nick, word, rest);
}

bool Dispatcher::dispatch(const std::string& nick, const std::string& verb, const std::string& argument_text) {
    Command* command = registry_.find(verb);
    if (!command) return false;

    Invocation inv;
    inv.nick = nick;
    inv.verb = util::to_upper(verb);
    try {
        inv.args = split_arguments(argument_text);
    } catch (const ArgumentError& e) {
        util::log_warning("dispatch") << "Argument parsing error for '" << argument_text << "' from " << nick
                                      << ": " << e.what();
        ctx_.reply(nick, std::string("Error parsing arguments: ") + e.what());
        return true;
    }

    util::log_info("dispatch") << "Executing command '" << inv.verb << "' for " << nick << " with "
                               << inv.args.size() << " argument(s)";
    try {
        command->execute(ctx_, inv);
    } catch (const std::exception& e) {
        util::log_error("dispatch") << "Error executing command '" << inv.verb << "' for " << nick << ": " << e.what();
        ctx_.reply(nick, "Error executing command " + inv.verb + ": " + e.what());
    }
    return true;
}

} // namespace meshirc::commands
