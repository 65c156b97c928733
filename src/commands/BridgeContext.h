#pragma once

#include "chat/ChatServer.h"
#include "gateway/NodeDirectory.h"
#include "gateway/RequestCorrelator.h"
#include "lookup/DataLookup.h"
#include "mesh/MeshInterface.h"
#include "networking/BackgroundRunner.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace meshirc::commands {

class CommandRegistry;

struct BridgeSettings {
    int default_channel = 0;
    std::chrono::seconds ack_timeout{30};
    std::chrono::seconds ping_timeout{30};
};

// Everything a command handler may touch. Owned by main; handlers only
// borrow it for the duration of execute() (or of a posted completion).
class BridgeContext {
public:
    using SteadyClock = std::chrono::steady_clock;

    BridgeContext(gateway::NodeDirectory& directory,
                  gateway::RequestCorrelator& correlator,
                  mesh::MeshInterface& mesh,
                  chat::ChatServer& chat,
                  const CommandRegistry& registry,
                  BridgeSettings settings)
        : directory_(directory),
          correlator_(correlator),
          mesh_(mesh),
          chat_(chat),
          registry_(registry),
          settings_(settings),
          started_wall_(std::chrono::system_clock::now()),
          started_(SteadyClock::now()) {}

    gateway::NodeDirectory& directory() noexcept { return directory_; }
    gateway::RequestCorrelator& correlator() noexcept { return correlator_; }
    mesh::MeshInterface& mesh() noexcept { return mesh_; }
    chat::ChatServer& chat() noexcept { return chat_; }
    const CommandRegistry& registry() const noexcept { return registry_; }
    const BridgeSettings& settings() const noexcept { return settings_; }

    std::chrono::system_clock::time_point started_wall() const noexcept { return started_wall_; }
    std::chrono::seconds uptime() const {
        return std::chrono::duration_cast<std::chrono::seconds>(SteadyClock::now() - started_);
    }

    // Optional collaborators, wired by main.
    void set_background(networking::BackgroundRunner* runner) noexcept { background_ = runner; }
    void set_weather(lookup::DataLookup* lookup) noexcept { weather_ = lookup; }
    void set_hf_conditions(lookup::DataLookup* lookup) noexcept { hf_ = lookup; }

    networking::BackgroundRunner* background() const noexcept { return background_; }
    lookup::DataLookup* weather() const noexcept { return weather_; }
    lookup::DataLookup* hf_conditions() const noexcept { return hf_; }

    void reply(std::string_view nick, const std::string& text) { chat_.send_to_session(nick, text); }
    void reply(std::string_view nick, const std::vector<std::string>& lines) {
        for (const auto& line : lines) chat_.send_to_session(nick, line);
    }

private:
    gateway::NodeDirectory& directory_;
    gateway::RequestCorrelator& correlator_;
    mesh::MeshInterface& mesh_;
    chat::ChatServer& chat_;
    const CommandRegistry& registry_;
    BridgeSettings settings_;

    std::chrono::system_clock::time_point started_wall_;
    SteadyClock::time_point started_;

    networking::BackgroundRunner* background_ = nullptr;
    lookup::DataLookup* weather_ = nullptr;
    lookup::DataLookup* hf_ = nullptr;
};

} // namespace meshirc::commands
