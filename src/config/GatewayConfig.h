#pragma once

#include "lookup/HfConditionsLookup.h"
#include "lookup/WeatherLookup.h"

#include <boost/json/value.hpp>

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace meshirc::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct IrcConfig {
    std::string host = "0.0.0.0";
    unsigned short port = 6667;
    std::string server_name = "meshirc.gw";
    std::string control_channel = "#meshtastic-ctrl";
    std::chrono::seconds registration_timeout{60};
};

struct MeshConfig {
    std::string transport = "simulator";
    std::string device_port;   // e.g. /dev/ttyUSB0; empty when unset
    std::string device_host;   // e.g. 192.168.1.100; empty when unset
    int default_channel = 0;
    std::chrono::seconds ack_timeout{30};
    std::chrono::seconds ping_timeout{30};
    std::chrono::milliseconds sweep_interval{1000};
    std::size_t event_queue_capacity = 1024;
    bool announce_new_nodes = true;
};

struct GatewayConfig {
    IrcConfig irc;
    MeshConfig mesh;
    lookup::WeatherSettings weather;
    lookup::HfConditionsSettings hf;
    bool verbose = false;
};

// Built-in defaults plus WEATHER_API_KEY from the environment.
GatewayConfig default_config();

// Overlays the sections present in a JSON document:
//   { "irc": {...}, "mesh": {...}, "weather": {...}, "hf": {...}, "log": {...} }
// Throws ConfigError on a wrong type or an out-of-range value.
void apply_config_json(GatewayConfig& cfg, const boost::json::value& doc);

void load_config_file(GatewayConfig& cfg, const std::string& path);

struct CommandLine {
    bool show_help = false;
    std::string usage;
    std::string config_path;
};

// Defaults, then --config <file>, then the remaining options. Throws
// ConfigError on unknown options or bad values.
CommandLine parse_command_line(int argc, const char* const argv[], GatewayConfig& cfg);

// Returns human-readable warnings; throws ConfigError for fatal problems.
// Unsupported mesh transports are switched to the simulator.
std::vector<std::string> validate_config(GatewayConfig& cfg);

} // namespace meshirc::config
