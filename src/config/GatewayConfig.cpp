#include "config/GatewayConfig.h"

#include "util/Log.hpp"

#include <boost/json.hpp>
#include <boost/program_options.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string_view>

namespace meshirc::config {

namespace json = boost::json;
namespace po = boost::program_options;

namespace {

std::string key_name(std::string_view section, std::string_view key) {
    return std::string(section) + "." + std::string(key);
}

const json::object* section_of(const json::object& root, std::string_view name) {
    const json::value* v = root.if_contains(name);
    if (!v) return nullptr;
    if (!v->is_object()) throw ConfigError("config: '" + std::string(name) + "' must be an object");
    return &v->get_object();
}

void read_string(const json::object& sec, std::string_view section, std::string_view key, std::string& out) {
    const json::value* v = sec.if_contains(key);
    if (!v) return;
    if (v->is_null()) {
        out.clear();
        return;
    }
    const json::string* s = v->if_string();
    if (!s) throw ConfigError("config: " + key_name(section, key) + " must be a string");
    out.assign(s->data(), s->size());
}

std::optional<long long> read_integer(const json::object& sec, std::string_view section, std::string_view key,
                                      long long min, long long max) {
    const json::value* v = sec.if_contains(key);
    if (!v) return std::nullopt;

    long long value = 0;
    if (v->is_int64()) {
        value = v->get_int64();
    } else if (v->is_uint64() && v->get_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<long long>::max())) {
        value = static_cast<long long>(v->get_uint64());
    } else {
        throw ConfigError("config: " + key_name(section, key) + " must be an integer");
    }
    if (value < min || value > max) {
        throw ConfigError("config: " + key_name(section, key) + " = " + std::to_string(value) +
                          " is out of range [" + std::to_string(min) + ", " + std::to_string(max) + "]");
    }
    return value;
}

void read_bool(const json::object& sec, std::string_view section, std::string_view key, bool& out) {
    const json::value* v = sec.if_contains(key);
    if (!v) return;
    if (!v->is_bool()) throw ConfigError("config: " + key_name(section, key) + " must be true or false");
    out = v->get_bool();
}

unsigned short checked_port(long long value, const std::string& what) {
    if (value < 1 || value > 65535) {
        throw ConfigError(what + " " + std::to_string(value) + " is out of range [1, 65535]");
    }
    return static_cast<unsigned short>(value);
}

} // namespace

GatewayConfig default_config() {
    GatewayConfig cfg;
    if (const char* key = std::getenv("WEATHER_API_KEY"); key && *key) cfg.weather.api_key = key;
    cfg.weather.location = "Port Colborne,CA";
    return cfg;
}

void apply_config_json(GatewayConfig& cfg, const json::value& doc) {
    const json::object* root = doc.if_object();
    if (!root) throw ConfigError("config: top level must be a JSON object");

    if (const json::object* irc = section_of(*root, "irc")) {
        read_string(*irc, "irc", "host", cfg.irc.host);
        if (auto port = read_integer(*irc, "irc", "port", 1, 65535)) cfg.irc.port = static_cast<unsigned short>(*port);
        read_string(*irc, "irc", "server_name", cfg.irc.server_name);
        read_string(*irc, "irc", "control_channel", cfg.irc.control_channel);
        if (auto t = read_integer(*irc, "irc", "registration_timeout_s", 1, 86400)) {
            cfg.irc.registration_timeout = std::chrono::seconds(*t);
        }
    }

    if (const json::object* mesh = section_of(*root, "mesh")) {
        read_string(*mesh, "mesh", "transport", cfg.mesh.transport);
        read_string(*mesh, "mesh", "device_port", cfg.mesh.device_port);
        read_string(*mesh, "mesh", "device_host", cfg.mesh.device_host);
        if (auto ch = read_integer(*mesh, "mesh", "default_channel", 0, 7)) cfg.mesh.default_channel = static_cast<int>(*ch);
        if (auto t = read_integer(*mesh, "mesh", "ack_timeout_s", 1, 3600)) cfg.mesh.ack_timeout = std::chrono::seconds(*t);
        if (auto t = read_integer(*mesh, "mesh", "ping_timeout_s", 1, 3600)) cfg.mesh.ping_timeout = std::chrono::seconds(*t);
        if (auto t = read_integer(*mesh, "mesh", "sweep_interval_ms", 10, 60000)) {
            cfg.mesh.sweep_interval = std::chrono::milliseconds(*t);
        }
        if (auto n = read_integer(*mesh, "mesh", "event_queue_capacity", 1, 1000000)) {
            cfg.mesh.event_queue_capacity = static_cast<std::size_t>(*n);
        }
        read_bool(*mesh, "mesh", "announce_new_nodes", cfg.mesh.announce_new_nodes);
    }

    if (const json::object* weather = section_of(*root, "weather")) {
        read_string(*weather, "weather", "api_key", cfg.weather.api_key);
        read_string(*weather, "weather", "location", cfg.weather.location);
        read_string(*weather, "weather", "units", cfg.weather.units);
        read_string(*weather, "weather", "url", cfg.weather.url);
        if (auto t = read_integer(*weather, "weather", "timeout_s", 1, 120)) cfg.weather.timeout = std::chrono::seconds(*t);
    }

    if (const json::object* hf = section_of(*root, "hf")) {
        read_string(*hf, "hf", "url", cfg.hf.url);
        if (auto t = read_integer(*hf, "hf", "timeout_s", 1, 120)) cfg.hf.timeout = std::chrono::seconds(*t);
    }

    if (const json::object* log = section_of(*root, "log")) {
        read_bool(*log, "log", "verbose", cfg.verbose);
    }
}

void load_config_file(GatewayConfig& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("config: cannot open '" + path + "'");
    std::ostringstream text;
    text << in.rdbuf();

    boost::system::error_code ec;
    json::value doc = json::parse(text.str(), ec);
    if (ec) throw ConfigError("config: '" + path + "' is not valid JSON: " + ec.message());

    apply_config_json(cfg, doc);
    util::log_info("config") << "Configuration loaded from " << path;
}

CommandLine parse_command_line(int argc, const char* const argv[], GatewayConfig& cfg) {
    po::options_description desc("Mesh IRC Gateway options");
    desc.add_options()
        ("help", "Show this help and exit")
        ("config,c", po::value<std::string>(), "JSON configuration file")
        ("host,H", po::value<std::string>(), "IRC server host address")
        ("port,p", po::value<int>(), "IRC server port")
        ("servername,n", po::value<std::string>(), "IRC server name")
        ("control-channel", po::value<std::string>(), "IRC control channel")
        ("mesh-port", po::value<std::string>(), "Mesh device serial port (e.g. /dev/ttyUSB0)")
        ("mesh-host", po::value<std::string>(), "Mesh device network host")
        ("mesh-channel", po::value<int>(), "Default mesh channel index for SEND/ALARM")
        ("verbose,v", po::bool_switch(), "Enable debug logging");

    CommandLine result;
    std::ostringstream usage;
    usage << desc;
    result.usage = usage.str();

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw ConfigError(std::string("command line: ") + e.what());
    }

    if (vm.count("help")) {
        result.show_help = true;
        return result;
    }

    if (vm.count("config")) {
        result.config_path = vm["config"].as<std::string>();
        load_config_file(cfg, result.config_path);
    }

    if (vm.count("host")) cfg.irc.host = vm["host"].as<std::string>();
    if (vm.count("port")) cfg.irc.port = checked_port(vm["port"].as<int>(), "--port");
    if (vm.count("servername")) cfg.irc.server_name = vm["servername"].as<std::string>();
    if (vm.count("control-channel")) cfg.irc.control_channel = vm["control-channel"].as<std::string>();
    if (vm.count("mesh-port")) cfg.mesh.device_port = vm["mesh-port"].as<std::string>();
    if (vm.count("mesh-host")) cfg.mesh.device_host = vm["mesh-host"].as<std::string>();
    if (vm.count("mesh-channel")) {
        const int ch = vm["mesh-channel"].as<int>();
        if (ch < 0 || ch > 7) throw ConfigError("--mesh-channel " + std::to_string(ch) + " is out of range [0, 7]");
        cfg.mesh.default_channel = ch;
    }
    if (vm["verbose"].as<bool>()) cfg.verbose = true;

    return result;
}

std::vector<std::string> validate_config(GatewayConfig& cfg) {
    std::vector<std::string> warnings;

    const std::string& room = cfg.irc.control_channel;
    if (room.size() < 2 || (room[0] != '#' && room[0] != '&') || room.find_first_of(" ,\x07") != std::string::npos) {
        throw ConfigError("control channel '" + room + "' must start with '#' or '&' and contain no spaces or commas");
    }
    if (cfg.irc.server_name.empty() || cfg.irc.server_name.find(' ') != std::string::npos) {
        throw ConfigError("server name '" + cfg.irc.server_name + "' must be a single non-empty word");
    }
    if (cfg.irc.port < 1024) {
        warnings.push_back("IRC port " + std::to_string(cfg.irc.port) +
                           " is below 1024; binding may require elevated privileges.");
    }

    if (!cfg.mesh.device_port.empty() && !cfg.mesh.device_host.empty()) {
        warnings.push_back("Both a mesh device port and host are set; the port takes precedence.");
    }
    if (cfg.mesh.transport != "simulator" || !cfg.mesh.device_port.empty() || !cfg.mesh.device_host.empty()) {
        warnings.push_back("Mesh transport '" + cfg.mesh.transport +
                           "' is not available in this build; using the built-in simulator.");
        cfg.mesh.transport = "simulator";
    }

    if (cfg.weather.api_key.empty()) {
        warnings.push_back("WEATHER_API_KEY is not set in the config file or environment. The WEATHER command will not function.");
    }
    if (cfg.weather.location.empty()) {
        warnings.push_back("Weather location is not set. The WEATHER command will not function.");
    }
    if (cfg.weather.units != "metric" && cfg.weather.units != "imperial") {
        throw ConfigError("weather.units must be 'metric' or 'imperial', got '" + cfg.weather.units + "'");
    }

    return warnings;
}

} // namespace meshirc::config
