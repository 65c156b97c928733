#include "Version.h"
#include "chat/ChatServer.h"
#include "commands/BridgeContext.h"
#include "commands/BuiltinCommands.h"
#include "commands/CommandRegistry.h"
#include "commands/Dispatcher.h"
#include "config/GatewayConfig.h"
#include "gateway/MeshEventRelay.h"
#include "gateway/NodeDirectory.h"
#include "gateway/RequestCorrelator.h"
#include "lookup/HfConditionsLookup.h"
#include "lookup/WeatherLookup.h"
#include "mesh/SimulatedMeshInterface.h"
#include "networking/BackgroundRunner.hpp"
#include "networking/LineServer.h"
#include "networking/PeriodicTimer.hpp"
#include "util/Log.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>

namespace {

constexpr std::size_t kLookupThreads = 2;
constexpr std::chrono::seconds kRegistrationCheck{5};
constexpr std::chrono::seconds kShutdownGrace{3};

} // namespace

int main(int argc, char* argv[]) {
    using namespace meshirc;

    config::GatewayConfig cfg = config::default_config();
    try {
        const config::CommandLine cli = config::parse_command_line(argc, argv, cfg);
        if (cli.show_help) {
            std::cout << "meshirc_gateway " << MESHIRC_VERSION << "\n" << cli.usage;
            return 0;
        }
        util::Log::set_level(cfg.verbose ? util::LogLevel::Debug : util::LogLevel::Info);
        for (const auto& warning : config::validate_config(cfg)) util::log_warning("config") << warning;
    } catch (const config::ConfigError& e) {
        std::cerr << "[MeshIrcGateway] configuration error: " << e.what() << "\n";
        return 1;
    }

    boost::asio::io_context ioc;

    mesh::SimulatedMeshInterface mesh;
    gateway::NodeDirectory directory;
    gateway::RequestCorrelator correlator;

    std::unique_ptr<networking::LineServer> transport;
    try {
        transport = std::make_unique<networking::LineServer>(ioc, cfg.irc.host, cfg.irc.port);
    } catch (const boost::system::system_error& e) {
        util::log_error("MeshIrcGateway") << "Cannot listen on " << cfg.irc.host << ":" << cfg.irc.port << ": "
                                          << e.what();
        return 1;
    }

    chat::ChatServerOptions chat_options;
    chat_options.server_name = cfg.irc.server_name;
    chat_options.room = cfg.irc.control_channel;
    chat_options.version = std::string("meshirc-") + MESHIRC_VERSION;
    chat_options.registration_timeout = cfg.irc.registration_timeout;
    chat::ChatServer chat(*transport, chat_options);

    commands::CommandRegistry registry;
    commands::register_builtin_commands(registry);

    commands::BridgeSettings settings;
    settings.default_channel = cfg.mesh.default_channel;
    settings.ack_timeout = cfg.mesh.ack_timeout;
    settings.ping_timeout = cfg.mesh.ping_timeout;
    commands::BridgeContext ctx(directory, correlator, mesh, chat, registry, settings);

    networking::BackgroundRunner workers(ioc, kLookupThreads);
    lookup::WeatherLookup weather(cfg.weather);
    lookup::HfConditionsLookup hf(cfg.hf);
    ctx.set_background(&workers);
    ctx.set_weather(&weather);
    ctx.set_hf_conditions(&hf);

    commands::Dispatcher dispatcher(registry, ctx);

    gateway::RelayOptions relay_options;
    relay_options.queue_capacity = cfg.mesh.event_queue_capacity;
    relay_options.sweep_interval = cfg.mesh.sweep_interval;
    relay_options.announce_new_nodes = cfg.mesh.announce_new_nodes;
    gateway::MeshEventRelay relay(ioc, directory, correlator, chat, mesh, relay_options);

    transport->set_on_connect([&](networking::ClientId id, const std::string& host) {
        chat.accept_connection(id, host);
    });
    transport->set_on_line([&](networking::ClientId id, const std::string& line) {
        chat.handle_line(id, line);
    });
    transport->set_on_disconnect([&](networking::ClientId id) {
        chat.connection_lost(id);
    });

    chat.set_command_hook([&](const std::string& nick, const std::string& text) {
        return dispatcher.handle_room_text(nick, text);
    });
    chat.set_departure_hook([&](const std::string& nick) {
        if (auto dropped = correlator.drop_requester(nick)) {
            util::log_info("MeshIrcGateway") << "Dropped " << dropped << " pending request(s) for " << nick;
        }
    });
    chat.set_rename_hook([&](const std::string& old_nick, const std::string& new_nick) {
        correlator.rename_requester(old_nick, new_nick);
    });

    networking::PeriodicTimer registration_timer(ioc, kRegistrationCheck, [&] {
        chat.expire_unregistered(chat::ChatServer::Clock::now());
    });

    relay.attach();
    try {
        mesh.start();
    } catch (const mesh::MeshError& e) {
        util::log_error("MeshIrcGateway") << "Mesh interface failed to start: " << e.what();
        return 1;
    }
    util::log_info("MeshIrcGateway") << "Mesh interface: " << mesh.describe();

    relay.start_sweeping();
    registration_timer.start();
    transport->start();

    // Graceful shutdown on Ctrl+C / SIGTERM
    boost::asio::steady_timer grace(ioc);
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) return;
        util::log_info("MeshIrcGateway") << "shutting down...";
        chat.disconnect_all("Server shutting down");
        registration_timer.stop();
        relay.stop_sweeping();
        mesh.stop();
        transport->stop();

        grace.expires_after(kShutdownGrace);
        grace.async_wait([&](const boost::system::error_code& wait_ec) {
            if (!wait_ec) ioc.stop();
        });
    });

    util::log_info("MeshIrcGateway") << "IRC server " << cfg.irc.server_name << " listening on " << cfg.irc.host
                                     << ":" << cfg.irc.port << ", control channel " << cfg.irc.control_channel;
    ioc.run();

    workers.stop();
    util::log_info("MeshIrcGateway") << "exit.";
    return 0;
}
