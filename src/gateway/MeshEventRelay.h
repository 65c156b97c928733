#pragma once

#include "chat/ChatServer.h"
#include "gateway/NodeDirectory.h"
#include "gateway/RequestCorrelator.h"
#include "mesh/EventQueue.hpp"
#include "mesh/MeshEvents.h"
#include "mesh/MeshInterface.h"
#include "networking/PeriodicTimer.hpp"

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace meshirc::gateway {

struct RelayOptions {
    std::size_t queue_capacity = 1024;
    std::chrono::milliseconds sweep_interval{1000};
    bool announce_new_nodes = true;
};

// Carries mesh events onto the server thread and turns them into chat
// traffic. subscribe() may be called from any thread; everything else runs
// on the server io_context.
class MeshEventRelay {
public:
    MeshEventRelay(boost::asio::io_context& ioc,
                   NodeDirectory& directory,
                   RequestCorrelator& correlator,
                   chat::ChatServer& chat,
                   mesh::MeshInterface& mesh,
                   RelayOptions options = {});

    MeshEventRelay(const MeshEventRelay&) = delete;
    MeshEventRelay& operator=(const MeshEventRelay&) = delete;

    // Subscribes to the mesh interface.
    void attach();

    // Queues an event and schedules a drain. Safe from any thread.
    void enqueue(mesh::MeshEvent event);

    // Handles everything queued so far.
    std::size_t drain();

    void handle(const mesh::MeshEvent& event);

    void start_sweeping();
    void stop_sweeping();
    std::size_t sweep(RequestCorrelator::Clock::time_point now);

    std::uint64_t dropped_events() const { return queue_.dropped(); }

private:
    void on_node_heard_(const mesh::NodeHeard& ev);
    void on_message_(const mesh::MessageReceived& ev);
    void on_resolved_(mesh::RequestId id, const Outcome& outcome);
    void on_ping_reply_(const mesh::PingReply& ev);
    void on_status_(const mesh::ConnectionStatus& ev);

    std::string sender_label_(mesh::NodeNum num) const;

    boost::asio::io_context& ioc_;
    NodeDirectory& directory_;
    RequestCorrelator& correlator_;
    chat::ChatServer& chat_;
    mesh::MeshInterface& mesh_;
    RelayOptions options_;

    mesh::EventQueue<mesh::MeshEvent> queue_;
    std::atomic<bool> drain_scheduled_{false};
    networking::PeriodicTimer sweeper_;
};

} // namespace meshirc::gateway
