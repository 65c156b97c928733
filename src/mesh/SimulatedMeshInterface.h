#pragma once

#include "mesh/MeshInterface.h"
#include "mesh/PacketIdGenerator.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace meshirc::mesh {

// In-memory stand-in for a radio. Runs its own io_context on a private thread
// and emits events from there, like a real mesh library callback would.
class SimulatedMeshInterface : public MeshInterface {
public:
    struct Timing {
        std::chrono::milliseconds ack_delay{1000};
        std::chrono::milliseconds pong_delay{1500};
        std::chrono::milliseconds chatter_interval{45000};
        std::chrono::milliseconds new_node_delay{60000};
    };

    static constexpr NodeNum kGatewayNum = 0xa1b2c3d4u;
    static constexpr NodeNum kMockNode1  = 12345678u;
    static constexpr NodeNum kMockNode2  = 87654321u;
    static constexpr NodeNum kNewNode    = 0x00c0ffeeu;

    SimulatedMeshInterface();
    explicit SimulatedMeshInterface(Timing timing);
    ~SimulatedMeshInterface() override;

    SimulatedMeshInterface(const SimulatedMeshInterface&) = delete;
    SimulatedMeshInterface& operator=(const SimulatedMeshInterface&) = delete;

    void start() override;
    void stop() override;

    void subscribe(EventSink sink) override;

    RequestId send_text(const Destination& dest, const std::string& text, bool want_ack) override;
    RequestId ping(NodeNum target) override;

    NodeNum my_node_num() const override { return kGatewayNum; }
    std::string describe() const override { return "Simulator"; }

private:
    struct SimNode {
        NodeUpdate info;
        std::chrono::seconds heard_ago{0};
    };

    void seed_nodes_();
    void emit_(MeshEvent event);
    void schedule_(std::chrono::milliseconds delay, std::function<void()> fn);
    void arm_chatter_();
    void simulate_new_node_();
    bool known_(NodeNum num) const;

    Timing timing_;

    boost::asio::io_context ioc_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    boost::asio::steady_timer chatter_timer_;
    std::thread thread_;
    bool running_ = false;

    mutable std::mutex mu_;
    std::map<NodeNum, SimNode> nodes_;
    EventSink sink_;
    unsigned msg_counter_ = 0;

    PacketIdGenerator ids_;
};

} // namespace meshirc::mesh
