#include "mesh/SimulatedMeshInterface.h"

#include "util/Log.hpp"

#include <boost/asio/post.hpp>

#include <memory>
#include <utility>
#include <vector>

namespace meshirc::mesh {

namespace asio = boost::asio;

namespace {

NodeUpdate make_node(NodeNum num, std::string long_name, std::string short_name) {
    NodeUpdate n;
    n.id = node_id_string(num);
    n.long_name = std::move(long_name);
    n.short_name = std::move(short_name);
    n.hw_model = "SIMULATED";
    return n;
}

} // namespace

SimulatedMeshInterface::SimulatedMeshInterface()
    : SimulatedMeshInterface(Timing{}) {}

SimulatedMeshInterface::SimulatedMeshInterface(Timing timing)
    : timing_(timing),
      chatter_timer_(ioc_) {
    seed_nodes_();
    util::log_info("Mock Mesh") << "Initialized simulated mesh interface";
}

SimulatedMeshInterface::~SimulatedMeshInterface() {
    stop();
}

void SimulatedMeshInterface::seed_nodes_() {
    SimNode gw{make_node(kGatewayNum, "My Gateway Node", "GW"), std::chrono::seconds(0)};
    Position pos;
    pos.latitude = 42.886;
    pos.longitude = -79.249;
    pos.altitude = 180;
    pos.time = WallClock::now();
    gw.info.position = pos;
    gw.info.snr = 0.0f;

    SimNode mk1{make_node(kMockNode1, "Mock Node 1", "MK1"), std::chrono::seconds(60)};
    mk1.info.snr = 10.0f;
    mk1.info.rssi = -72;

    SimNode mk2{make_node(kMockNode2, "Mock Node 2", "MK2"), std::chrono::seconds(120)};
    mk2.info.snr = -5.5f;
    mk2.info.rssi = -110;
    DeviceMetrics metrics;
    metrics.battery_level = 76;
    metrics.voltage = 3.92f;
    metrics.air_util_tx = 1.4f;
    metrics.channel_utilization = 7.8f;
    metrics.uptime_seconds = 86400u + 3600u;
    mk2.info.metrics = metrics;

    std::lock_guard<std::mutex> lk(mu_);
    nodes_[kGatewayNum] = std::move(gw);
    nodes_[kMockNode1] = std::move(mk1);
    nodes_[kMockNode2] = std::move(mk2);
}

void SimulatedMeshInterface::start() {
    if (running_) return;
    running_ = true;

    ioc_.restart();
    work_.emplace(asio::make_work_guard(ioc_));

    asio::post(ioc_, [this] {
        emit_(ConnectionStatus{"Connected to simulated mesh"});

        std::vector<NodeHeard> seeded;
        {
            std::lock_guard<std::mutex> lk(mu_);
            const auto now = WallClock::now();
            for (const auto& [num, node] : nodes_) {
                NodeHeard ev{num, node.info};
                ev.update.heard_at = now - node.heard_ago;
                seeded.push_back(std::move(ev));
            }
        }
        for (auto& ev : seeded) emit_(std::move(ev));
    });

    arm_chatter_();
    schedule_(timing_.new_node_delay, [this] { simulate_new_node_(); });

    thread_ = std::thread([this] { ioc_.run(); });
}

void SimulatedMeshInterface::stop() {
    if (!running_) return;
    running_ = false;

    work_.reset();
    ioc_.stop();
    if (thread_.joinable()) thread_.join();
    util::log_info("Mock Mesh") << "Simulated mesh interface stopped";
}

void SimulatedMeshInterface::subscribe(EventSink sink) {
    std::lock_guard<std::mutex> lk(mu_);
    sink_ = std::move(sink);
    util::log_info("Mock Mesh") << "Registered receive callback";
}

RequestId SimulatedMeshInterface::send_text(const Destination& dest, const std::string& text, bool want_ack) {
    if (text.empty()) throw MeshError("refusing to send an empty payload");

    const RequestId id = ids_.next();

    if (dest.is_broadcast()) {
        util::log_info("Mock Mesh") << "Sending to channel " << dest.channel_index << ": '" << text << "'";
        return id;
    }

    const NodeNum target = dest.node_num;
    util::log_info("Mock Mesh") << "Sending DM '" << text << "' to " << node_id_string(target)
                                << " (want_ack=" << (want_ack ? "true" : "false") << ")";
    if (!want_ack) return id;

    if (known_(target)) {
        schedule_(timing_.ack_delay, [this, id, target] {
            util::log_info("Mock Mesh") << "Simulating ACK for request " << id;
            emit_(DeliveryAcknowledged{id, target});
        });
    } else {
        schedule_(timing_.ack_delay, [this, id] {
            emit_(DeliveryFailed{id, "NO_ROUTE"});
        });
    }
    return id;
}

RequestId SimulatedMeshInterface::ping(NodeNum target) {
    if (!known_(target)) {
        util::log_warning("Mock Mesh") << "Cannot send ping, node " << node_id_string(target) << " unknown";
        throw MeshError("node " + node_id_string(target) + " is unknown to the radio");
    }

    const RequestId id = ids_.next();
    util::log_info("Mock Mesh") << "Sending ping to " << node_id_string(target) << " (request " << id << ")";

    schedule_(timing_.pong_delay, [this, id, target] {
        SignalInfo signal;
        signal.rssi = -65;
        signal.snr = 9.0f;
        emit_(PingReply{id, target, signal});
    });
    return id;
}

bool SimulatedMeshInterface::known_(NodeNum num) const {
    std::lock_guard<std::mutex> lk(mu_);
    return nodes_.count(num) != 0;
}

void SimulatedMeshInterface::emit_(MeshEvent event) {
    EventSink sink;
    {
        std::lock_guard<std::mutex> lk(mu_);
        sink = sink_;
    }
    if (sink) sink(std::move(event));
}

void SimulatedMeshInterface::schedule_(std::chrono::milliseconds delay, std::function<void()> fn) {
    auto timer = std::make_shared<asio::steady_timer>(ioc_, delay);
    timer->async_wait([timer, fn = std::move(fn)](const boost::system::error_code& ec) {
        if (!ec) fn();
    });
}

void SimulatedMeshInterface::arm_chatter_() {
    chatter_timer_.expires_after(timing_.chatter_interval);
    chatter_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) return;

        MessageReceived msg;
        {
            std::lock_guard<std::mutex> lk(mu_);
            ++msg_counter_;
            msg.from = kMockNode1;
            msg.to = kBroadcastNum;
            msg.channel = 0;
            msg.text = "Simulated mesh message #" + std::to_string(msg_counter_) + ".";
            msg.signal.rssi = -70 + static_cast<int>(msg_counter_ % 20);
            msg.signal.snr = 8.5f - 0.5f * static_cast<float>(msg_counter_ % 20);
            msg.rx_time = WallClock::now();
        }
        util::log_info("Mock Mesh") << "Simulating incoming '" << msg.text << "' from "
                                    << node_id_string(msg.from) << " on ch " << msg.channel;
        emit_(std::move(msg));
        arm_chatter_();
    });
}

void SimulatedMeshInterface::simulate_new_node_() {
    NodeHeard ev{kNewNode, make_node(kNewNode, "Newly Seen Node", "NEW")};
    ev.update.snr = 5.0f;
    ev.update.heard_at = WallClock::now();
    {
        std::lock_guard<std::mutex> lk(mu_);
        nodes_[kNewNode] = SimNode{ev.update, std::chrono::seconds(0)};
    }
    util::log_info("Mock Mesh") << "Simulating new node appearing: " << node_id_string(kNewNode);
    emit_(std::move(ev));
}

} // namespace meshirc::mesh
