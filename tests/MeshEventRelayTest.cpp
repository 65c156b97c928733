#include "gateway/MeshEventRelay.h"

#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace meshirc;
using meshirc::test::register_client;
using meshirc::test::TestBridge;

namespace {

const std::string kRoomHead = ":meshirc.gw!meshirc.gw@meshirc.gw PRIVMSG #meshtastic-ctrl :";

class MeshEventRelayTest : public ::testing::Test {
protected:
    MeshEventRelayTest() {
        bridge.add_node(12345678, "MK1", "Mock Node 1");
        register_client(bridge.chat, 1, "alice");
        register_client(bridge.chat, 2, "bob");
        bridge.transport.clear();
    }

    mesh::MessageReceived message(mesh::NodeNum to, const std::string& text) {
        mesh::MessageReceived m;
        m.from = 12345678;
        m.to = to;
        m.channel = 0;
        m.text = text;
        m.signal.rssi = -72;
        m.signal.snr = 6.5f;
        return m;
    }

    TestBridge bridge;
};

} // namespace

TEST_F(MeshEventRelayTest, BroadcastTextReachesEveryOperator) {
    bridge.mesh.emit(message(mesh::kBroadcastNum, "hello from the hill"));
    EXPECT_TRUE(bridge.transport.sent.empty());
    bridge.pump();

    const std::string expected = kRoomHead + "[MESH Rx ch0 RSSI:-72 SNR:6.5] <MK1> hello from the hill";
    EXPECT_EQ(bridge.transport.lines(1), std::vector<std::string>{expected});
    EXPECT_EQ(bridge.transport.lines(2), std::vector<std::string>{expected});
}

TEST_F(MeshEventRelayTest, DirectMessageToGateway) {
    auto m = message(bridge.mesh.self, "psst");
    m.signal = mesh::SignalInfo{};
    bridge.mesh.emit(m);
    bridge.pump();

    EXPECT_EQ(bridge.transport.lines(1),
              std::vector<std::string>{kRoomHead + "[MESH Rx ch0 RSSI:N/A SNR:N/A] DM From <MK1>: psst"});
}

TEST_F(MeshEventRelayTest, DirectMessageToAnotherNodeIsNotRelayed) {
    bridge.mesh.emit(message(87654321, "not for us"));
    bridge.pump();
    EXPECT_TRUE(bridge.transport.sent.empty());
}

TEST_F(MeshEventRelayTest, TextFromUnknownSenderUsesNodeId) {
    auto m = message(mesh::kBroadcastNum, "hi");
    m.from = 0x0badf00d;
    bridge.mesh.emit(m);
    bridge.pump();

    EXPECT_TRUE(bridge.transport.received(1, "] <!0badf00d> hi"));
    EXPECT_TRUE(bridge.directory.lookup(0x0badf00d).has_value());
}

TEST_F(MeshEventRelayTest, NewNodeIsAnnouncedOnce) {
    mesh::NodeHeard heard;
    heard.num = 0x00c0ffee;
    heard.update.short_name = "NEW";
    bridge.mesh.emit(heard);
    bridge.mesh.emit(heard);
    bridge.pump();

    EXPECT_EQ(bridge.transport.lines(1),
              std::vector<std::string>{kRoomHead + "[MESH] New node heard: NEW (!00c0ffee)"});
    EXPECT_EQ(bridge.directory.size(), 2u);
}

TEST_F(MeshEventRelayTest, HeardEventWithoutTimestampRefreshesLastHeard) {
    EXPECT_FALSE(bridge.directory.lookup(12345678)->last_heard.has_value());

    const auto before = mesh::WallClock::now();
    bridge.mesh.emit(mesh::NodeHeard{12345678, {}});
    mesh::NodeHeard fresh;
    fresh.num = 7;
    fresh.update.short_name = "N7";
    bridge.mesh.emit(fresh);
    bridge.pump();

    for (mesh::NodeNum num : {mesh::NodeNum{12345678}, mesh::NodeNum{7}}) {
        const auto rec = bridge.directory.lookup(num);
        ASSERT_TRUE(rec.has_value());
        ASSERT_TRUE(rec->last_heard.has_value()) << num;
        EXPECT_GE(*rec->last_heard, before);
    }
}

TEST_F(MeshEventRelayTest, UncorrelatedPongGoesToRoom) {
    mesh::PingReply reply;
    reply.id = 0;
    reply.from = 12345678;
    reply.signal.rssi = -65;
    reply.signal.snr = 9.0f;
    bridge.mesh.emit(reply);
    bridge.pump();

    EXPECT_EQ(bridge.transport.lines(2),
              std::vector<std::string>{kRoomHead + "[PING] PONG reply from <MK1> RSSI:-65 SNR:9.0"});
}

TEST_F(MeshEventRelayTest, StatusIsAnnounced) {
    bridge.mesh.emit(mesh::ConnectionStatus{"Connected to Fake"});
    bridge.pump();
    EXPECT_TRUE(bridge.transport.received(1, "[MESH] Mesh Status: Connected to Fake"));
}

TEST_F(MeshEventRelayTest, OutcomeForUnknownRequestIsIgnored) {
    bridge.mesh.emit(mesh::DeliveryAcknowledged{999, 12345678});
    bridge.mesh.emit(mesh::DeliveryFailed{998, "NO_ROUTE"});
    EXPECT_EQ(bridge.pump(), 1u);
    EXPECT_TRUE(bridge.transport.sent.empty());
}

TEST_F(MeshEventRelayTest, EventsFromOtherThreadsAreDrainedInOrder) {
    std::thread radio([this] {
        for (int i = 0; i < 50; ++i) bridge.mesh.emit(message(mesh::kBroadcastNum, "msg " + std::to_string(i)));
    });
    radio.join();
    bridge.pump();

    const auto& lines = bridge.transport.lines(1);
    ASSERT_EQ(lines.size(), 50u);
    EXPECT_NE(lines.front().find("<MK1> msg 0"), std::string::npos);
    EXPECT_NE(lines.back().find("<MK1> msg 49"), std::string::npos);
}

TEST(MeshEventRelay, FullQueueDropsOldest) {
    boost::asio::io_context ioc;
    test::FakeTransport transport;
    test::FakeMesh mesh;
    gateway::NodeDirectory directory;
    gateway::RequestCorrelator correlator;
    chat::ChatServer chat(transport, chat::ChatServerOptions{});
    gateway::RelayOptions options;
    options.queue_capacity = 2;
    options.announce_new_nodes = false;
    gateway::MeshEventRelay relay(ioc, directory, correlator, chat, mesh, options);
    relay.attach();

    for (mesh::NodeNum n = 1; n <= 5; ++n) mesh.emit(mesh::NodeHeard{n, {}});
    ioc.poll();

    EXPECT_EQ(relay.dropped_events(), 3u);
    EXPECT_FALSE(directory.lookup(1).has_value());
    EXPECT_TRUE(directory.lookup(4).has_value());
    EXPECT_TRUE(directory.lookup(5).has_value());
}
