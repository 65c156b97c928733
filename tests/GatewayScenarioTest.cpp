#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

using namespace meshirc;
using meshirc::test::register_client;
using meshirc::test::TestBridge;

namespace {

std::size_t count_equal(const std::vector<std::string>& lines, const std::string& wanted) {
    return static_cast<std::size_t>(std::count(lines.begin(), lines.end(), wanted));
}

} // namespace

TEST(GatewayScenario, DirectMessageIsAcknowledgedExactlyOnce) {
    TestBridge bridge;
    bridge.add_node(12345678, "MK1", "Mock Node 1");
    register_client(bridge.chat, 1, "op");
    bridge.transport.clear();

    bridge.say(1, "DM MK1 hello");

    ASSERT_EQ(bridge.mesh.texts.size(), 1u);
    const auto sent = bridge.mesh.texts[0];
    EXPECT_EQ(sent.dest.node_num, 12345678u);
    EXPECT_EQ(sent.text, "hello");
    EXPECT_TRUE(sent.want_ack);

    auto lines = bridge.transport.notices(1);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "Sending DM 'hello' to MK1 (NodeNum: 12345678)...");
    EXPECT_EQ(lines[1], "DM request sent to MK1. Waiting for ACK/NAK...");

    bridge.mesh.emit(mesh::DeliveryAcknowledged{sent.id, 12345678});
    bridge.mesh.emit(mesh::DeliveryAcknowledged{sent.id, 12345678});
    bridge.pump();
    bridge.relay.sweep(gateway::RequestCorrelator::Clock::now() + std::chrono::minutes(5));

    lines = bridge.transport.notices(1);
    EXPECT_EQ(count_equal(lines, "[ACK] DM to MK1 (!00bc614e) delivered"), 1u);
    EXPECT_EQ(lines.size(), 3u);
    EXPECT_EQ(bridge.correlator.size(), 0u);
}

TEST(GatewayScenario, UnacknowledgedDirectMessageTimesOut) {
    commands::BridgeSettings settings;
    settings.ack_timeout = std::chrono::seconds(10);
    TestBridge bridge(settings);
    bridge.add_node(12345678, "MK1", "Mock Node 1");
    register_client(bridge.chat, 1, "op");
    bridge.say(1, "DM MK1 anyone home?");
    bridge.transport.clear();

    EXPECT_EQ(bridge.relay.sweep(gateway::RequestCorrelator::Clock::now() + std::chrono::seconds(11)), 1u);
    EXPECT_EQ(bridge.transport.notices(1),
              std::vector<std::string>{"[TIMEOUT] DM to MK1 (!00bc614e) not acknowledged after 10s"});

    // A late ACK finds nothing to resolve.
    bridge.mesh.emit(mesh::DeliveryAcknowledged{bridge.mesh.texts[0].id, 12345678});
    bridge.pump();
    EXPECT_EQ(bridge.transport.notices(1).size(), 1u);
}

TEST(GatewayScenario, NodesWithEmptyDirectory) {
    TestBridge bridge;
    register_client(bridge.chat, 1, "op");
    bridge.transport.clear();

    bridge.say(1, "NODES");

    EXPECT_EQ(bridge.transport.notices(1), (std::vector<std::string>{
        "--- Mesh Nodes ---",
        "No nodes currently known to the gateway.",
        "--- End of Node List ---",
    }));
}

TEST(GatewayScenario, NodesListsKnownNodes) {
    TestBridge bridge;
    bridge.add_node(12345678, "MK1", "Mock Node 1");
    register_client(bridge.chat, 1, "op");
    bridge.transport.clear();

    bridge.say(1, "NODES");

    const auto lines = bridge.transport.notices(1);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "Num: 12345678 | ID: !00bc614e | Name: Mock Node 1 (MK1) | SNR: N/A | LastHeard: Never");
}

TEST(GatewayScenario, NodesOrderedByLastHeard) {
    TestBridge bridge;
    const auto t1 = mesh::WallClock::now() - std::chrono::hours(2);
    const auto t2 = mesh::WallClock::now() - std::chrono::minutes(5);

    bridge.add_node(1, "NVR", "Never Heard");
    mesh::NodeUpdate older;
    older.short_name = "OLD";
    older.heard_at = t1;
    bridge.directory.upsert(3, older);
    mesh::NodeUpdate newer;
    newer.short_name = "NEW";
    newer.heard_at = t2;
    bridge.directory.upsert(2, newer);

    register_client(bridge.chat, 1, "op");
    bridge.transport.clear();
    bridge.say(1, "NODES");

    const auto lines = bridge.transport.notices(1);
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[1].rfind("Num: 2 | ", 0), 0u) << lines[1];
    EXPECT_EQ(lines[2].rfind("Num: 3 | ", 0), 0u) << lines[2];
    EXPECT_EQ(lines[3], "Num: 1 | ID: !00000001 | Name: Never Heard (NVR) | SNR: N/A | LastHeard: Never");
    EXPECT_EQ(lines[4], "--- End of Node List ---");
}

TEST(GatewayScenario, InfoWithHostileNodeNameStaysOnOneLinePerField) {
    TestBridge bridge;
    bridge.add_node(0xe5e5, "EV", "x\r\n:evil!e@e PRIVMSG #meshtastic-ctrl :spoofed");
    register_client(bridge.chat, 1, "op");
    bridge.transport.clear();

    bridge.say(1, "INFO EV");

    for (const auto& line : bridge.transport.lines(1)) {
        EXPECT_EQ(line.find_first_of("\r\n"), std::string::npos);
        EXPECT_EQ(line.rfind(":meshirc.gw NOTICE op :", 0), 0u) << line;
    }
}

TEST(GatewayScenario, PingUnknownNode) {
    TestBridge bridge;
    bridge.add_node(12345678, "MK1", "Mock Node 1");
    register_client(bridge.chat, 1, "op");
    bridge.transport.clear();

    bridge.say(1, "PING ghost");

    EXPECT_EQ(bridge.transport.notices(1),
              std::vector<std::string>{"Error: Could not find node matching 'ghost'."});
    EXPECT_TRUE(bridge.mesh.pings.empty());
    EXPECT_EQ(bridge.correlator.size(), 0u);
}

TEST(GatewayScenario, PingIsAnsweredWithPong) {
    TestBridge bridge;
    bridge.add_node(87654321, "MK2", "Mock Node 2");
    register_client(bridge.chat, 1, "op");
    bridge.say(1, "PING mk2");
    ASSERT_EQ(bridge.mesh.pings.size(), 1u);
    EXPECT_EQ(bridge.mesh.pings[0].first, 87654321u);
    bridge.transport.clear();

    mesh::PingReply reply;
    reply.id = bridge.mesh.pings[0].second;
    reply.from = 87654321;
    reply.signal.rssi = -65;
    reply.signal.snr = 9.0f;
    bridge.mesh.emit(reply);
    bridge.pump();

    const auto lines = bridge.transport.notices(1);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].rfind("[PONG] Reply from MK2 (!05397fb1) RSSI:-65 SNR:9.0 RTT:", 0), 0u);
    EXPECT_TRUE(bridge.transport.lines(1).size() == 1u);
}

TEST(GatewayScenario, ChatBetweenOperatorsStaysOffTheMesh) {
    TestBridge bridge;
    register_client(bridge.chat, 1, "alice");
    register_client(bridge.chat, 2, "bob");
    bridge.transport.clear();

    bridge.say(1, "hi bob, anything on the mesh?");

    EXPECT_TRUE(bridge.transport.received(2, ":alice!alice@127.0.0.1 PRIVMSG #meshtastic-ctrl :hi bob, anything on the mesh?"));
    EXPECT_TRUE(bridge.transport.lines(1).empty());
    EXPECT_TRUE(bridge.mesh.texts.empty());
}

TEST(GatewayScenario, CommandRepliesGoOnlyToRequester) {
    TestBridge bridge;
    register_client(bridge.chat, 1, "alice");
    register_client(bridge.chat, 2, "bob");
    bridge.transport.clear();

    bridge.say(1, "TIME");

    EXPECT_EQ(bridge.transport.notices(1).size(), 1u);
    EXPECT_TRUE(bridge.transport.lines(2).empty());
}

TEST(GatewayScenario, RequesterLeavingDropsPendingRequest) {
    TestBridge bridge;
    bridge.add_node(12345678, "MK1", "Mock Node 1");
    register_client(bridge.chat, 1, "op");
    bridge.say(1, "DM MK1 hello");
    ASSERT_EQ(bridge.correlator.size(), 1u);

    bridge.chat.handle_line(1, "QUIT :bye");
    EXPECT_EQ(bridge.correlator.size(), 0u);

    bridge.mesh.emit(mesh::DeliveryAcknowledged{bridge.mesh.texts[0].id, 12345678});
    EXPECT_NO_THROW(bridge.pump());
}

TEST(GatewayScenario, RenamedRequesterStillGetsOutcome) {
    TestBridge bridge;
    bridge.add_node(12345678, "MK1", "Mock Node 1");
    register_client(bridge.chat, 1, "op");
    bridge.say(1, "DM MK1 hello");
    bridge.chat.handle_line(1, "NICK op_away");
    bridge.transport.clear();

    bridge.mesh.emit(mesh::DeliveryFailed{bridge.mesh.texts[0].id, "MAX_RETRANSMIT"});
    bridge.pump();

    EXPECT_TRUE(bridge.transport.received(1, "NOTICE op_away :[NAK] DM to MK1 (!00bc614e) failed: MAX_RETRANSMIT"));
}

TEST(GatewayScenario, InfoShowsCachedAttributes) {
    TestBridge bridge;
    mesh::NodeUpdate u;
    u.short_name = "MK2";
    u.long_name = "Mock Node 2";
    u.hw_model = "TBEAM";
    u.snr = -5.5f;
    u.rssi = -110;
    mesh::DeviceMetrics metrics;
    metrics.battery_level = 76;
    u.metrics = metrics;
    bridge.directory.upsert(87654321, u);
    register_client(bridge.chat, 1, "op");
    bridge.transport.clear();

    bridge.say(1, "INFO \"mock node 2\"");

    const auto lines = bridge.transport.notices(1);
    ASSERT_EQ(lines.size(), 10u);
    EXPECT_EQ(lines[0], "--- Info for Node mock node 2 (!05397fb1) ---");
    EXPECT_EQ(lines[5], "  Hardware: TBEAM");
    EXPECT_EQ(lines[7], "  SNR: -5.50 | RSSI: -110 | Hops Away: N/A");
    EXPECT_EQ(lines[8].rfind("  Metrics: Batt 76%, Volt N/A", 0), 0u);
    EXPECT_EQ(lines[9], "--- End of Info ---");
}

TEST(GatewayScenario, LocationOfGatewayNode) {
    TestBridge bridge;
    register_client(bridge.chat, 1, "op");
    bridge.say(1, "LOCATION");
    EXPECT_EQ(bridge.transport.notices(1), (std::vector<std::string>{
        "--- Gateway Location ---",
        "Location data not available or incomplete for the gateway node.",
        "(Node needs a GPS fix and position sharing enabled).",
        "--- End of Location ---",
    }));

    mesh::NodeUpdate u;
    mesh::Position pos;
    pos.latitude = 42.886;
    pos.longitude = -79.249;
    pos.altitude = 180;
    u.position = pos;
    bridge.directory.upsert(bridge.mesh.self, u);
    bridge.transport.clear();

    bridge.say(1, "LOCATION");
    EXPECT_EQ(bridge.transport.notices(1), (std::vector<std::string>{
        "--- Gateway Location ---",
        "Latitude: 42.88600, Longitude: -79.24900",
        "Altitude: 180 m",
        "Map Link (approx): https://www.google.com/maps?q=42.88600,-79.24900",
        "--- End of Location ---",
    }));
}

TEST(GatewayScenario, StatsReportsCounts) {
    TestBridge bridge;
    bridge.add_node(12345678, "MK1", "Mock Node 1");
    register_client(bridge.chat, 1, "op");
    register_client(bridge.chat, 2, "op2");
    bridge.say(1, "DM MK1 hello");
    bridge.transport.clear();

    bridge.say(1, "STATS");

    const auto lines = bridge.transport.notices(1);
    ASSERT_EQ(lines.size(), 8u);
    EXPECT_EQ(lines[1], "Known Nodes: 1");
    EXPECT_EQ(lines[2], "Gateway Node ID: !a1b2c3d4 (Num: 2712847316)");
    EXPECT_EQ(lines[3], "Mesh Interface: Fake");
    EXPECT_EQ(lines[4], "Gateway Uptime: 0:00:00");
    EXPECT_EQ(lines[5], "Connected IRC Clients: 2");
    EXPECT_EQ(lines[6], "Pending Mesh Requests: 1");
}
