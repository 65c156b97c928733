#include "commands/Dispatcher.h"

#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace meshirc;
using commands::split_arguments;
using meshirc::test::register_client;
using meshirc::test::TestBridge;

namespace {

class ExplodingCommand : public commands::Command {
public:
    ExplodingCommand() : Command("BOOM", "BOOM - Always fails") {}
    void execute(commands::BridgeContext&, const commands::Invocation&) override {
        throw std::runtime_error("kaboom");
    }
};

class CannedLookup : public lookup::DataLookup {
public:
    std::optional<std::string> configuration_problem() const override { return problem; }
    std::string progress_line() const override { return "Fetching canned data..."; }
    std::vector<std::string> fetch() override {
        if (!error.empty()) throw lookup::LookupError(error);
        return {"line one", "line two"};
    }

    std::optional<std::string> problem;
    std::string error;
};

class DispatcherTest : public ::testing::Test {
protected:
    DispatcherTest() {
        bridge.add_node(12345678, "MK1", "Mock Node 1");
        register_client(bridge.chat, 1, "op");
        bridge.transport.clear();
    }

    std::vector<std::string> notices() { return bridge.transport.notices(1); }

    TestBridge bridge;
};

} // namespace

TEST(SplitArguments, QuotingAndEscapes) {
    EXPECT_EQ(split_arguments("  MK1   hello  world "), (std::vector<std::string>{"MK1", "hello", "world"}));
    EXPECT_EQ(split_arguments("\"Mock Node 1\" hi"), (std::vector<std::string>{"Mock Node 1", "hi"}));
    EXPECT_EQ(split_arguments("'it''s' a\\ b"), (std::vector<std::string>{"its", "a b"}));
    EXPECT_EQ(split_arguments("\"say \\\"hi\\\"\""), (std::vector<std::string>{"say \"hi\""}));
    EXPECT_EQ(split_arguments("''"), (std::vector<std::string>{""}));
    EXPECT_TRUE(split_arguments("   ").empty());
}

TEST(SplitArguments, Errors) {
    EXPECT_THROW(split_arguments("'Mock Node 1 hi"), commands::ArgumentError);
    EXPECT_THROW(split_arguments("\"open"), commands::ArgumentError);
    EXPECT_THROW(split_arguments("trailing\\"), commands::ArgumentError);
}

TEST_F(DispatcherTest, NonCommandFallsThroughToChat) {
    EXPECT_FALSE(bridge.dispatcher.handle_room_text("op", "hello mesh"));
    EXPECT_FALSE(bridge.dispatcher.handle_room_text("op", ""));
    EXPECT_TRUE(bridge.dispatcher.handle_room_text("op", "time"));
    ASSERT_EQ(notices().size(), 1u);
    EXPECT_EQ(notices()[0].rfind("Server time: ", 0), 0u);
}

TEST_F(DispatcherTest, UnregisteredVerbIsLeftForChat) {
    EXPECT_FALSE(bridge.dispatcher.dispatch("op", "FOO", ""));
    EXPECT_TRUE(notices().empty());
    EXPECT_TRUE(bridge.dispatcher.dispatch("op", "time", ""));
    EXPECT_EQ(notices().size(), 1u);
}

TEST_F(DispatcherTest, HelpListsEveryCommand) {
    bridge.say(1, "HELP");
    const auto lines = notices();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "*** Available Commands (Type HELP <command> for details):");
    EXPECT_EQ(lines[1], "ALARM, DM, HELP, HFCONDITIONS, INFO, LOCATION, NODES, PING, SEND, STATS, TIME, WEATHER");
}

TEST_F(DispatcherTest, HelpForOneCommand) {
    bridge.say(1, "HELP dm");
    bridge.say(1, "HELP nope");
    const auto lines = notices();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "Help for DM: DM <node_id|shortname|longname|nodenum> <message> - Sends direct message to a node");
    EXPECT_EQ(lines[1], "Unknown command: 'nope'. Type HELP for a list.");
}

TEST_F(DispatcherTest, UnmatchedQuoteIsReported) {
    bridge.say(1, "DM 'Mock Node 1 hello");
    EXPECT_EQ(notices(), std::vector<std::string>{"Error parsing arguments: No closing quotation"});
    EXPECT_TRUE(bridge.mesh.texts.empty());
}

TEST_F(DispatcherTest, HandlerExceptionIsReported) {
    bridge.registry.add(std::make_unique<ExplodingCommand>());
    bridge.say(1, "boom now");
    EXPECT_EQ(notices(), std::vector<std::string>{"Error executing command BOOM: kaboom"});
}

TEST_F(DispatcherTest, QuotedLongNameDirectMessage) {
    bridge.say(1, "DM \"Mock Node 1\" hi there");
    ASSERT_EQ(bridge.mesh.texts.size(), 1u);
    EXPECT_EQ(bridge.mesh.texts[0].dest.node_num, 12345678u);
    EXPECT_EQ(bridge.mesh.texts[0].text, "hi there");
    EXPECT_TRUE(bridge.mesh.texts[0].want_ack);
    EXPECT_TRUE(bridge.correlator.contains(bridge.mesh.texts[0].id));
}

TEST_F(DispatcherTest, MissingArgumentsShowUsage) {
    bridge.say(1, "DM MK1");
    bridge.say(1, "PING");
    const auto lines = notices();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].rfind("Usage: DM <node_id", 0), 0u);
    EXPECT_EQ(lines[1].rfind("Usage: PING <node_id", 0), 0u);
}

TEST_F(DispatcherTest, SendGoesToDefaultChannel) {
    bridge.say(1, "SEND hello mesh");
    ASSERT_EQ(bridge.mesh.texts.size(), 1u);
    EXPECT_TRUE(bridge.mesh.texts[0].dest.is_broadcast());
    EXPECT_EQ(bridge.mesh.texts[0].dest.channel_index, 0);
    EXPECT_FALSE(bridge.mesh.texts[0].want_ack);
    EXPECT_EQ(notices(), (std::vector<std::string>{"Sending 'hello mesh' to mesh channel 0...",
                                                   "Message sent to mesh channel 0."}));
}

TEST_F(DispatcherTest, SendTooLongIsRefused) {
    bridge.say(1, "SEND " + std::string(241, 'a'));
    EXPECT_TRUE(bridge.mesh.texts.empty());
    EXPECT_EQ(notices(), std::vector<std::string>{"Error: Message too long (241 chars). Maximum is 240 characters."});
}

TEST_F(DispatcherTest, AlarmIsPrefixed) {
    bridge.say(1, "ALARM fire on hill");
    ASSERT_EQ(bridge.mesh.texts.size(), 1u);
    EXPECT_EQ(bridge.mesh.texts[0].text, "ALARM: fire on hill");
}

TEST_F(DispatcherTest, MeshFailureIsReported) {
    bridge.mesh.fail_sends = true;
    bridge.say(1, "SEND hello");
    bridge.say(1, "PING MK1");
    const auto lines = notices();
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[1], "Mesh Error sending message: radio busy");
    EXPECT_EQ(lines[3], "Mesh Error sending PING: radio busy");
    EXPECT_EQ(bridge.correlator.size(), 0u);
}

TEST_F(DispatcherTest, LookupWithoutSource) {
    bridge.say(1, "WEATHER");
    EXPECT_EQ(notices(), std::vector<std::string>{"WEATHER command is not available."});
}

TEST_F(DispatcherTest, LookupNotConfigured) {
    CannedLookup weather;
    weather.problem = "Weather command is not configured (missing API key or location).";
    bridge.ctx.set_weather(&weather);
    bridge.say(1, "weather");
    EXPECT_EQ(notices(), std::vector<std::string>{*weather.problem});
}

TEST_F(DispatcherTest, LookupRunsInlineWithoutRunner) {
    CannedLookup hf;
    bridge.ctx.set_hf_conditions(&hf);
    bridge.say(1, "HFCONDITIONS");
    EXPECT_EQ(notices(), (std::vector<std::string>{"Fetching canned data...", "line one", "line two"}));

    bridge.transport.clear();
    hf.error = "Error: Request to NOAA SWPC timed out.";
    bridge.say(1, "HFCONDITIONS");
    EXPECT_EQ(notices(), (std::vector<std::string>{"Fetching canned data...", "Error: Request to NOAA SWPC timed out."}));
}

TEST_F(DispatcherTest, LookupOnBackgroundRunner) {
    CannedLookup hf;
    networking::BackgroundRunner runner(bridge.ioc, 1);
    bridge.ctx.set_hf_conditions(&hf);
    bridge.ctx.set_background(&runner);

    bridge.say(1, "HFCONDITIONS");
    runner.stop();
    bridge.pump();

    EXPECT_EQ(notices(), (std::vector<std::string>{"Fetching canned data...", "line one", "line two"}));
    bridge.ctx.set_background(nullptr);
}
