#include <gtest/gtest.h>

#include "util/mock_transport.hpp"

#include <eoslink/console.hpp>
#include <eoslink/error.hpp>

#include "console/address_router.hpp"
#include "console/request_engine.hpp"

#include <chrono>
#include <stdexcept>

using namespace eoslink;
using eoslink::test::MockTransport;
using namespace std::chrono_literals;

namespace
{

SessionConfig fast_config()
{
    SessionConfig config;
    config.timeout_ms       = 100;
    config.poll_interval_ms = 10;
    config.client_name      = "tests";
    return config;
}

struct ConsoleFixture : ::testing::Test
{
    MockTransport* mock = nullptr;
    std::unique_ptr<Console> console;

    void SetUp() override
    {
        auto transport = std::make_unique<MockTransport>();
        mock           = transport.get();
        console        = std::make_unique<Console>(std::move(transport), fast_config());
    }
};

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Session
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(ConsoleFixture, StartAnnouncesClient)
{
    console->start();
    ASSERT_EQ(mock->sent().size(), 1u);
    EXPECT_EQ(mock->sent()[0].address, "/eos/sc/Connected from tests");
    EXPECT_TRUE(mock->sent()[0].args.empty());
}

TEST_F(ConsoleFixture, ConfigTimingReachesEngine)
{
    EXPECT_EQ(console->engine().timing().timeout, 100ms);
    EXPECT_EQ(console->engine().timing().poll_interval, 10ms);
    EXPECT_EQ(console->config().client_name, "tests");
}

TEST(Console, ConnectToNothingReturnsNull)
{
    SessionConfig config = fast_config();
    config.port          = 1;   // privileged and unused
    config.framing       = osc::FramingMode::PacketLength;
    EXPECT_EQ(Console::connect(config), nullptr);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Ping / version / counts
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(ConsoleFixture, PingEchoesToken)
{
    mock->set_responder(
        [](const osc::Message& m) -> std::vector<osc::Message>
        {
            if (m.address != "/eos/ping")
                return {};
            return {{"/eos/out/ping", m.args}};
        });

    auto rtt = console->ping("abc");
    EXPECT_LT(rtt, 100ms);
    ASSERT_EQ(mock->sent().size(), 1u);
    EXPECT_EQ(std::get<std::string>(mock->sent()[0].args.at(0)), "abc");
}

TEST_F(ConsoleFixture, PingMismatchIsNotTimeout)
{
    mock->set_responder([](const osc::Message&) -> std::vector<osc::Message>
                        { return {{"/eos/out/ping", {std::string("other")}}}; });

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(console->ping("abc"), ProtocolMismatchError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);
}

TEST_F(ConsoleFixture, PingWithoutReplyTimesOut)
{
    auto standing = console->router().handler_count();
    EXPECT_THROW(console->ping(), TimeoutError);
    EXPECT_EQ(console->router().handler_count(), standing);
}

TEST_F(ConsoleFixture, Version)
{
    mock->set_responder([](const osc::Message&) -> std::vector<osc::Message>
                        { return {{"/eos/out/get/version", {std::string("3.2.5.12")}}}; });
    EXPECT_EQ(console->get_version(), "3.2.5.12");
    EXPECT_EQ(mock->addresses(), (std::vector<std::string>{"/eos/get/version"}));
}

TEST_F(ConsoleFixture, TargetCount)
{
    mock->set_responder(
        [](const osc::Message& m) -> std::vector<osc::Message>
        {
            if (m.address == "/eos/get/cue/2/count")
                return {{"/eos/out/get/cue/2/count", {int32_t(14)}}};
            if (m.address == "/eos/get/group/count")
                return {{"/eos/out/get/group/count", {int32_t(6)}}};
            return {};
        });

    EXPECT_EQ(console->get_target_count("cue", 2), 14);
    EXPECT_EQ(console->get_target_count("group"), 6);
}

TEST_F(ConsoleFixture, UnknownTargetRejectedBeforeSending)
{
    EXPECT_THROW(console->get_target_count("channel"), std::invalid_argument);
    EXPECT_TRUE(mock->sent().empty());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Records
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(ConsoleFixture, GetCue)
{
    mock->set_responder([](const osc::Message&) { return test::cue_replies("1/10/0", "Opening"); });
    auto props = console->get_cue(Cue{1, 10.0});
    EXPECT_EQ(props.label, "Opening");
}

TEST_F(ConsoleFixture, MissingCueTimesOut)
{
    EXPECT_THROW(console->get_cue(Cue{1, 99.0}), TimeoutError);
}

TEST_F(ConsoleFixture, StateKeepsUpdatingDuringQuery)
{
    mock->set_responder(
        [](const osc::Message&)
        {
            auto replies = test::cue_replies("1/10/0");
            replies.insert(replies.begin() + 1,
                           osc::Message{"/eos/out/active/cue/text", {std::string("1/5 0 30%")}});
            return replies;
        });

    int changes = 0;
    console->set_on_state_change([&](const ConsoleState&) { ++changes; });
    console->get_cue(Cue{1, 10.0});

    ASSERT_TRUE(console->state().active_cue.has_value());
    EXPECT_DOUBLE_EQ(console->state().active_cue->cue, 5.0);
    EXPECT_EQ(changes, 1);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(ConsoleFixture, KeysAndCommandLine)
{
    console->press_key("Go_0");
    console->send_command("Chan 1 At Full #");
    console->blind();
    console->live();

    EXPECT_EQ(mock->addresses(),
              (std::vector<std::string>{"/eos/key/Go_0", "/eos/newcmd", "/eos/key/Blind", "/eos/key/Live"}));
    EXPECT_EQ(mock->commands(), (std::vector<std::string>{"Chan 1 At Full #"}));
}

TEST_F(ConsoleFixture, OpenTabTypesDigits)
{
    console->open_tab(Tab::Groups);

    EXPECT_EQ(mock->addresses(),
              (std::vector<std::string>{"/eos/key/Tab", "/eos/key/1", "/eos/key/7", "/eos/key/Tab"}));
    EXPECT_FLOAT_EQ(std::get<float>(mock->sent().front().args.at(0)), 1.0f);
    EXPECT_FLOAT_EQ(std::get<float>(mock->sent().back().args.at(0)), 0.0f);
}

TEST_F(ConsoleFixture, UpdateDispatchesNotifications)
{
    mock->push("/eos/out/user", {int32_t(2)});
    mock->push("/eos/out/show/name", {std::string("Tempest")});
    mock->push("/eos/out/something/else", {});

    EXPECT_EQ(console->update(30ms), 3u);
    EXPECT_EQ(console->state().user, 2);
    EXPECT_EQ(console->state().show_name, "Tempest");
}

TEST_F(ConsoleFixture, ClosedTransportSurfacesOnSend)
{
    mock->close();
    EXPECT_THROW(console->press_key("Go_0"), TransportError);
    EXPECT_THROW(console->update(10ms), TransportError);
}
