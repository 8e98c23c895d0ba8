#include <gtest/gtest.h>

#include "console/record_assembler.hpp"
#include "util/mock_transport.hpp"

#include <eoslink/error.hpp>

#include <algorithm>
#include <chrono>

using namespace eoslink;
using eoslink::test::MockTransport;
using namespace std::chrono_literals;

namespace
{

struct AssemblerFixture : ::testing::Test
{
    MockTransport transport;
    AddressRouter router;
    RequestEngine engine{transport, router, EngineTiming{100ms, 10ms}};

    // Answers any cue query with `replies`, regardless of what was asked.
    void answer_with(std::vector<osc::Message> replies)
    {
        transport.set_responder([replies](const osc::Message&) { return replies; });
    }
};

std::vector<osc::Value> group_header(const std::string& label)
{
    return {int32_t(0), std::string("g-uid"), label};
}

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Cues
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(AssemblerFixture, CueFromFourMessages)
{
    answer_with(test::cue_replies("1/10/0", "Opening", "B", "", "Act 1"));

    auto props = assemble(engine, cue_query(Cue{1, 10.0, 0}));
    EXPECT_EQ(props.cuelist, 1);
    EXPECT_DOUBLE_EQ(props.cue, 10.0);
    EXPECT_EQ(props.label, "Opening");
    EXPECT_EQ(props.scene, "Act 1");
    EXPECT_TRUE(props.is_blocked());
    EXPECT_FALSE(props.fx.has_value());

    ASSERT_EQ(transport.sent().size(), 1u);
    EXPECT_EQ(transport.sent()[0].address, "/eos/get/cue/1/10/0");
    EXPECT_EQ(router.handler_count(), 0u);
}

TEST_F(AssemblerFixture, SubPartsBeforeBaseAreKept)
{
    auto replies = test::cue_replies("1/10/0");
    // fx first, carrying data; base last.
    replies[1].args.push_back(std::string("Fx 3"));
    std::rotate(replies.begin(), replies.begin() + 1, replies.end());
    answer_with(replies);

    auto props = assemble(engine, cue_query(Cue{1, 10.0, 0}));
    ASSERT_TRUE(props.fx.has_value());
    EXPECT_EQ(*props.fx, "Fx 3");
    EXPECT_EQ(props.label, "Opening");
}

TEST_F(AssemblerFixture, NothingArrivedIsTimeout)
{
    EXPECT_THROW(assemble(engine, cue_query(Cue{1, 10.0, 0})), TimeoutError);
    EXPECT_EQ(router.handler_count(), 0u);
}

TEST_F(AssemblerFixture, PartialSetIsIncomplete)
{
    auto replies = test::cue_replies("1/10/0");
    replies.pop_back();
    answer_with(replies);

    try
    {
        assemble(engine, cue_query(Cue{1, 10.0, 0}));
        FAIL() << "expected IncompleteError";
    }
    catch (const IncompleteError& e)
    {
        EXPECT_EQ(e.observed(), 3u);
        EXPECT_EQ(e.expected(), 4u);
        EXPECT_TRUE(indicates_absence(e));
    }
}

TEST_F(AssemblerFixture, CompleteWithoutBaseIsProtocolMismatch)
{
    auto replies = test::cue_replies("1/10/0");
    replies[0]   = replies[1];   // a second fx in place of the base reply
    answer_with(replies);

    EXPECT_THROW(assemble(engine, cue_query(Cue{1, 10.0, 0})), ProtocolMismatchError);
}

TEST_F(AssemblerFixture, OtherCuesAreNotCounted)
{
    auto replies = test::cue_replies("1/10/0");
    auto foreign = test::cue_replies("1/10.5/0", "Other");
    replies.insert(replies.begin() + 1, foreign.begin(), foreign.end());
    answer_with(replies);

    auto props = assemble(engine, cue_query(Cue{1, 10.0, 0}));
    EXPECT_EQ(props.label, "Opening");
    EXPECT_DOUBLE_EQ(props.cue, 10.0);
}

TEST_F(AssemblerFixture, MalformedBaseIsDecodeError)
{
    auto replies = test::cue_replies("1/10/0");
    replies[0].args.pop_back();
    answer_with(replies);

    try
    {
        assemble(engine, cue_query(Cue{1, 10.0, 0}));
        FAIL() << "expected DecodeError";
    }
    catch (const DecodeError& e)
    {
        EXPECT_FALSE(indicates_absence(e));
    }
    EXPECT_EQ(router.handler_count(), 0u);
    EXPECT_FALSE(engine.busy());
}

TEST_F(AssemblerFixture, RepliesSpreadOverSeveralCycles)
{
    transport.set_batch_limit(1);
    answer_with(test::cue_replies("2/5/1", "Split"));

    auto props = assemble(engine, cue_query(Cue{2, 5.0, 1}));
    EXPECT_EQ(props.part, 1);
    EXPECT_EQ(props.label, "Split");
}

TEST_F(AssemblerFixture, IndexQueryTakesIdentityFromFirstReply)
{
    auto replies = test::cue_replies("1/7/0", "Seven");
    auto later   = test::cue_replies("1/8/0", "Eight");
    replies.insert(replies.begin() + 2, later.begin(), later.end());
    answer_with(replies);

    auto props = assemble(engine, cue_index_query(3, 1));
    EXPECT_DOUBLE_EQ(props.cue, 7.0);
    EXPECT_EQ(props.label, "Seven");
    EXPECT_EQ(transport.sent()[0].address, "/eos/get/cue/1/index/3");
}

TEST_F(AssemblerFixture, UidQuery)
{
    answer_with(test::cue_replies("4/2/0", "ByUid"));

    auto props = assemble(engine, cue_uid_query("abc-123"));
    EXPECT_EQ(props.cuelist, 4);
    EXPECT_EQ(props.label, "ByUid");
    EXPECT_EQ(transport.sent()[0].address, "/eos/get/cue/uid/abc-123");
}

TEST_F(AssemblerFixture, PushNotificationsDuringAssemblyStillDispatched)
{
    int users = 0;
    router.add_handler("/eos/out/user", [&](const osc::Message&) { ++users; });

    auto replies = test::cue_replies("1/10/0");
    replies.insert(replies.begin() + 2, osc::Message{"/eos/out/user", {int32_t(5)}});
    answer_with(replies);

    assemble(engine, cue_query(Cue{1, 10.0, 0}));
    EXPECT_EQ(users, 1);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Groups and macros
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(AssemblerFixture, GroupWithChannels)
{
    answer_with({
        {"/eos/out/get/group/5/channels/list/0/1",
         {int32_t(0), std::string("g-uid"), std::string("1-5"), int32_t(9)}},
        {"/eos/out/get/group/5/list/0/1", group_header("Front")},
    });

    auto group = assemble(engine, group_query(5));
    EXPECT_DOUBLE_EQ(group.number, 5.0);
    EXPECT_EQ(group.label, "Front");
    EXPECT_EQ(group.channels, (std::vector<std::string>{"1-5", "9"}));
    EXPECT_EQ(group.channel_selection(), "1 Thru 5 + 9");
    EXPECT_EQ(transport.sent()[0].address, "/eos/get/group/5");
}

TEST_F(AssemblerFixture, GroupIgnoresNeighbouringNumbers)
{
    // "/eos/out/get/group/50" also matches the "group/5*" pattern.
    answer_with({
        {"/eos/out/get/group/50/list/0/1", group_header("Wrong")},
        {"/eos/out/get/group/5/list/0/1", group_header("Right")},
        {"/eos/out/get/group/5/channels/list/0/1", {int32_t(0), std::string("g-uid")}},
    });

    auto group = assemble(engine, group_query(5));
    EXPECT_EQ(group.label, "Right");
    EXPECT_TRUE(group.channels.empty());
}

TEST_F(AssemblerFixture, MissingGroupIsTimeout)
{
    EXPECT_THROW(assemble(engine, group_query(12)), TimeoutError);
}

TEST_F(AssemblerFixture, MacroWithText)
{
    answer_with({
        {"/eos/out/get/macro/2/list/0/1",
         {int32_t(0), std::string("m-uid"), std::string("Reset"), std::string("Foreground")}},
        {"/eos/out/get/macro/2/text/list/0/1",
         {int32_t(0), std::string("m-uid"), std::string("Go_To_Cue"), std::string("1")}},
    });

    auto macro = assemble(engine, macro_query(2));
    EXPECT_EQ(macro.label, "Reset");
    EXPECT_EQ(macro.mode, "Foreground");
    EXPECT_EQ(macro.command, (std::vector<std::string>{"Go_To_Cue", "1"}));
}

TEST_F(AssemblerFixture, MacroHeaderOnlyIsIncomplete)
{
    answer_with({
        {"/eos/out/get/macro/2/list/0/1",
         {int32_t(0), std::string("m-uid"), std::string("Reset"), std::string("Foreground")}},
    });

    EXPECT_THROW(assemble(engine, macro_query(2)), IncompleteError);
}
