#include <gtest/gtest.h>

#include "osc/codec.hpp"
#include "osc/framing.hpp"

#include <vector>

using namespace eoslink::osc;

// ═══════════════════════════════════════════════════════════════════════════════
// PacketLengthFramer
// ═══════════════════════════════════════════════════════════════════════════════

TEST(PacketLengthFramer, PrefixIsBigEndianSize)
{
    PacketLengthFramer   framer;
    std::vector<uint8_t> packet(12, 0xAB);
    auto                 wire = framer.frame(packet);
    ASSERT_EQ(wire.size(), 16u);
    EXPECT_EQ(wire[0], 0);
    EXPECT_EQ(wire[1], 0);
    EXPECT_EQ(wire[2], 0);
    EXPECT_EQ(wire[3], 12);
}

TEST(PacketLengthFramer, ReassemblesAcrossChunks)
{
    PacketLengthFramer framer;
    auto               packet = encode_message(Message{"/eos/out/user", {int32_t(2)}});
    auto               wire   = framer.frame(packet);

    // One byte at a time
    for (size_t i = 0; i < wire.size(); ++i)
    {
        EXPECT_EQ(framer.pending_packets(), 0u);
        ASSERT_TRUE(framer.feed(std::span<const uint8_t>(&wire[i], 1)));
    }
    auto out = framer.next_packet();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, packet);
    EXPECT_FALSE(framer.next_packet().has_value());
}

TEST(PacketLengthFramer, SeveralPacketsInOneRead)
{
    PacketLengthFramer   framer;
    auto                 a = encode_message(Message{"/a", {}});
    auto                 b = encode_message(Message{"/b", {int32_t(1)}});
    std::vector<uint8_t> wire;
    for (const auto& p : {a, b})
    {
        auto f = framer.frame(p);
        wire.insert(wire.end(), f.begin(), f.end());
    }
    ASSERT_TRUE(framer.feed(wire));
    EXPECT_EQ(framer.pending_packets(), 2u);
    EXPECT_EQ(*framer.next_packet(), a);
    EXPECT_EQ(*framer.next_packet(), b);
}

TEST(PacketLengthFramer, OversizedLengthIsFatal)
{
    PacketLengthFramer   framer;
    std::vector<uint8_t> wire = {0x7F, 0xFF, 0xFF, 0xFF};
    EXPECT_FALSE(framer.feed(wire));
}

// ═══════════════════════════════════════════════════════════════════════════════
// SlipFramer
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SlipFramer, DoubleEndAndEscaping)
{
    SlipFramer           framer;
    std::vector<uint8_t> packet = {0x01, SlipFramer::END, 0x02, SlipFramer::ESC, 0x03};
    auto                 wire   = framer.frame(packet);

    std::vector<uint8_t> expected = {SlipFramer::END,
                                     0x01,
                                     SlipFramer::ESC,
                                     SlipFramer::ESC_END,
                                     0x02,
                                     SlipFramer::ESC,
                                     SlipFramer::ESC_ESC,
                                     0x03,
                                     SlipFramer::END};
    EXPECT_EQ(wire, expected);

    ASSERT_TRUE(framer.feed(wire));
    auto out = framer.next_packet();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, packet);
}

TEST(SlipFramer, EscapeSplitAcrossReads)
{
    SlipFramer           framer;
    std::vector<uint8_t> first  = {SlipFramer::END, 0x10, SlipFramer::ESC};
    std::vector<uint8_t> second = {SlipFramer::ESC_END, 0x11, SlipFramer::END};

    ASSERT_TRUE(framer.feed(first));
    EXPECT_EQ(framer.pending_packets(), 0u);
    ASSERT_TRUE(framer.feed(second));

    auto out = framer.next_packet();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, (std::vector<uint8_t>{0x10, SlipFramer::END, 0x11}));
}

TEST(SlipFramer, EmptyFramesIgnored)
{
    SlipFramer           framer;
    std::vector<uint8_t> wire = {SlipFramer::END, SlipFramer::END, SlipFramer::END};
    ASSERT_TRUE(framer.feed(wire));
    EXPECT_EQ(framer.pending_packets(), 0u);
}

TEST(SlipFramer, BadEscapeDropsOnlyThatPacket)
{
    SlipFramer           framer;
    std::vector<uint8_t> wire = {SlipFramer::END, 0x01, SlipFramer::ESC, 0x55, 0x02, SlipFramer::END,
                                 0x09, SlipFramer::END};
    ASSERT_TRUE(framer.feed(wire));
    ASSERT_EQ(framer.pending_packets(), 1u);
    EXPECT_EQ(*framer.next_packet(), (std::vector<uint8_t>{0x09}));
}

TEST(SlipFramer, ResetClearsPartialState)
{
    SlipFramer           framer;
    std::vector<uint8_t> partial = {SlipFramer::END, 0x01, 0x02};
    ASSERT_TRUE(framer.feed(partial));
    framer.reset();

    std::vector<uint8_t> next = {0x07, SlipFramer::END};
    ASSERT_TRUE(framer.feed(next));
    EXPECT_EQ(*framer.next_packet(), (std::vector<uint8_t>{0x07}));
}

// ═══════════════════════════════════════════════════════════════════════════════
// DatagramFramer / factory
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DatagramFramer, OneFeedOnePacket)
{
    DatagramFramer       framer;
    std::vector<uint8_t> packet = {1, 2, 3, 4};
    EXPECT_EQ(framer.frame(packet), packet);
    ASSERT_TRUE(framer.feed(packet));
    ASSERT_TRUE(framer.feed(packet));
    EXPECT_EQ(framer.pending_packets(), 2u);
}

TEST(Framing, FactoryHonoursMode)
{
    for (auto mode : {FramingMode::PacketLength, FramingMode::Slip, FramingMode::Datagram})
    {
        auto framer = make_framer(mode);
        ASSERT_NE(framer, nullptr);
        EXPECT_EQ(framer->mode(), mode);
    }
}

TEST(Framing, EveryModeCarriesAnOscMessage)
{
    Message msg{"/eos/out/get/version", {std::string("3.2.0.36")}};
    auto    packet = encode_message(msg);

    for (auto mode : {FramingMode::PacketLength, FramingMode::Slip, FramingMode::Datagram})
    {
        auto framer = make_framer(mode);
        ASSERT_TRUE(framer->feed(framer->frame(packet)));
        auto out = framer->next_packet();
        ASSERT_TRUE(out.has_value());
        auto decoded = decode_message(*out);
        ASSERT_TRUE(decoded.has_value());
        EXPECT_EQ(*decoded, msg);
    }
}
