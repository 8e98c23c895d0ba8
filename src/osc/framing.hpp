#pragma once

#include <eoslink/osc.hpp>

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace eoslink::osc
{

// ─── Framer ──────────────────────────────────────────────────────────────────
// Turns OSC packets into wire bytes and reassembles packets from arbitrary
// read chunks. One framer instance belongs to one connection.

class Framer
{
   public:
    virtual ~Framer() = default;

    virtual FramingMode mode() const = 0;

    // Wrap one packet for the wire.
    virtual std::vector<uint8_t> frame(std::span<const uint8_t> packet) const = 0;

    // Consume raw bytes as read from the socket. Returns false if the stream
    // is corrupt beyond recovery (the caller should drop the connection).
    virtual bool feed(std::span<const uint8_t> bytes) = 0;

    // Pop the next complete packet, if any.
    std::optional<std::vector<uint8_t>> next_packet();

    size_t pending_packets() const { return ready_.size(); }

    virtual void reset();

   protected:
    std::deque<std::vector<uint8_t>> ready_;
};

// int32 big-endian length prefix followed by the packet (OSC 1.0 over TCP).
class PacketLengthFramer : public Framer
{
   public:
    FramingMode          mode() const override { return FramingMode::PacketLength; }
    std::vector<uint8_t> frame(std::span<const uint8_t> packet) const override;
    bool                 feed(std::span<const uint8_t> bytes) override;
    void                 reset() override;

   private:
    std::vector<uint8_t> buffer_;
};

// SLIP (RFC 1055) with an END byte on both sides of each packet (OSC 1.1).
class SlipFramer : public Framer
{
   public:
    static constexpr uint8_t END     = 0xC0;
    static constexpr uint8_t ESC     = 0xDB;
    static constexpr uint8_t ESC_END = 0xDC;
    static constexpr uint8_t ESC_ESC = 0xDD;

    FramingMode          mode() const override { return FramingMode::Slip; }
    std::vector<uint8_t> frame(std::span<const uint8_t> packet) const override;
    bool                 feed(std::span<const uint8_t> bytes) override;
    void                 reset() override;

   private:
    std::vector<uint8_t> current_;
    bool                 escaping_   = false;
    bool                 discarding_ = false;   // skipping to the next END after a bad escape
};

// Datagram sockets preserve boundaries: every feed() is exactly one packet.
class DatagramFramer : public Framer
{
   public:
    FramingMode          mode() const override { return FramingMode::Datagram; }
    std::vector<uint8_t> frame(std::span<const uint8_t> packet) const override;
    bool                 feed(std::span<const uint8_t> bytes) override;
};

std::unique_ptr<Framer> make_framer(FramingMode mode);

}   // namespace eoslink::osc
