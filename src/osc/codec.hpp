#pragma once

#include <eoslink/osc.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace eoslink::osc
{

// ─── Wire constants ──────────────────────────────────────────────────────────
// OSC 1.0 packet layout:
//   message: [address: padded string] [",tags": padded string] [arguments]
//   bundle:  ["#bundle": padded string] [timetag: uint64 BE]
//            ([element size: int32 BE] [element: message or bundle])*
// All numbers are big-endian; strings and blobs are zero-padded to 4 bytes.

static constexpr size_t   OSC_ALIGNMENT      = 4;
static constexpr size_t   MAX_PACKET_SIZE    = 1024 * 1024;   // 1 MiB
static constexpr size_t   MAX_BUNDLE_DEPTH   = 8;
static constexpr uint64_t TIMETAG_IMMEDIATE  = 1;
static constexpr char     BUNDLE_TAG[]       = "#bundle";

// ─── Message serialization ───────────────────────────────────────────────────

// Encode one message into an OSC packet.
std::vector<uint8_t> encode_message(const Message& msg);

// Encode several messages into one bundle packet.
std::vector<uint8_t> encode_bundle(const std::vector<Message>& msgs,
                                   uint64_t                    timetag = TIMETAG_IMMEDIATE);

// Decode a single message packet.
// Returns std::nullopt on bad alignment, unknown type tags, or truncation.
std::optional<Message> decode_message(std::span<const uint8_t> data);

// Decode a packet that may be a message or a (possibly nested) bundle.
// Bundles are flattened into their messages in element order.
std::optional<std::vector<Message>> decode_packet(std::span<const uint8_t> data);

// True if the packet starts with the "#bundle" marker.
bool is_bundle(std::span<const uint8_t> data);

// Number of bytes a string occupies on the wire including terminator and padding.
constexpr size_t padded_string_size(size_t len)
{
    return (len + 1 + OSC_ALIGNMENT - 1) / OSC_ALIGNMENT * OSC_ALIGNMENT;
}

}   // namespace eoslink::osc
