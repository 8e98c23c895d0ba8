#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace eoslink::osc
{

// ─── Values ──────────────────────────────────────────────────────────────────
// One OSC argument. Type tags map as:
//   N → Nil, T/F → bool, i → int32_t, h → int64_t, f → float, d → double,
//   s → std::string, b → Blob

struct Nil
{
    bool operator==(const Nil&) const = default;
};

using Blob  = std::vector<uint8_t>;
using Value = std::variant<Nil, bool, int32_t, int64_t, float, double, std::string, Blob>;

// Type tag character for a value ('N', 'T', 'F', 'i', 'h', 'f', 'd', 's', 'b').
char type_tag(const Value& v);

// Lenient accessors. Numbers convert between integer and floating types;
// text is never parsed here.
std::optional<int64_t>     as_int(const Value& v);
std::optional<double>      as_double(const Value& v);
std::optional<bool>        as_bool(const Value& v);
std::optional<std::string> as_string(const Value& v);

// Human-readable rendering for logs and free-text fields.
std::string to_display_string(const Value& v);

// ─── Message ─────────────────────────────────────────────────────────────────

struct Message
{
    std::string        address;
    std::vector<Value> args;

    bool operator==(const Message&) const = default;
};

// "<address> [arg, arg, ...]" for logging.
std::string describe(const Message& msg);

// ─── Transport ───────────────────────────────────────────────────────────────

enum class FramingMode : uint8_t
{
    PacketLength = 0,   // TCP, int32 big-endian size prefix (OSC 1.0)
    Slip         = 1,   // TCP, SLIP double-END framing (OSC 1.1)
    Datagram     = 2,   // UDP, one packet per datagram
};

std::string_view             framing_name(FramingMode mode);
std::optional<FramingMode>   parse_framing(std::string_view name);

struct TransportConfig
{
    std::string host    = "127.0.0.1";
    uint16_t    port    = 3032;   // console port (TCP) or console receive port (UDP)
    uint16_t    rx_port = 8001;   // local receive port, UDP only
    FramingMode framing = FramingMode::Slip;
};

// Message-level transport. The session core only ever calls send/receive;
// framing lives behind this interface.
class Transport
{
   public:
    virtual ~Transport() = default;

    // Returns false if the message could not be written.
    virtual bool send(const Message& msg) = 0;

    // Blocks up to `timeout` for data, then returns every complete message
    // available, in arrival order. An empty result means nothing arrived.
    virtual std::vector<Message> receive(std::chrono::milliseconds timeout) = 0;

    virtual bool is_open() const = 0;
    virtual void close()         = 0;
};

}   // namespace eoslink::osc
