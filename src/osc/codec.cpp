#include "codec.hpp"

#include <bit>
#include <cstring>
#include <string>

namespace eoslink::osc
{

// ─── Big-endian helpers ──────────────────────────────────────────────────────

static void write_u32_be(std::vector<uint8_t>& buf, uint32_t v)
{
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
}

static void write_u64_be(std::vector<uint8_t>& buf, uint64_t v)
{
    for (int i = 7; i >= 0; --i)
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
}

static uint32_t read_u32_be(const uint8_t* p)
{
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

static uint64_t read_u64_be(const uint8_t* p)
{
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
        v = (v << 8) | static_cast<uint64_t>(p[i]);
    return v;
}

static void pad_to_alignment(std::vector<uint8_t>& buf)
{
    while (buf.size() % OSC_ALIGNMENT != 0)
        buf.push_back(0);
}

static void write_string(std::vector<uint8_t>& buf, const std::string& s)
{
    buf.insert(buf.end(), s.begin(), s.end());
    buf.push_back(0);
    pad_to_alignment(buf);
}

// ─── Reader ──────────────────────────────────────────────────────────────────
// Bounds-checked cursor over a packet. Every read returns false on truncation.

namespace
{

class Reader
{
   public:
    explicit Reader(std::span<const uint8_t> data) : data_(data) {}

    bool at_end() const { return pos_ >= data_.size(); }
    size_t remaining() const { return data_.size() - pos_; }

    bool read_string(std::string& out)
    {
        if (pos_ % OSC_ALIGNMENT != 0)
            return false;
        const auto* begin = data_.data() + pos_;
        const auto* nul   = static_cast<const uint8_t*>(std::memchr(begin, 0, remaining()));
        if (!nul)
            return false;
        size_t len    = static_cast<size_t>(nul - begin);
        size_t padded = padded_string_size(len);
        if (padded > remaining())
            return false;
        out.assign(reinterpret_cast<const char*>(begin), len);
        pos_ += padded;
        return true;
    }

    bool read_u32(uint32_t& out)
    {
        if (remaining() < 4)
            return false;
        out = read_u32_be(data_.data() + pos_);
        pos_ += 4;
        return true;
    }

    bool read_u64(uint64_t& out)
    {
        if (remaining() < 8)
            return false;
        out = read_u64_be(data_.data() + pos_);
        pos_ += 8;
        return true;
    }

    bool read_bytes(size_t len, std::span<const uint8_t>& out)
    {
        if (remaining() < len)
            return false;
        out = data_.subspan(pos_, len);
        pos_ += len;
        return true;
    }

    bool skip_padding()
    {
        size_t aligned = (pos_ + OSC_ALIGNMENT - 1) / OSC_ALIGNMENT * OSC_ALIGNMENT;
        if (aligned > data_.size())
            return false;
        pos_ = aligned;
        return true;
    }

   private:
    std::span<const uint8_t> data_;
    size_t                   pos_ = 0;
};

bool read_argument(Reader& r, char tag, std::vector<Value>& args)
{
    switch (tag)
    {
        case 'i':
        case 'c':
        case 'r':
        case 'm':
        {
            uint32_t v = 0;
            if (!r.read_u32(v))
                return false;
            args.emplace_back(static_cast<int32_t>(v));
            return true;
        }
        case 'h':
        case 't':
        {
            uint64_t v = 0;
            if (!r.read_u64(v))
                return false;
            args.emplace_back(static_cast<int64_t>(v));
            return true;
        }
        case 'f':
        {
            uint32_t v = 0;
            if (!r.read_u32(v))
                return false;
            args.emplace_back(std::bit_cast<float>(v));
            return true;
        }
        case 'd':
        {
            uint64_t v = 0;
            if (!r.read_u64(v))
                return false;
            args.emplace_back(std::bit_cast<double>(v));
            return true;
        }
        case 's':
        case 'S':
        {
            std::string s;
            if (!r.read_string(s))
                return false;
            args.emplace_back(std::move(s));
            return true;
        }
        case 'b':
        {
            uint32_t len = 0;
            if (!r.read_u32(len))
                return false;
            std::span<const uint8_t> bytes;
            if (!r.read_bytes(len, bytes) || !r.skip_padding())
                return false;
            args.emplace_back(Blob(bytes.begin(), bytes.end()));
            return true;
        }
        case 'T':
            args.emplace_back(true);
            return true;
        case 'F':
            args.emplace_back(false);
            return true;
        case 'N':
        case 'I':
            args.emplace_back(Nil{});
            return true;
        default:
            return false;   // unknown or array tags
    }
}

bool decode_into(std::span<const uint8_t> data, std::vector<Message>& out, size_t depth);

bool decode_bundle_into(std::span<const uint8_t> data, std::vector<Message>& out, size_t depth)
{
    if (depth > MAX_BUNDLE_DEPTH)
        return false;

    Reader      r(data);
    std::string marker;
    uint64_t    timetag = 0;
    if (!r.read_string(marker) || marker != BUNDLE_TAG || !r.read_u64(timetag))
        return false;

    while (!r.at_end())
    {
        uint32_t size = 0;
        if (!r.read_u32(size) || size % OSC_ALIGNMENT != 0)
            return false;
        std::span<const uint8_t> element;
        if (!r.read_bytes(size, element))
            return false;
        if (!decode_into(element, out, depth + 1))
            return false;
    }
    return true;
}

bool decode_into(std::span<const uint8_t> data, std::vector<Message>& out, size_t depth)
{
    if (is_bundle(data))
        return decode_bundle_into(data, out, depth);

    auto msg = decode_message(data);
    if (!msg)
        return false;
    out.push_back(std::move(*msg));
    return true;
}

}   // namespace

// ─── Message encode/decode ───────────────────────────────────────────────────

std::vector<uint8_t> encode_message(const Message& msg)
{
    std::vector<uint8_t> out;
    out.reserve(padded_string_size(msg.address.size()) + 8 + msg.args.size() * 8);

    write_string(out, msg.address);

    std::string tags(1, ',');
    for (const auto& arg : msg.args)
        tags += type_tag(arg);
    write_string(out, tags);

    for (const auto& arg : msg.args)
    {
        if (auto* i = std::get_if<int32_t>(&arg))
            write_u32_be(out, static_cast<uint32_t>(*i));
        else if (auto* h = std::get_if<int64_t>(&arg))
            write_u64_be(out, static_cast<uint64_t>(*h));
        else if (auto* f = std::get_if<float>(&arg))
            write_u32_be(out, std::bit_cast<uint32_t>(*f));
        else if (auto* d = std::get_if<double>(&arg))
            write_u64_be(out, std::bit_cast<uint64_t>(*d));
        else if (auto* s = std::get_if<std::string>(&arg))
            write_string(out, *s);
        else if (auto* b = std::get_if<Blob>(&arg))
        {
            write_u32_be(out, static_cast<uint32_t>(b->size()));
            out.insert(out.end(), b->begin(), b->end());
            pad_to_alignment(out);
        }
        // bool and Nil carry no payload bytes
    }
    return out;
}

std::vector<uint8_t> encode_bundle(const std::vector<Message>& msgs, uint64_t timetag)
{
    std::vector<uint8_t> out;
    write_string(out, BUNDLE_TAG);
    write_u64_be(out, timetag);
    for (const auto& msg : msgs)
    {
        auto element = encode_message(msg);
        write_u32_be(out, static_cast<uint32_t>(element.size()));
        out.insert(out.end(), element.begin(), element.end());
    }
    return out;
}

std::optional<Message> decode_message(std::span<const uint8_t> data)
{
    if (data.empty() || data.size() > MAX_PACKET_SIZE || data.size() % OSC_ALIGNMENT != 0)
        return std::nullopt;

    Reader  r(data);
    Message msg;
    if (!r.read_string(msg.address) || msg.address.empty() || msg.address[0] != '/')
        return std::nullopt;

    // Some senders omit the type tag string entirely for argument-less messages.
    if (r.at_end())
        return msg;

    std::string tags;
    if (!r.read_string(tags) || tags.empty() || tags[0] != ',')
        return std::nullopt;

    msg.args.reserve(tags.size() - 1);
    for (size_t i = 1; i < tags.size(); ++i)
    {
        if (!read_argument(r, tags[i], msg.args))
            return std::nullopt;
    }
    return msg;
}

std::optional<std::vector<Message>> decode_packet(std::span<const uint8_t> data)
{
    if (data.size() > MAX_PACKET_SIZE)
        return std::nullopt;

    std::vector<Message> out;
    if (!decode_into(data, out, 0))
        return std::nullopt;
    return out;
}

bool is_bundle(std::span<const uint8_t> data)
{
    static constexpr size_t marker_len = sizeof(BUNDLE_TAG);   // includes terminator
    return data.size() >= marker_len && std::memcmp(data.data(), BUNDLE_TAG, marker_len) == 0;
}

}   // namespace eoslink::osc
