#include "framing.hpp"

#include "codec.hpp"

namespace eoslink::osc
{

// ─── Framer ──────────────────────────────────────────────────────────────────

std::optional<std::vector<uint8_t>> Framer::next_packet()
{
    if (ready_.empty())
        return std::nullopt;
    auto packet = std::move(ready_.front());
    ready_.pop_front();
    return packet;
}

void Framer::reset()
{
    ready_.clear();
}

// ─── PacketLengthFramer ──────────────────────────────────────────────────────

std::vector<uint8_t> PacketLengthFramer::frame(std::span<const uint8_t> packet) const
{
    std::vector<uint8_t> out;
    out.reserve(4 + packet.size());
    auto len = static_cast<uint32_t>(packet.size());
    out.push_back(static_cast<uint8_t>((len >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((len >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(len & 0xFF));
    out.insert(out.end(), packet.begin(), packet.end());
    return out;
}

bool PacketLengthFramer::feed(std::span<const uint8_t> bytes)
{
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());

    size_t pos = 0;
    while (buffer_.size() - pos >= 4)
    {
        const uint8_t* p   = buffer_.data() + pos;
        uint32_t       len = (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16)
                     | (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
        if (len > MAX_PACKET_SIZE)
        {
            buffer_.clear();
            return false;
        }
        if (buffer_.size() - pos - 4 < len)
            break;
        ready_.emplace_back(p + 4, p + 4 + len);
        pos += 4 + len;
    }
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(pos));
    return true;
}

void PacketLengthFramer::reset()
{
    Framer::reset();
    buffer_.clear();
}

// ─── SlipFramer ──────────────────────────────────────────────────────────────

std::vector<uint8_t> SlipFramer::frame(std::span<const uint8_t> packet) const
{
    std::vector<uint8_t> out;
    out.reserve(packet.size() + 8);
    out.push_back(END);
    for (uint8_t b : packet)
    {
        if (b == END)
        {
            out.push_back(ESC);
            out.push_back(ESC_END);
        }
        else if (b == ESC)
        {
            out.push_back(ESC);
            out.push_back(ESC_ESC);
        }
        else
        {
            out.push_back(b);
        }
    }
    out.push_back(END);
    return out;
}

bool SlipFramer::feed(std::span<const uint8_t> bytes)
{
    for (uint8_t b : bytes)
    {
        if (discarding_)
        {
            if (b == END)
                discarding_ = false;
            continue;
        }

        if (escaping_)
        {
            escaping_ = false;
            if (b == ESC_END)
                current_.push_back(END);
            else if (b == ESC_ESC)
                current_.push_back(ESC);
            else
            {
                // Protocol violation: drop the partial packet and resync on the next END.
                current_.clear();
                discarding_ = (b != END);
            }
            continue;
        }

        if (b == END)
        {
            // Empty frames come from the leading END of the double-END convention.
            if (!current_.empty())
            {
                ready_.push_back(std::move(current_));
                current_.clear();
            }
        }
        else if (b == ESC)
        {
            escaping_ = true;
        }
        else
        {
            current_.push_back(b);
            if (current_.size() > MAX_PACKET_SIZE)
            {
                current_.clear();
                return false;
            }
        }
    }
    return true;
}

void SlipFramer::reset()
{
    Framer::reset();
    current_.clear();
    escaping_   = false;
    discarding_ = false;
}

// ─── DatagramFramer ──────────────────────────────────────────────────────────

std::vector<uint8_t> DatagramFramer::frame(std::span<const uint8_t> packet) const
{
    return std::vector<uint8_t>(packet.begin(), packet.end());
}

bool DatagramFramer::feed(std::span<const uint8_t> bytes)
{
    if (!bytes.empty())
        ready_.emplace_back(bytes.begin(), bytes.end());
    return true;
}

// ─── Factory ─────────────────────────────────────────────────────────────────

std::unique_ptr<Framer> make_framer(FramingMode mode)
{
    switch (mode)
    {
        case FramingMode::PacketLength:
            return std::make_unique<PacketLengthFramer>();
        case FramingMode::Slip:
            return std::make_unique<SlipFramer>();
        case FramingMode::Datagram:
            return std::make_unique<DatagramFramer>();
    }
    return nullptr;
}

}   // namespace eoslink::osc
