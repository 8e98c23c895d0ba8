#include <eoslink/osc.hpp>

#include <cmath>
#include <cstdio>
#include <type_traits>

namespace eoslink::osc
{

char type_tag(const Value& v)
{
    return std::visit(
        [](const auto& x) -> char
        {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, Nil>)
                return 'N';
            else if constexpr (std::is_same_v<T, bool>)
                return x ? 'T' : 'F';
            else if constexpr (std::is_same_v<T, int32_t>)
                return 'i';
            else if constexpr (std::is_same_v<T, int64_t>)
                return 'h';
            else if constexpr (std::is_same_v<T, float>)
                return 'f';
            else if constexpr (std::is_same_v<T, double>)
                return 'd';
            else if constexpr (std::is_same_v<T, std::string>)
                return 's';
            else
                return 'b';
        },
        v);
}

std::optional<int64_t> as_int(const Value& v)
{
    if (auto* i = std::get_if<int32_t>(&v))
        return *i;
    if (auto* h = std::get_if<int64_t>(&v))
        return *h;
    if (auto* b = std::get_if<bool>(&v))
        return *b ? 1 : 0;
    if (auto d = as_double(v))
    {
        // 2^63 is exact as a double; anything at or beyond it does not fit.
        constexpr double limit = 9223372036854775808.0;
        if (std::isfinite(*d) && std::trunc(*d) == *d && *d >= -limit && *d < limit)
            return static_cast<int64_t>(*d);
    }
    return std::nullopt;
}

std::optional<double> as_double(const Value& v)
{
    if (auto* f = std::get_if<float>(&v))
        return static_cast<double>(*f);
    if (auto* d = std::get_if<double>(&v))
        return *d;
    if (auto* i = std::get_if<int32_t>(&v))
        return static_cast<double>(*i);
    if (auto* h = std::get_if<int64_t>(&v))
        return static_cast<double>(*h);
    return std::nullopt;
}

std::optional<bool> as_bool(const Value& v)
{
    if (auto* b = std::get_if<bool>(&v))
        return *b;
    if (auto* i = std::get_if<int32_t>(&v))
        return *i != 0;
    if (auto* h = std::get_if<int64_t>(&v))
        return *h != 0;
    if (auto* f = std::get_if<float>(&v))
        return *f != 0.0f;
    if (auto* d = std::get_if<double>(&v))
        return *d != 0.0;
    return std::nullopt;
}

std::optional<std::string> as_string(const Value& v)
{
    if (auto* s = std::get_if<std::string>(&v))
        return *s;
    return std::nullopt;
}

std::string to_display_string(const Value& v)
{
    return std::visit(
        [](const auto& x) -> std::string
        {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, Nil>)
                return "nil";
            else if constexpr (std::is_same_v<T, bool>)
                return x ? "true" : "false";
            else if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t>)
                return std::to_string(x);
            else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>)
            {
                char buf[32];
                std::snprintf(buf, sizeof(buf), "%g", static_cast<double>(x));
                return buf;
            }
            else if constexpr (std::is_same_v<T, std::string>)
                return x;
            else
                return "<blob " + std::to_string(x.size()) + " bytes>";
        },
        v);
}

std::string describe(const Message& msg)
{
    std::string out = msg.address;
    out += " [";
    for (size_t i = 0; i < msg.args.size(); ++i)
    {
        if (i > 0)
            out += ", ";
        if (std::holds_alternative<std::string>(msg.args[i]))
            out += '"' + std::get<std::string>(msg.args[i]) + '"';
        else
            out += to_display_string(msg.args[i]);
    }
    out += ']';
    return out;
}

std::string_view framing_name(FramingMode mode)
{
    switch (mode)
    {
        case FramingMode::PacketLength:
            return "packet_length";
        case FramingMode::Slip:
            return "slip";
        case FramingMode::Datagram:
            return "udp";
    }
    return "unknown";
}

std::optional<FramingMode> parse_framing(std::string_view name)
{
    if (name == "packet_length" || name == "tcp10")
        return FramingMode::PacketLength;
    if (name == "slip" || name == "tcp11")
        return FramingMode::Slip;
    if (name == "udp" || name == "datagram")
        return FramingMode::Datagram;
    return std::nullopt;
}

}   // namespace eoslink::osc
