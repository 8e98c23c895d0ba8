#include "record_codec.hpp"

#include <charconv>
#include <cmath>
#include <limits>

namespace eoslink
{

// ─── Schemas ─────────────────────────────────────────────────────────────────

namespace
{

using CP = CueProperties;

// Order matches the console's base cue reply.
const RecordSchema<CueProperties, CUE_PROPERTY_FIELD_COUNT> CUE_SCHEMA = {{
    {"index", &CP::cueindex},
    {"uid", &CP::uid},
    {"label", &CP::label},
    {"up time", &CP::uptime},
    {"up delay", &CP::updelay},
    {"down time", &CP::downtime},
    {"down delay", &CP::downdelay},
    {"focus time", &CP::focustime},
    {"focus delay", &CP::focusdelay},
    {"color time", &CP::colortime},
    {"color delay", &CP::colordelay},
    {"beam time", &CP::beamtime},
    {"beam delay", &CP::beamdelay},
    {"preheat", &CP::preheat},
    {"curve", &CP::curve},
    {"rate", &CP::rate},
    {"mark", &CP::markstr},
    {"block", &CP::blockstr},
    {"assert", &CP::assertstr},
    {"link", &CP::links},
    {"follow time", &CP::followtime},
    {"hang time", &CP::hangtime},
    {"all fade", &CP::allfade},
    {"loop", &CP::numloops},
    {"solo", &CP::solo},
    {"timecode", &CP::timecode},
    {"part count", &CP::partcount},
    {"notes", &CP::notes},
    {"scene", &CP::scene},
    {"scene end", &CP::scene_end},
    {"part index", &CP::cuepartindex},
}};

// Leading (index, uid, label[, mode]) shared by group and macro replies.
struct ListHeader
{
    int         index = 0;
    std::string uid;
    std::string label;
    std::string mode;
};

const RecordSchema<ListHeader, 3> GROUP_HEADER_SCHEMA = {{
    {"index", &ListHeader::index},
    {"uid", &ListHeader::uid},
    {"label", &ListHeader::label},
}};

const RecordSchema<ListHeader, 4> MACRO_HEADER_SCHEMA = {{
    {"index", &ListHeader::index},
    {"uid", &ListHeader::uid},
    {"label", &ListHeader::label},
    {"mode", &ListHeader::mode},
}};

[[noreturn]] void bad_field(std::string_view field, const osc::Value& v)
{
    throw DecodeError("field '" + std::string(field) + "' cannot hold "
                      + osc::to_display_string(v) + " ('" + osc::type_tag(v) + "')");
}

std::vector<std::string_view> split(std::string_view text, char sep)
{
    std::vector<std::string_view> parts;
    size_t                        start = 0;
    while (true)
    {
        auto pos = text.find(sep, start);
        if (pos == std::string_view::npos)
        {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

// Strips a trailing "list/<i>/<n>" from already split segments.
bool strip_list_suffix(std::vector<std::string_view>& segs, size_t min_keep)
{
    if (segs.size() >= min_keep + 3 && segs[segs.size() - 3] == "list")
    {
        if (!parse_integer(segs[segs.size() - 2]) || !parse_integer(segs.back()))
            return false;
        segs.resize(segs.size() - 3);
    }
    return true;
}

}   // namespace

// ─── Coercions ───────────────────────────────────────────────────────────────

int coerce_int(const osc::Value& v, std::string_view field)
{
    if (std::holds_alternative<osc::Nil>(v))
        return 0;
    if (auto i = osc::as_int(v))
    {
        if (auto narrowed = narrow_int(*i))
            return *narrowed;
        bad_field(field, v);
    }
    if (auto s = osc::as_string(v))
    {
        if (s->empty())
            return 0;
        if (auto parsed = parse_integer(*s))
        {
            if (auto narrowed = narrow_int(*parsed))
                return *narrowed;
        }
    }
    bad_field(field, v);
}

double coerce_double(const osc::Value& v, std::string_view field)
{
    if (std::holds_alternative<osc::Nil>(v))
        return 0.0;
    if (auto d = osc::as_double(v))
        return *d;
    if (auto s = osc::as_string(v))
    {
        if (s->empty())
            return 0.0;
        if (auto parsed = parse_decimal(*s))
            return *parsed;
    }
    bad_field(field, v);
}

std::string coerce_string(const osc::Value& v, std::string_view field)
{
    if (std::holds_alternative<osc::Nil>(v))
        return {};
    if (std::holds_alternative<osc::Blob>(v))
        bad_field(field, v);
    return osc::to_display_string(v);
}

bool coerce_bool(const osc::Value& v, std::string_view field)
{
    if (std::holds_alternative<osc::Nil>(v))
        return false;
    if (auto b = osc::as_bool(v))
        return *b;
    bad_field(field, v);
}

// ─── Record decoders ─────────────────────────────────────────────────────────

CueProperties decode_cue_properties(const Cue& identity, std::span<const osc::Value> args)
{
    CueProperties props;
    props.cuelist = identity.cuelist;
    props.cue     = identity.cue;
    props.part    = identity.part;
    decode_fields("cue " + identity.cue_format(), CUE_SCHEMA, args, props);
    return props;
}

std::optional<std::string> decode_cue_sublist(std::span<const osc::Value> args)
{
    if (args.size() <= 2)
        return std::nullopt;

    std::string out;
    for (size_t i = 2; i < args.size(); ++i)
    {
        if (i > 2)
            out += ", ";
        out += osc::to_display_string(args[i]);
    }
    return out;
}

void decode_group_header(std::span<const osc::Value> args, GroupProperties& out)
{
    ListHeader header;
    decode_fields("group " + format_number(out.number), GROUP_HEADER_SCHEMA, args, header);
    out.uid   = std::move(header.uid);
    out.label = std::move(header.label);
}

void decode_macro_header(std::span<const osc::Value> args, MacroProperties& out)
{
    ListHeader header;
    decode_fields("macro " + format_number(out.number), MACRO_HEADER_SCHEMA, args, header);
    out.uid   = std::move(header.uid);
    out.label = std::move(header.label);
    out.mode  = std::move(header.mode);
}

std::vector<std::string> decode_list_items(std::string_view record_name, std::span<const osc::Value> args)
{
    if (args.size() < 2)
    {
        throw DecodeError(std::string(record_name) + ": expected at least 2 arguments, got "
                          + std::to_string(args.size()));
    }
    std::vector<std::string> items;
    items.reserve(args.size() - 2);
    for (size_t i = 2; i < args.size(); ++i)
        items.push_back(coerce_string(args[i], record_name));
    return items;
}

// ─── Reply addresses ─────────────────────────────────────────────────────────

std::optional<CueReplyAddress> parse_cue_reply(std::string_view address)
{
    static constexpr std::string_view prefix = "/eos/out/get/cue/";
    if (!address.starts_with(prefix))
        return std::nullopt;

    auto segs = split(address.substr(prefix.size()), '/');
    if (segs.size() < 3 || !strip_list_suffix(segs, 3))
        return std::nullopt;

    auto list = parse_integer(segs[0]);
    auto cue  = parse_decimal(segs[1]);
    auto part = parse_integer(segs[2]);
    if (!list || !cue || !part)
        return std::nullopt;
    auto list_int = narrow_int(*list);
    auto part_int = narrow_int(*part);
    if (!list_int || !part_int)
        return std::nullopt;

    CueReplyAddress reply;
    reply.identity = Cue{*list_int, *cue, *part_int};

    if (segs.size() == 3)
        return reply;
    if (segs.size() != 4)
        return std::nullopt;

    if (segs[3] == "fx")
        reply.part = CueReplyPart::Fx;
    else if (segs[3] == "links")
        reply.part = CueReplyPart::Links;
    else if (segs[3] == "actions")
        reply.part = CueReplyPart::Actions;
    else
        return std::nullopt;
    return reply;
}

std::optional<NumberedReplyAddress> parse_numbered_reply(std::string_view address,
                                                         std::string_view target,
                                                         std::string_view detail)
{
    std::string prefix = "/eos/out/get/";
    prefix += target;
    prefix += '/';
    if (!address.starts_with(prefix))
        return std::nullopt;

    auto segs = split(address.substr(prefix.size()), '/');
    if (segs.empty() || !strip_list_suffix(segs, 1))
        return std::nullopt;

    auto number = parse_decimal(segs[0]);
    if (!number)
        return std::nullopt;

    NumberedReplyAddress reply;
    reply.number = *number;
    if (segs.size() == 1)
        return reply;
    if (segs.size() == 2 && segs[1] == detail)
    {
        reply.detail = true;
        return reply;
    }
    return std::nullopt;
}

// ─── Text helpers ────────────────────────────────────────────────────────────

std::optional<long> parse_integer(std::string_view text)
{
    long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || text.empty())
        return std::nullopt;
    return value;
}

std::optional<double> parse_decimal(std::string_view text)
{
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()
        || !std::isfinite(value))
        return std::nullopt;
    return value;
}

std::optional<int> narrow_int(int64_t value)
{
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
        return std::nullopt;
    return static_cast<int>(value);
}

std::string cue_path(const Cue& cue)
{
    return std::to_string(cue.cuelist) + "/" + format_number(cue.cue) + "/"
         + std::to_string(cue.part);
}

std::string cue_command(const Cue& cue, std::string_view clause)
{
    std::string cmd = "Cue " + cue.cue_format();
    if (cue.part != 0)
        cmd += " Part " + std::to_string(cue.part);
    if (!clause.empty())
    {
        cmd += ' ';
        cmd += clause;
    }
    cmd += " #";
    return cmd;
}

}   // namespace eoslink
