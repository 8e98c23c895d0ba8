#pragma once

#include <eoslink/error.hpp>
#include <eoslink/osc.hpp>
#include <eoslink/records.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace eoslink
{

// ─── Schema-driven decoding ──────────────────────────────────────────────────
// A schema is the ordered list of positional fields a reply carries. One
// generic routine checks the argument count against the schema and coerces
// each value into the bound member, so shape errors are caught in one place.

template <typename Record>
struct FieldBinding
{
    std::string_view name;
    std::variant<int Record::*, double Record::*, std::string Record::*, bool Record::*> member;
};

template <typename Record, size_t N>
using RecordSchema = std::array<FieldBinding<Record>, N>;

// Coercions used by the schema decoder. Nil yields the type's default value;
// anything that cannot represent the field throws DecodeError naming it.
int         coerce_int(const osc::Value& v, std::string_view field);
double      coerce_double(const osc::Value& v, std::string_view field);
std::string coerce_string(const osc::Value& v, std::string_view field);
bool        coerce_bool(const osc::Value& v, std::string_view field);

inline void assign_field(int& out, const osc::Value& v, std::string_view field)
{
    out = coerce_int(v, field);
}
inline void assign_field(double& out, const osc::Value& v, std::string_view field)
{
    out = coerce_double(v, field);
}
inline void assign_field(std::string& out, const osc::Value& v, std::string_view field)
{
    out = coerce_string(v, field);
}
inline void assign_field(bool& out, const osc::Value& v, std::string_view field)
{
    out = coerce_bool(v, field);
}

template <typename Record, size_t N>
void decode_fields(std::string_view                record_name,
                   const RecordSchema<Record, N>&  schema,
                   std::span<const osc::Value>     args,
                   Record&                         out)
{
    if (args.size() != N)
    {
        throw DecodeError(std::string(record_name) + ": expected " + std::to_string(N)
                          + " arguments, got " + std::to_string(args.size()));
    }
    for (size_t i = 0; i < N; ++i)
    {
        const auto& field = schema[i];
        std::visit([&](auto member) { assign_field(out.*member, args[i], field.name); },
                   field.member);
    }
}

// ─── Record decoders ─────────────────────────────────────────────────────────

static constexpr size_t CUE_PROPERTY_FIELD_COUNT = 31;

// Base cue reply: 31 positional fields; identity comes from the reply address.
CueProperties decode_cue_properties(const Cue& identity, std::span<const osc::Value> args);

// fx / links / actions replies: (index, uid, data...). Returns std::nullopt
// when the console sent nothing beyond index and uid.
std::optional<std::string> decode_cue_sublist(std::span<const osc::Value> args);

// Group properties reply: (index, uid, label).
void decode_group_header(std::span<const osc::Value> args, GroupProperties& out);

// Macro properties reply: (index, uid, label, mode).
void decode_macro_header(std::span<const osc::Value> args, MacroProperties& out);

// Channel list / macro text replies: (index, uid, item...). Items are
// rendered as text. Throws DecodeError if index or uid is missing.
std::vector<std::string> decode_list_items(std::string_view            record_name,
                                           std::span<const osc::Value> args);

// ─── Reply addresses ─────────────────────────────────────────────────────────
// Consoles append "/list/<index>/<count>" to list replies; the parsers accept
// and ignore it.

enum class CueReplyPart : uint8_t
{
    Base,
    Fx,
    Links,
    Actions,
};

struct CueReplyAddress
{
    Cue          identity;
    CueReplyPart part = CueReplyPart::Base;
};

// "/eos/out/get/cue/<list>/<cue>/<part>[/fx|/links|/actions][/list/<i>/<n>]"
std::optional<CueReplyAddress> parse_cue_reply(std::string_view address);

struct NumberedReplyAddress
{
    double number = 0.0;
    bool   detail = false;   // true for the "/channels" or "/text" part
};

// "/eos/out/get/<target>/<n>[/<detail>][/list/<i>/<n>]"
std::optional<NumberedReplyAddress> parse_numbered_reply(std::string_view address,
                                                         std::string_view target,
                                                         std::string_view detail);

// ─── Text helpers ────────────────────────────────────────────────────────────

std::optional<long>   parse_integer(std::string_view text);
std::optional<double> parse_decimal(std::string_view text);
std::optional<int>    narrow_int(int64_t value);

// "<list>/<cue>/<part>", the path segment used by cue queries.
std::string cue_path(const Cue& cue);

// "Cue 1 / 10 <clause> #", with "Part N" inserted before the clause when part != 0.
std::string cue_command(const Cue& cue, std::string_view clause);

}   // namespace eoslink
