#include <eoslink/error.hpp>
#include <eoslink/records.hpp>

#include "record_codec.hpp"

#include <algorithm>
#include <cstdio>

namespace eoslink
{

std::string format_number(double value)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", value);
    return buf;
}

// ─── Cue ─────────────────────────────────────────────────────────────────────

std::string Cue::cue_format() const
{
    return std::to_string(cuelist) + " / " + format_number(cue);
}

Cue Cue::from_text(std::string_view text)
{
    auto fail = [&](const char* reason)
    {
        return DecodeError("cue text '" + std::string(text) + "': " + reason);
    };

    std::vector<std::string_view> fields;
    size_t                        start = 0;
    while (start <= text.size())
    {
        auto pos = text.find(' ', start);
        if (pos == std::string_view::npos)
            pos = text.size();
        fields.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    if (fields.size() != 2 && fields.size() != 3)
        throw fail("expected 2 or 3 space-separated fields");

    auto slash = fields[0].find('/');
    if (slash == std::string_view::npos)
        throw fail("missing '/' between cue list and cue");

    auto list = parse_integer(fields[0].substr(0, slash));
    auto cue  = parse_decimal(fields[0].substr(slash + 1));
    auto part = parse_integer(fields[1]);
    if (!list || !cue || !part)
        throw fail("non-numeric cue identity");
    auto list_int = narrow_int(*list);
    auto part_int = narrow_int(*part);
    if (!list_int || !part_int)
        throw fail("cue list or part out of range");

    Cue out{*list_int, *cue, *part_int};

    if (fields.size() == 3)
    {
        auto pct = fields[2];
        if (pct.empty() || pct.back() != '%')
            throw fail("progress must end with '%'");
        auto value = parse_decimal(pct.substr(0, pct.size() - 1));
        if (!value || *value < 0.0 || *value > 100.0)
            throw fail("progress outside 0-100%");
        out.percentage = *value / 100.0;
    }
    return out;
}

// ─── Groups ──────────────────────────────────────────────────────────────────

std::string GroupProperties::channel_selection() const
{
    std::string out;
    for (size_t i = 0; i < channels.size(); ++i)
    {
        if (i > 0)
            out += " + ";
        const auto& range = channels[i];
        auto        dash  = range.find('-');
        if (dash == std::string::npos)
            out += range;
        else
            out += range.substr(0, dash) + " Thru " + range.substr(dash + 1);
    }
    return out;
}

// ─── Targets ─────────────────────────────────────────────────────────────────

bool is_countable_target(std::string_view target)
{
    return std::find(COUNTABLE_TARGETS.begin(), COUNTABLE_TARGETS.end(), target)
           != COUNTABLE_TARGETS.end();
}

}   // namespace eoslink
