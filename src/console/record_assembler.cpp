#include "record_assembler.hpp"

#include "record_codec.hpp"

namespace eoslink
{

namespace
{

bool same_identity(const CueProperties& props, const Cue& cue)
{
    return props.cuelist == cue.cuelist && props.cue == cue.cue && props.part == cue.part;
}

// Group and macro replies share one shape: base properties plus one list part.
template <typename Record>
RecordQuery<Record> numbered_query(const char*  target,
                                   const char*  detail,
                                   double       number,
                                   size_t       expected_count,
                                   void (*decode_header)(std::span<const osc::Value>, Record&),
                                   std::vector<std::string> Record::*items)
{
    const auto  num  = format_number(number);
    std::string name = std::string(target) + " " + num;

    RecordQuery<Record> query;
    query.name           = name;
    query.request        = Request{"/eos/get/" + std::string(target) + "/" + num, {}};
    query.reply_pattern  = "/eos/out/get/" + std::string(target) + "/" + num + "*";
    query.expected_count = expected_count;
    query.route = [target, detail, number, decode_header, items, name](const osc::Message& msg,
                                                                       Assembly<Record>&   acc)
    {
        auto reply = parse_numbered_reply(msg.address, target, detail);
        if (!reply || reply->number != number)
            return RouteResult::Ignore;

        acc.record.number = number;
        if (reply->detail)
        {
            acc.record.*items = decode_list_items(name + " " + detail, msg.args);
            return RouteResult::Part;
        }
        decode_header(msg.args, acc.record);
        return RouteResult::Base;
    };
    return query;
}

}   // namespace

RecordQuery<CueProperties> cue_query(std::string        name,
                                     std::string        query_path,
                                     std::string        reply_pattern,
                                     std::optional<Cue> expected)
{
    RecordQuery<CueProperties> query;
    query.name           = std::move(name);
    query.request        = Request{"/eos/" + query_path, {}};
    query.reply_pattern  = std::move(reply_pattern);
    query.expected_count = CUE_MESSAGE_COUNT;
    query.route          = [expected](const osc::Message& msg, Assembly<CueProperties>& acc)
    {
        auto reply = parse_cue_reply(msg.address);
        if (!reply)
            return RouteResult::Ignore;

        const Cue& id = reply->identity;
        if (expected && !(expected->cuelist == id.cuelist && expected->cue == id.cue
                          && expected->part == id.part))
        {
            return RouteResult::Ignore;
        }
        if (acc.received == 0)
        {
            acc.record.cuelist = id.cuelist;
            acc.record.cue     = id.cue;
            acc.record.part    = id.part;
        }
        else if (!same_identity(acc.record, id))
        {
            return RouteResult::Ignore;
        }

        switch (reply->part)
        {
            case CueReplyPart::Base:
            {
                auto decoded        = decode_cue_properties(id, msg.args);
                decoded.fx          = std::move(acc.record.fx);
                decoded.linked_cues = std::move(acc.record.linked_cues);
                decoded.actions     = std::move(acc.record.actions);
                acc.record          = std::move(decoded);
                return RouteResult::Base;
            }
            case CueReplyPart::Fx:
                acc.record.fx = decode_cue_sublist(msg.args);
                return RouteResult::Part;
            case CueReplyPart::Links:
                acc.record.linked_cues = decode_cue_sublist(msg.args);
                return RouteResult::Part;
            case CueReplyPart::Actions:
                acc.record.actions = decode_cue_sublist(msg.args);
                return RouteResult::Part;
        }
        return RouteResult::Ignore;
    };
    return query;
}

RecordQuery<CueProperties> cue_query(const Cue& cue)
{
    auto path = "get/cue/" + cue_path(cue);
    return cue_query("cue " + cue.cue_format() + " part " + std::to_string(cue.part),
                     path,
                     "/eos/out/" + path + "*",
                     cue);
}

RecordQuery<CueProperties> cue_index_query(int index, int cuelist)
{
    auto list = std::to_string(cuelist);
    return cue_query("cue index " + std::to_string(index) + " in list " + list,
                     "get/cue/" + list + "/index/" + std::to_string(index),
                     "/eos/out/get/cue/" + list + "/*",
                     std::nullopt);
}

RecordQuery<CueProperties> cue_uid_query(const std::string& uid)
{
    return cue_query("cue uid " + uid, "get/cue/uid/" + uid, "/eos/out/get/cue/*", std::nullopt);
}

RecordQuery<GroupProperties> group_query(double number)
{
    return numbered_query<GroupProperties>("group", "channels", number, GROUP_MESSAGE_COUNT,
                                           &decode_group_header,
                                           &GroupProperties::channels);
}

RecordQuery<MacroProperties> macro_query(double number)
{
    return numbered_query<MacroProperties>("macro", "text", number, MACRO_MESSAGE_COUNT,
                                           &decode_macro_header,
                                           &MacroProperties::command);
}

}   // namespace eoslink
