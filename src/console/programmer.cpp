#include <eoslink/console.hpp>
#include <eoslink/error.hpp>
#include <eoslink/logger.hpp>
#include <eoslink/programmer.hpp>

#include "record_codec.hpp"

#include <optional>

namespace eoslink
{

namespace
{

// Macro editor softkey that switches to key-entry mode.
constexpr const char* MACRO_EDIT_SOFTKEY = "softkey_6";

constexpr std::chrono::milliseconds MACRO_EDITOR_SETTLE{100};

// Runs `query`; absence (timeout, incomplete) yields std::nullopt.
template <typename Query>
auto find_existing(Query&& query) -> std::optional<decltype(query())>
{
    try
    {
        return query();
    }
    catch (const ConsoleError& e)
    {
        if (!indicates_absence(e))
            throw;
        EOSLINK_LOG_DEBUG("programmer", "treating as absent: {}", e.what());
        return std::nullopt;
    }
}

std::string group_command(const GroupProperties& group, std::string_view clause)
{
    return "Group " + format_number(group.number) + " " + std::string(clause) + " #";
}

}   // namespace

bool Programmer::cue_exists(const Cue& cue)
{
    return find_existing([&] { return console_.get_cue(cue); }).has_value();
}

void Programmer::record_blank_cue(const Cue& cue)
{
    console_.blind();
    if (cue_exists(cue))
        return;
    EOSLINK_LOG_INFO("programmer", "recording blank cue {}", cue.cue_format());
    console_.send_command(cue_command(cue, "#"));
}

void Programmer::intensity_block_cue(const Cue& cue)
{
    if (console_.get_cue(cue).is_intensity_blocked())
        return;
    console_.send_command(cue_command(cue, "Intensity Block"));
}

void Programmer::block_cue(const Cue& cue)
{
    if (console_.get_cue(cue).is_blocked())
        return;
    console_.send_command(cue_command(cue, "Block"));
}

void Programmer::assert_cue(const Cue& cue)
{
    if (console_.get_cue(cue).is_asserted())
        return;
    console_.send_command(cue_command(cue, "Assert"));
}

void Programmer::set_time(const Cue& cue, double seconds)
{
    console_.send_command(cue_command(cue, "Time " + format_number(seconds)));
}

void Programmer::add_scene(const Cue& cue, const std::string& scene)
{
    auto props = console_.get_cue(cue);
    if (props.scene == scene)
        return;
    if (!props.scene.empty())
        EOSLINK_LOG_WARN("programmer", "renaming scene on cue {} ({})", cue.cue_format(), props.scene);
    console_.send_command(cue_command(cue, "Scene " + scene));
}

void Programmer::record_group(const GroupProperties& group, bool overwrite)
{
    console_.open_tab(Tab::Groups);

    const auto num      = format_number(group.number);
    auto       existing = find_existing([&] { return console_.get_group(group.number); });

    if (!existing)
    {
        EOSLINK_LOG_INFO("programmer", "creating group {}", num);
        console_.send_command(group.channel_selection() + " Record Group " + num + " #");
        if (!group.label.empty())
            console_.send_command(group_command(group, "Label " + group.label));
        return;
    }

    const bool label_differs    = existing->label != group.label;
    const bool channels_differ = existing->channels != group.channels;
    if (!label_differs && !channels_differ)
        return;
    if (!overwrite)
        throw ConsoleError("group " + num + " exists and differs from the requested group");

    if (label_differs)
    {
        EOSLINK_LOG_INFO("programmer", "updating group {} label to '{}'", num, group.label);
        console_.send_command(group_command(group, "Label " + group.label));
    }
    if (channels_differ)
    {
        EOSLINK_LOG_INFO("programmer",
                         "updating group {} channels to {} (was {})",
                         num,
                         group.channel_selection(),
                         existing->channel_selection());
        console_.send_command(group.channel_selection() + " Record Group " + num + " #");
    }
}

void Programmer::record_macro(double number, const std::vector<std::string>& keys)
{
    console_.open_tab(Tab::Macros);

    const auto num = format_number(number);
    if (find_existing([&] { return console_.get_macro(number); }))
        throw ConsoleError("macro " + num + " already exists");

    EOSLINK_LOG_INFO("programmer", "recording macro {}", num);
    console_.send_command(num + " #");
    console_.press_key(MACRO_EDIT_SOFTKEY);
    console_.update(MACRO_EDITOR_SETTLE);
    for (const auto& key : keys)
        console_.press_key(key);
    console_.press_key("Select");
}

}   // namespace eoslink
