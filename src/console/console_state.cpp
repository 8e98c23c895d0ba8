#include "console_state.hpp"

#include "record_codec.hpp"

#include <eoslink/error.hpp>
#include <eoslink/logger.hpp>

#include <exception>

namespace eoslink
{

namespace
{

const osc::Value& first_arg(const osc::Message& msg)
{
    if (msg.args.empty())
        throw DecodeError("no arguments");
    return msg.args.front();
}

}   // namespace

template <typename Mutate>
void ConsoleStateModel::apply(const osc::Message& msg, Mutate&& mutate)
{
    try
    {
        if (!mutate(state_))
            return;
    }
    catch (const ConsoleError& e)
    {
        EOSLINK_LOG_WARN("state", "ignoring malformed {}: {}", osc::describe(msg), e.what());
        return;
    }
    if (!on_change_)
        return;
    try
    {
        on_change_(state_);
    }
    catch (const std::exception& e)
    {
        EOSLINK_LOG_WARN("state", "change callback failed after {}: {}", msg.address, e.what());
    }
}

void ConsoleStateModel::on_cue(const osc::Message& msg, std::optional<Cue> ConsoleState::*slot)
{
    // The structured variant repeats what "/text" carries.
    if (!msg.address.ends_with("/text"))
        return;

    apply(msg,
          [&](ConsoleState& s)
          {
              auto text = coerce_string(first_arg(msg), "cue text");
              if (text.empty())
                  s.*slot = std::nullopt;
              else
                  s.*slot = Cue::from_text(text);
              return true;
          });
}

void ConsoleStateModel::attach(AddressRouter& router)
{
    detach();

    auto add = [&](const char* pattern, AddressRouter::Handler handler)
    { registrations_.emplace_back(router, router.add_handler(pattern, std::move(handler))); };

    add("/eos/out/user",
        [this](const osc::Message& msg)
        {
            apply(msg,
                  [&](ConsoleState& s)
                  {
                      s.user = coerce_int(first_arg(msg), "user");
                      return true;
                  });
        });
    add("/eos/out/previous/cue*",
        [this](const osc::Message& msg) { on_cue(msg, &ConsoleState::previous_cue); });
    add("/eos/out/active/cue*",
        [this](const osc::Message& msg) { on_cue(msg, &ConsoleState::active_cue); });
    add("/eos/out/pending/cue*",
        [this](const osc::Message& msg) { on_cue(msg, &ConsoleState::pending_cue); });
    add("/eos/out/show/name",
        [this](const osc::Message& msg)
        {
            apply(msg,
                  [&](ConsoleState& s)
                  {
                      s.show_name = coerce_string(first_arg(msg), "show name");
                      return true;
                  });
        });
    add("/eos/out/state",
        [this](const osc::Message& msg)
        {
            apply(msg,
                  [&](ConsoleState& s)
                  {
                      s.state = coerce_int(first_arg(msg), "state");
                      return true;
                  });
        });
    add("/eos/out/locked",
        [this](const osc::Message& msg)
        {
            apply(msg,
                  [&](ConsoleState& s)
                  {
                      s.locked = coerce_bool(first_arg(msg), "locked");
                      return true;
                  });
        });
    add("/eos/out/softkey/*",
        [this](const osc::Message& msg)
        {
            apply(msg,
                  [&](ConsoleState& s)
                  {
                      auto index = parse_integer(
                          std::string_view(msg.address).substr(sizeof("/eos/out/softkey/") - 1));
                      auto key = index ? narrow_int(*index) : std::nullopt;
                      if (!key)
                          throw DecodeError("softkey number missing from address");
                      s.softkeys[*key] =
                          coerce_string(first_arg(msg), "softkey label");
                      return true;
                  });
        });
    add("/eos/out/cmd",
        [this](const osc::Message& msg)
        {
            apply(msg,
                  [&](ConsoleState& s)
                  {
                      s.command_line = coerce_string(first_arg(msg), "command line");
                      return true;
                  });
        });

    EOSLINK_LOG_DEBUG("state", "attached {} notification handlers", registrations_.size());
}

void ConsoleStateModel::detach()
{
    registrations_.clear();
}

}   // namespace eoslink
