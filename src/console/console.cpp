#include <eoslink/console.hpp>
#include <eoslink/error.hpp>
#include <eoslink/logger.hpp>

#include "../osc/socket_transport.hpp"
#include "address_router.hpp"
#include "console_state.hpp"
#include "record_assembler.hpp"
#include "record_codec.hpp"
#include "request_engine.hpp"

#include <stdexcept>

namespace eoslink
{

namespace
{

// Pause after the tab keypad opens, before the digits are typed.
constexpr std::chrono::milliseconds TAB_KEYPAD_SETTLE{100};

EngineTiming timing_from(const SessionConfig& config)
{
    EngineTiming t;
    t.timeout       = config.timeout();
    t.poll_interval = config.poll_interval();
    return t;
}

}   // namespace

Console::Console(std::unique_ptr<osc::Transport> transport, const SessionConfig& config)
    : config_(config),
      transport_(std::move(transport)),
      router_(std::make_unique<AddressRouter>()),
      engine_(std::make_unique<RequestEngine>(*transport_, *router_, timing_from(config))),
      state_(std::make_unique<ConsoleStateModel>())
{
    state_->attach(*router_);
    router_->set_default_handler([](const osc::Message& msg)
                                 { EOSLINK_LOG_DEBUG("console", "unhandled {}", osc::describe(msg)); });
}

Console::~Console() = default;

std::unique_ptr<Console> Console::connect(const SessionConfig& config)
{
    auto transport = osc::SocketTransport::connect(config.transport());
    if (!transport)
        return nullptr;

    auto console = std::make_unique<Console>(std::move(transport), config);
    try
    {
        console->start();
    }
    catch (const TransportError& e)
    {
        EOSLINK_LOG_ERROR("console", "announce to {}:{} failed: {}", config.host, config.port, e.what());
        return nullptr;
    }
    EOSLINK_LOG_INFO("console",
                     "connected to {}:{} ({})",
                     config.host,
                     config.port,
                     osc::framing_name(config.framing));
    return console;
}

void Console::start()
{
    engine_->send(Request{"/eos/sc/Connected from " + config_.client_name, {}});
}

// ─── Queries ─────────────────────────────────────────────────────────────────

std::chrono::milliseconds Console::ping(const std::string& token)
{
    const auto started = std::chrono::steady_clock::now();

    bool ok = engine_->exchange(Request{"/eos/ping", {token}},
                                "/eos/out/ping",
                                [&](const osc::Message& msg)
                                {
                                    auto echo = msg.args.empty()
                                                  ? std::nullopt
                                                  : osc::as_string(msg.args.front());
                                    if (!echo || *echo != token)
                                    {
                                        throw ProtocolMismatchError("ping echo mismatch: sent '" + token
                                                                    + "', got " + osc::describe(msg));
                                    }
                                    return true;
                                });
    if (!ok)
    {
        throw TimeoutError("no ping reply within " + std::to_string(engine_->timing().timeout.count())
                           + " ms");
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now()
                                                                 - started);
}

std::string Console::get_version()
{
    auto replies = engine_->call(Request{"/eos/get/version", {}},
                                 "/eos/out/get/version",
                                 [](const ReplyLog&) { return true; });
    const auto& msg = replies.last();
    if (msg.args.empty())
        throw DecodeError("version reply carries no arguments");
    return coerce_string(msg.args.front(), "version");
}

int Console::get_target_count(const std::string& target, int cuelist)
{
    if (!is_countable_target(target))
        throw std::invalid_argument("cannot count console target '" + target + "'");

    std::string query = target == "cue" ? "get/cue/" + std::to_string(cuelist) + "/count"
                                        : "get/" + target + "/count";

    auto replies = engine_->call(Request{"/eos/" + query, {}},
                                 "/eos/out/" + query,
                                 [](const ReplyLog&) { return true; });
    const auto& msg = replies.last();
    if (msg.args.empty())
        throw DecodeError(query + " reply carries no arguments");
    return coerce_int(msg.args.front(), "count");
}

CueProperties Console::get_cue(const Cue& cue)
{
    return assemble(*engine_, cue_query(cue));
}

CueProperties Console::get_cue_by_index(int index, int cuelist)
{
    return assemble(*engine_, cue_index_query(index, cuelist));
}

CueProperties Console::get_cue_by_uid(const std::string& uid)
{
    return assemble(*engine_, cue_uid_query(uid));
}

GroupProperties Console::get_group(double number)
{
    return assemble(*engine_, group_query(number));
}

MacroProperties Console::get_macro(double number)
{
    return assemble(*engine_, macro_query(number));
}

// ─── Commands ────────────────────────────────────────────────────────────────

void Console::press_key(const std::string& key)
{
    engine_->send(Request{"/eos/key/" + key, {}});
}

void Console::send_command(const std::string& commandline)
{
    EOSLINK_LOG_DEBUG("console", "command: {}", commandline);
    engine_->send(Request{"/eos/newcmd", {commandline}});
}

void Console::open_tab(Tab tab)
{
    engine_->send(Request{"/eos/key/Tab", {1.0f}});
    engine_->pump_for(TAB_KEYPAD_SETTLE);
    for (char digit : std::to_string(static_cast<int>(tab)))
        press_key(std::string(1, digit));
    engine_->send(Request{"/eos/key/Tab", {0.0f}});
}

void Console::blind()
{
    press_key("Blind");
}

void Console::live()
{
    press_key("Live");
}

// ─── Notifications ───────────────────────────────────────────────────────────

size_t Console::update(std::chrono::milliseconds duration)
{
    return engine_->pump_for(duration);
}

const ConsoleState& Console::state() const
{
    return state_->snapshot();
}

void Console::set_on_state_change(std::function<void(const ConsoleState&)> cb)
{
    state_->set_on_change(std::move(cb));
}

}   // namespace eoslink
