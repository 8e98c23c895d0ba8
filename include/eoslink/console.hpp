#pragma once

#include <eoslink/config.hpp>
#include <eoslink/fwd.hpp>
#include <eoslink/osc.hpp>
#include <eoslink/records.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace eoslink
{

// One session with a console.
//
// Owns the transport, the address router, the request engine and the state
// model. Queries block the calling thread for at most the configured timeout
// and keep dispatching push notifications while they wait. Failures are
// reported as ConsoleError subclasses (see error.hpp). Not thread-safe.
class Console
{
   public:
    explicit Console(std::unique_ptr<osc::Transport> transport, const SessionConfig& config = {});
    ~Console();

    Console(const Console&)            = delete;
    Console& operator=(const Console&) = delete;

    // Opens a socket transport from `config` and announces the client.
    // Returns nullptr if the console cannot be reached; the reason is logged.
    static std::unique_ptr<Console> connect(const SessionConfig& config);

    // Sends the "/eos/sc/Connected from <client>" announcement.
    void start();

    // ─── Queries ─────────────────────────────────────────────────────────

    // Round trip of "/eos/ping". Throws ProtocolMismatchError if the echo
    // differs from `token`, TimeoutError if nothing comes back.
    std::chrono::milliseconds ping(const std::string& token = "");

    std::string get_version();

    // Throws std::invalid_argument for a target the console cannot count.
    int get_target_count(const std::string& target, int cuelist = 1);

    CueProperties   get_cue(const Cue& cue);
    CueProperties   get_cue_by_index(int index, int cuelist = 1);
    CueProperties   get_cue_by_uid(const std::string& uid);
    GroupProperties get_group(double number);
    MacroProperties get_macro(double number);

    // ─── Commands ────────────────────────────────────────────────────────

    void press_key(const std::string& key);

    // Replaces the console's command line with `commandline`.
    void send_command(const std::string& commandline);

    // Types the tab number on the tab keypad.
    void open_tab(Tab tab);

    void blind();
    void live();

    // ─── Notifications ───────────────────────────────────────────────────

    // Dispatches whatever arrives during `duration`. Returns the message count.
    size_t update(std::chrono::milliseconds duration);

    const ConsoleState& state() const;
    void                set_on_state_change(std::function<void(const ConsoleState&)> cb);

    // ─── Plumbing ────────────────────────────────────────────────────────

    const SessionConfig& config() const { return config_; }
    AddressRouter&       router() { return *router_; }
    RequestEngine&       engine() { return *engine_; }
    osc::Transport&      transport() { return *transport_; }

   private:
    SessionConfig                      config_;
    std::unique_ptr<osc::Transport>    transport_;
    std::unique_ptr<AddressRouter>     router_;
    std::unique_ptr<RequestEngine>     engine_;
    std::unique_ptr<ConsoleStateModel> state_;
};

}   // namespace eoslink
