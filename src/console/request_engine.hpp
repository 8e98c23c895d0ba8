#pragma once

#include "address_router.hpp"

#include <eoslink/osc.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace eoslink
{

struct Request
{
    std::string        address;
    std::vector<osc::Value> args;
};

struct EngineTiming
{
    // Overall deadline for one correlated call.
    std::chrono::milliseconds timeout{1000};
    // Upper bound for a single receive cycle inside a call.
    std::chrono::milliseconds poll_interval{50};
};

// Every reply a single call's transient handler has seen, in arrival order.
// Lives only for the duration of that call.
struct ReplyLog
{
    std::vector<osc::Message> messages;

    size_t              size() const { return messages.size(); }
    bool                empty() const { return messages.empty(); }
    const osc::Message& last() const { return messages.back(); }
};

// Turns the one-way message bus into blocking, timeout-bounded calls.
//
// A call registers a transient handler for the reply pattern, sends the
// request, then pumps the transport through the router until the call's
// completion condition holds or the deadline passes. Every message received
// meanwhile is dispatched, so push notifications keep flowing to standing
// handlers. The transient handler is removed on every exit path.
//
// One correlated call at a time; calls block the calling thread.
class RequestEngine
{
   public:
    // Return true once the call is complete. May throw to abort the call.
    using ReplyHandler = std::function<bool(const osc::Message&)>;
    using Completion   = std::function<bool(const ReplyLog&)>;

    RequestEngine(osc::Transport& transport, AddressRouter& router, EngineTiming timing = {});

    RequestEngine(const RequestEngine&)            = delete;
    RequestEngine& operator=(const RequestEngine&) = delete;

    // Fire-and-forget. Throws TransportError if the transport refuses the message.
    void send(const Request& request);

    // Low-level correlated exchange. Returns true if `on_reply` reported
    // completion before the deadline, false if the deadline passed.
    bool exchange(const Request&                           request,
                  const std::string&                       reply_pattern,
                  const ReplyHandler&                      on_reply,
                  std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Collects matching replies until `complete` holds.
    // Throws TimeoutError if it never does.
    ReplyLog call(const Request&                           request,
                  const std::string&                       reply_pattern,
                  const Completion&                        complete,
                  std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // One receive cycle of at most `budget`. Every delivered message is
    // dispatched; if handlers throw, the first error is rethrown after the
    // whole batch has been dispatched. Returns the number of messages.
    size_t pump(std::chrono::milliseconds budget);

    // Pump repeatedly until `duration` has elapsed.
    size_t pump_for(std::chrono::milliseconds duration);

    bool                busy() const { return busy_; }
    const EngineTiming& timing() const { return timing_; }
    void                set_timing(const EngineTiming& timing) { timing_ = timing; }
    AddressRouter&      router() { return router_; }

   private:
    osc::Transport& transport_;
    AddressRouter&  router_;
    EngineTiming    timing_;
    bool            busy_ = false;
};

}   // namespace eoslink
