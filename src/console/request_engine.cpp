#include "request_engine.hpp"

#include <eoslink/error.hpp>
#include <eoslink/logger.hpp>

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace eoslink
{

namespace
{

// Marks the engine busy for one correlated call.
class BusyScope
{
   public:
    explicit BusyScope(bool& flag) : flag_(flag)
    {
        if (flag_)
            throw std::logic_error("a correlated console call is already in flight");
        flag_ = true;
    }
    ~BusyScope() { flag_ = false; }

    BusyScope(const BusyScope&)            = delete;
    BusyScope& operator=(const BusyScope&) = delete;

   private:
    bool& flag_;
};

}   // namespace

RequestEngine::RequestEngine(osc::Transport& transport, AddressRouter& router, EngineTiming timing)
    : transport_(transport), router_(router), timing_(timing)
{
}

void RequestEngine::send(const Request& request)
{
    osc::Message msg{request.address, request.args};
    EOSLINK_LOG_DEBUG("engine", "-> {}", osc::describe(msg));
    if (!transport_.send(msg))
        throw TransportError("failed to send " + request.address);
}

bool RequestEngine::exchange(const Request&                           request,
                             const std::string&                       reply_pattern,
                             const ReplyHandler&                      on_reply,
                             std::optional<std::chrono::milliseconds> timeout)
{
    BusyScope busy(busy_);

    bool                complete = false;
    HandlerRegistration registration;
    auto                transient = [&](const osc::Message& msg)
    {
        if (complete)
            return;
        try
        {
            if (on_reply(msg))
            {
                complete = true;
                registration.reset();
            }
        }
        catch (...)
        {
            complete = true;
            registration.reset();
            throw;
        }
    };
    registration = HandlerRegistration(router_, router_.add_handler(reply_pattern, transient));

    send(request);

    const auto deadline = std::chrono::steady_clock::now() + timeout.value_or(timing_.timeout);
    while (!complete)
    {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            break;
        auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        pump(std::min(left, timing_.poll_interval));
    }

    if (!complete)
        EOSLINK_LOG_DEBUG("engine", "deadline passed waiting for {}", reply_pattern);
    return complete;
}

ReplyLog RequestEngine::call(const Request&                           request,
                             const std::string&                       reply_pattern,
                             const Completion&                        complete,
                             std::optional<std::chrono::milliseconds> timeout)
{
    ReplyLog log;
    bool     done = exchange(
        request,
        reply_pattern,
        [&](const osc::Message& msg)
        {
            log.messages.push_back(msg);
            return complete(log);
        },
        timeout);

    if (!done)
    {
        auto ms = timeout.value_or(timing_.timeout).count();
        throw TimeoutError("no reply to " + request.address + " within "
                           + std::to_string(ms) + " ms");
    }
    return log;
}

size_t RequestEngine::pump(std::chrono::milliseconds budget)
{
    if (!transport_.is_open())
        throw TransportError("connection to console is closed");

    auto batch = transport_.receive(budget);

    std::exception_ptr first_error;
    for (const auto& msg : batch)
    {
        EOSLINK_LOG_TRACE("engine", "<- {}", osc::describe(msg));
        try
        {
            router_.dispatch(msg);
        }
        catch (const std::exception& e)
        {
            if (!first_error)
                first_error = std::current_exception();
            else
                EOSLINK_LOG_WARN("engine", "further handler error on {}: {}", msg.address, e.what());
        }
    }

    if (first_error)
        std::rethrow_exception(first_error);
    return batch.size();
}

size_t RequestEngine::pump_for(std::chrono::milliseconds duration)
{
    size_t     total    = 0;
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (true)
    {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            break;
        auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        total += pump(std::min(left, timing_.poll_interval));
    }
    return total;
}

}   // namespace eoslink
