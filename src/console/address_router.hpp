#pragma once

#include <eoslink/osc.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace eoslink
{

using HandlerToken = uint64_t;

static constexpr HandlerToken INVALID_HANDLER = 0;

// An exact address, or a literal prefix followed by a trailing '*'.
class AddressPattern
{
   public:
    explicit AddressPattern(std::string text);

    bool matches(std::string_view address) const;

    const std::string& text() const { return text_; }
    bool               is_wildcard() const { return wildcard_; }
    // The literal part: the whole pattern, or everything before the '*'.
    std::string_view   prefix() const;

   private:
    std::string text_;
    bool        wildcard_ = false;
};

// Routes inbound messages to registered handlers by address pattern.
//
// Handlers run in registration order. When no pattern matches, the default
// handler (if any) runs instead. A handler may add or remove registrations
// while a dispatch is in progress: the set of handlers for the current message
// is fixed when dispatch starts, and handlers removed mid-dispatch are skipped.
// Not thread-safe.
class AddressRouter
{
   public:
    using Handler = std::function<void(const osc::Message&)>;

    AddressRouter()  = default;
    ~AddressRouter() = default;

    AddressRouter(const AddressRouter&)            = delete;
    AddressRouter& operator=(const AddressRouter&) = delete;

    // Register `handler` for `pattern`. Tokens are never reused.
    HandlerToken add_handler(std::string pattern, Handler handler);

    // Returns false if the token is unknown or was already removed.
    bool remove_handler(HandlerToken token);

    void set_default_handler(Handler handler);
    void clear_default_handler();

    // Returns the number of pattern handlers invoked (0 means the default ran, if set).
    size_t dispatch(const osc::Message& msg);

    size_t handler_count() const { return entries_.size(); }
    bool   has_handler(HandlerToken token) const;

    // Patterns in registration order, for diagnostics.
    std::vector<std::string> patterns() const;

   private:
    struct Entry
    {
        HandlerToken   token;
        AddressPattern pattern;
        Handler        handler;
    };

    const Entry* find(HandlerToken token) const;

    std::vector<Entry> entries_;
    Handler            default_handler_;
    HandlerToken       next_token_ = 1;
};

// Scoped registration: removes its handler exactly once, on reset() or destruction.
class HandlerRegistration
{
   public:
    HandlerRegistration() = default;
    HandlerRegistration(AddressRouter& router, HandlerToken token);
    ~HandlerRegistration();

    HandlerRegistration(const HandlerRegistration&)            = delete;
    HandlerRegistration& operator=(const HandlerRegistration&) = delete;
    HandlerRegistration(HandlerRegistration&& other) noexcept;
    HandlerRegistration& operator=(HandlerRegistration&& other) noexcept;

    void         reset();
    bool         active() const { return router_ != nullptr; }
    HandlerToken token() const { return token_; }

   private:
    AddressRouter* router_ = nullptr;
    HandlerToken   token_  = INVALID_HANDLER;
};

}   // namespace eoslink
