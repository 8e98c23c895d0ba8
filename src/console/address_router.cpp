#include "address_router.hpp"

#include <eoslink/logger.hpp>

#include <algorithm>

namespace eoslink
{

// ─── AddressPattern ──────────────────────────────────────────────────────────

AddressPattern::AddressPattern(std::string text) : text_(std::move(text))
{
    wildcard_ = !text_.empty() && text_.back() == '*';
}

std::string_view AddressPattern::prefix() const
{
    std::string_view view(text_);
    if (wildcard_)
        view.remove_suffix(1);
    return view;
}

bool AddressPattern::matches(std::string_view address) const
{
    if (!wildcard_)
        return address == text_;
    return address.starts_with(prefix());
}

// ─── AddressRouter ───────────────────────────────────────────────────────────

HandlerToken AddressRouter::add_handler(std::string pattern, Handler handler)
{
    HandlerToken token = next_token_++;
    EOSLINK_LOG_TRACE("router", "add #{} {}", token, pattern);
    entries_.push_back(Entry{token, AddressPattern(std::move(pattern)), std::move(handler)});
    return token;
}

bool AddressRouter::remove_handler(HandlerToken token)
{
    auto it = std::find_if(entries_.begin(),
                           entries_.end(),
                           [token](const Entry& e) { return e.token == token; });
    if (it == entries_.end())
        return false;
    EOSLINK_LOG_TRACE("router", "remove #{} {}", token, it->pattern.text());
    entries_.erase(it);
    return true;
}

void AddressRouter::set_default_handler(Handler handler)
{
    default_handler_ = std::move(handler);
}

void AddressRouter::clear_default_handler()
{
    default_handler_ = nullptr;
}

const AddressRouter::Entry* AddressRouter::find(HandlerToken token) const
{
    for (const auto& e : entries_)
    {
        if (e.token == token)
            return &e;
    }
    return nullptr;
}

bool AddressRouter::has_handler(HandlerToken token) const
{
    return find(token) != nullptr;
}

size_t AddressRouter::dispatch(const osc::Message& msg)
{
    std::vector<HandlerToken> matched;
    for (const auto& e : entries_)
    {
        if (e.pattern.matches(msg.address))
            matched.push_back(e.token);
    }

    if (matched.empty())
    {
        if (default_handler_)
        {
            // Copy: the default handler may replace itself.
            Handler fallback = default_handler_;
            fallback(msg);
        }
        return 0;
    }

    size_t invoked = 0;
    for (HandlerToken token : matched)
    {
        const Entry* e = find(token);
        if (!e)
            continue;   // removed by an earlier handler for this message
        // Copy before calling: the handler may add entries and reallocate.
        Handler handler = e->handler;
        handler(msg);
        ++invoked;
    }
    return invoked;
}

std::vector<std::string> AddressRouter::patterns() const
{
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_)
        out.push_back(e.pattern.text());
    return out;
}

// ─── HandlerRegistration ─────────────────────────────────────────────────────

HandlerRegistration::HandlerRegistration(AddressRouter& router, HandlerToken token)
    : router_(&router), token_(token)
{
}

HandlerRegistration::~HandlerRegistration()
{
    reset();
}

HandlerRegistration::HandlerRegistration(HandlerRegistration&& other) noexcept
    : router_(other.router_), token_(other.token_)
{
    other.router_ = nullptr;
    other.token_  = INVALID_HANDLER;
}

HandlerRegistration& HandlerRegistration::operator=(HandlerRegistration&& other) noexcept
{
    if (this != &other)
    {
        reset();
        router_       = other.router_;
        token_        = other.token_;
        other.router_ = nullptr;
        other.token_  = INVALID_HANDLER;
    }
    return *this;
}

void HandlerRegistration::reset()
{
    if (router_)
    {
        router_->remove_handler(token_);
        router_ = nullptr;
    }
}

}   // namespace eoslink
