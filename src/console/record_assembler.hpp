#pragma once

#include "request_engine.hpp"

#include <eoslink/error.hpp>
#include <eoslink/logger.hpp>
#include <eoslink/records.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace eoslink
{

// How a reply message contributed to an assembly.
enum class RouteResult : uint8_t
{
    Base,     // the positional properties message
    Part,     // a suffixed sub-record message
    Ignore,   // not part of this record; not counted
};

// Per-call accumulator. Created by assemble(), discarded when it returns.
template <typename Record>
struct Assembly
{
    Record record{};
    size_t received = 0;
    bool   has_base = false;
};

template <typename Record>
struct RecordQuery
{
    std::string name;            // "cue 1 / 10", used in error messages
    Request     request;
    std::string reply_pattern;   // usually a trailing-'*' wildcard
    size_t      expected_count = 0;
    // Classifies one reply and merges it into the accumulator. May throw DecodeError.
    std::function<RouteResult(const osc::Message&, Assembly<Record>&)> route;
};

// Runs one counted multi-message query.
//
// Completes when exactly `expected_count` routed messages have been seen.
// If the deadline passes first: TimeoutError when nothing arrived,
// IncompleteError carrying the observed count otherwise. Completing without
// the base message is a ProtocolMismatchError. Never returns a partial record.
template <typename Record>
Record assemble(RequestEngine&                           engine,
                const RecordQuery<Record>&               query,
                std::optional<std::chrono::milliseconds> timeout = std::nullopt)
{
    Assembly<Record> acc;

    bool done = engine.exchange(
        query.request,
        query.reply_pattern,
        [&](const osc::Message& msg)
        {
            auto result = query.route(msg, acc);
            if (result == RouteResult::Ignore)
            {
                EOSLINK_LOG_DEBUG("assembler", "{}: ignoring {}", query.name, msg.address);
                return false;
            }
            if (result == RouteResult::Base)
                acc.has_base = true;
            ++acc.received;
            return acc.received == query.expected_count;
        },
        timeout);

    if (!done)
    {
        if (acc.received == 0)
        {
            throw TimeoutError("no reply for " + query.name + " within "
                               + std::to_string(timeout.value_or(engine.timing().timeout).count())
                               + " ms");
        }
        throw IncompleteError("received " + std::to_string(acc.received) + " of "
                                  + std::to_string(query.expected_count) + " messages for "
                                  + query.name,
                              acc.received,
                              query.expected_count);
    }
    if (!acc.has_base)
        throw ProtocolMismatchError(query.name + ": reply set completed without its properties message");

    return std::move(acc.record);
}

// ─── Record queries ──────────────────────────────────────────────────────────

static constexpr size_t CUE_MESSAGE_COUNT   = 4;
static constexpr size_t GROUP_MESSAGE_COUNT = 2;
static constexpr size_t MACRO_MESSAGE_COUNT = 2;

// `expected` pins the reply identity; without it the first counted reply
// decides which cue is being assembled and replies for other cues are ignored.
RecordQuery<CueProperties> cue_query(std::string        name,
                                     std::string        query_path,
                                     std::string        reply_pattern,
                                     std::optional<Cue> expected);

RecordQuery<CueProperties>   cue_query(const Cue& cue);
RecordQuery<CueProperties>   cue_index_query(int index, int cuelist);
RecordQuery<CueProperties>   cue_uid_query(const std::string& uid);
RecordQuery<GroupProperties> group_query(double number);
RecordQuery<MacroProperties> macro_query(double number);

}   // namespace eoslink
