#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace eoslink
{

// Base for every failure a console call can raise.
class ConsoleError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// Deadline elapsed without the completion condition being met.
class TimeoutError : public ConsoleError
{
   public:
    using ConsoleError::ConsoleError;
};

// A reply arrived but contradicts the request (e.g. a ping echo that does not match).
class ProtocolMismatchError : public ConsoleError
{
   public:
    using ConsoleError::ConsoleError;
};

// A counted assembly ended with a message count other than the expected one.
class IncompleteError : public ConsoleError
{
   public:
    IncompleteError(const std::string& what, size_t observed, size_t expected)
        : ConsoleError(what), observed_(observed), expected_(expected)
    {
    }

    size_t observed() const noexcept { return observed_; }
    size_t expected() const noexcept { return expected_; }

   private:
    size_t observed_ = 0;
    size_t expected_ = 0;
};

// An argument list does not fit the record it is decoded into.
class DecodeError : public ConsoleError
{
   public:
    using ConsoleError::ConsoleError;
};

// The connection refused a send or went away.
class TransportError : public ConsoleError
{
   public:
    using ConsoleError::ConsoleError;
};

// True for the two failures that mean "the console never produced this record".
// Existence checks treat these as absence rather than as faults.
inline bool indicates_absence(const ConsoleError& e)
{
    return dynamic_cast<const TimeoutError*>(&e) != nullptr
        || dynamic_cast<const IncompleteError*>(&e) != nullptr;
}

}   // namespace eoslink
