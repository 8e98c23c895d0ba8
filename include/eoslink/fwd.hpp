#pragma once

#include <cstdint>

namespace eoslink
{

using HandlerToken = uint64_t;

class AddressRouter;
class HandlerRegistration;
class RequestEngine;
class ConsoleStateModel;

class Console;
class Programmer;

struct SessionConfig;
struct Cue;
struct CueProperties;
struct GroupProperties;
struct MacroProperties;
struct ConsoleState;

namespace osc
{
struct Message;
class Transport;
class SocketTransport;
}   // namespace osc

}   // namespace eoslink
