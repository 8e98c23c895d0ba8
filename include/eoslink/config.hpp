#pragma once

#include <eoslink/logger.hpp>
#include <eoslink/osc.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace eoslink
{

// Connection and timing parameters for one console session, persisted as JSON.
struct SessionConfig
{
    static constexpr int CURRENT_VERSION = 1;

    std::string      host             = "127.0.0.1";
    uint16_t         port             = 3032;
    uint16_t         rx_port          = 8001;   // local UDP receive port
    osc::FramingMode framing          = osc::FramingMode::Slip;
    int              timeout_ms       = 1000;
    int              poll_interval_ms = 50;
    std::string      client_name      = "eoslink";
    LogLevel         log_level        = LogLevel::Info;

    osc::TransportConfig      transport() const;
    std::chrono::milliseconds timeout() const { return std::chrono::milliseconds(timeout_ms); }
    std::chrono::milliseconds poll_interval() const
    {
        return std::chrono::milliseconds(poll_interval_ms);
    }

    std::string serialize() const;

    // Missing keys keep their current value. Returns false on an unknown
    // framing or log level, an out-of-range number, or a newer file version;
    // the config is left unchanged in that case.
    bool deserialize(const std::string& json);

    // Save to a JSON file, creating parent directories. Returns true on success.
    bool save(const std::string& path) const;

    // Load from a JSON file. Returns true on success.
    bool load(const std::string& path);

    // $XDG_CONFIG_HOME/eoslink/session.json, else ~/.config/eoslink/session.json.
    static std::string default_path();
};

}   // namespace eoslink
