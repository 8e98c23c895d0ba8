// eoslink-cli: connect to a console, run a few queries, optionally watch
// notifications.

#include <eoslink/eoslink.hpp>

#include "../console/record_codec.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace
{

std::atomic<bool> g_running{true};

void signal_handler(int /*sig*/)
{
    g_running.store(false, std::memory_order_relaxed);
}

struct Options
{
    std::optional<std::string> config_path;
    std::optional<std::string> host;
    std::optional<long>        port;
    std::optional<std::string> framing;
    std::optional<std::string> ping;
    std::optional<std::string> cue;
    std::optional<double>      group;
    std::optional<double>      macro;
    std::optional<long>        watch_ms;
    bool                       verbose = false;
};

void print_usage(const char* argv0)
{
    std::cerr << "usage: " << argv0
              << " [--config path] [--host h] [--port p] [--framing slip|packet_length|udp]\n"
                 "       [--ping token] [--cue list/cue[/part]] [--group n] [--macro n]\n"
                 "       [--watch ms] [--verbose]\n";
}

// Returns std::nullopt (after printing why) on a bad command line.
std::optional<Options> parse_args(int argc, char* argv[])
{
    Options opts;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--verbose")
        {
            opts.verbose = true;
            continue;
        }
        if (arg == "--help" || arg == "-h")
            return std::nullopt;
        if (i + 1 >= argc)
        {
            std::cerr << "[eoslink-cli] " << arg << " needs a value\n";
            return std::nullopt;
        }

        std::string value = argv[++i];
        auto        bad   = [&]
        {
            std::cerr << "[eoslink-cli] bad value for " << arg << ": " << value << "\n";
            return std::nullopt;
        };

        if (arg == "--config")
            opts.config_path = value;
        else if (arg == "--host")
            opts.host = value;
        else if (arg == "--framing")
            opts.framing = value;
        else if (arg == "--ping")
            opts.ping = value;
        else if (arg == "--cue")
            opts.cue = value;
        else if (arg == "--port")
        {
            if (!(opts.port = eoslink::parse_integer(value)))
                return bad();
        }
        else if (arg == "--watch")
        {
            if (!(opts.watch_ms = eoslink::parse_integer(value)) || *opts.watch_ms < 0)
                return bad();
        }
        else if (arg == "--group")
        {
            if (!(opts.group = eoslink::parse_decimal(value)))
                return bad();
        }
        else if (arg == "--macro")
        {
            if (!(opts.macro = eoslink::parse_decimal(value)))
                return bad();
        }
        else
        {
            std::cerr << "[eoslink-cli] unknown option " << arg << "\n";
            return std::nullopt;
        }
    }
    return opts;
}

std::optional<eoslink::Cue> parse_cue_arg(const std::string& text)
{
    auto first = text.find('/');
    if (first == std::string::npos)
        return std::nullopt;
    auto second = text.find('/', first + 1);

    auto list = eoslink::parse_integer(std::string_view(text).substr(0, first));
    auto cue  = eoslink::parse_decimal(std::string_view(text).substr(
        first + 1, second == std::string::npos ? std::string::npos : second - first - 1));
    std::optional<long> part = 0L;
    if (second != std::string::npos)
        part = eoslink::parse_integer(std::string_view(text).substr(second + 1));
    if (!list || !cue || !part)
        return std::nullopt;
    auto list_int = eoslink::narrow_int(*list);
    auto part_int = eoslink::narrow_int(*part);
    if (!list_int || !part_int)
        return std::nullopt;
    return eoslink::Cue{*list_int, *cue, *part_int};
}

void print_state(const eoslink::ConsoleState& s)
{
    auto cue_text = [](const std::optional<eoslink::Cue>& c)
    { return c ? c->cue_format() + " part " + std::to_string(c->part) : std::string("-"); };

    std::cout << "user:     " << s.user << "\n"
              << "show:     " << s.show_name << "\n"
              << "locked:   " << (s.locked ? "yes" : "no") << "\n"
              << "previous: " << cue_text(s.previous_cue) << "\n"
              << "active:   " << cue_text(s.active_cue) << "\n"
              << "pending:  " << cue_text(s.pending_cue) << "\n";
}

void print_cue(const eoslink::CueProperties& p)
{
    std::cout << "cue " << p.identity().cue_format() << " part " << p.part << "\n"
              << "  label:  " << p.label << "\n"
              << "  uid:    " << p.uid << "\n"
              << "  up:     " << eoslink::format_number(p.uptime) << "s\n"
              << "  down:   " << eoslink::format_number(p.downtime) << "s\n"
              << "  block:  " << p.blockstr << "\n"
              << "  assert: " << p.assertstr << "\n"
              << "  scene:  " << p.scene << "\n";
    if (p.fx)
        std::cout << "  fx:     " << *p.fx << "\n";
    if (p.linked_cues)
        std::cout << "  links:  " << *p.linked_cues << "\n";
    if (p.actions)
        std::cout << "  actions: " << *p.actions << "\n";
}

}   // namespace

int main(int argc, char* argv[])
{
    auto opts = parse_args(argc, argv);
    if (!opts)
    {
        print_usage(argv[0]);
        return 2;
    }

    eoslink::SessionConfig config;
    std::string            config_path = opts->config_path.value_or(eoslink::SessionConfig::default_path());
    if (!config.load(config_path) && opts->config_path)
    {
        std::cerr << "[eoslink-cli] cannot load config " << config_path << "\n";
        return 1;
    }

    if (opts->host)
        config.host = *opts->host;
    if (opts->port)
    {
        if (*opts->port <= 0 || *opts->port > 65535)
        {
            std::cerr << "[eoslink-cli] port out of range: " << *opts->port << "\n";
            return 2;
        }
        config.port = static_cast<uint16_t>(*opts->port);
    }
    if (opts->framing)
    {
        auto mode = eoslink::osc::parse_framing(*opts->framing);
        if (!mode)
        {
            std::cerr << "[eoslink-cli] unknown framing " << *opts->framing << "\n";
            return 2;
        }
        config.framing = *mode;
    }
    if (opts->verbose)
        config.log_level = eoslink::LogLevel::Debug;

    auto& logger = eoslink::Logger::instance();
    logger.set_level(config.log_level);
    logger.add_sink(eoslink::sinks::console_sink());

    std::optional<eoslink::Cue> cue;
    if (opts->cue && !(cue = parse_cue_arg(*opts->cue)))
    {
        std::cerr << "[eoslink-cli] bad cue " << *opts->cue << ", expected list/cue[/part]\n";
        return 2;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto console = eoslink::Console::connect(config);
    if (!console)
    {
        std::cerr << "[eoslink-cli] cannot reach console at " << config.host << ":" << config.port
                  << "\n";
        return 1;
    }

    try
    {
        auto rtt = console->ping(opts->ping.value_or("eoslink"));
        std::cout << "ping: " << rtt.count() << " ms\n";
        std::cout << "version: " << console->get_version() << "\n";

        if (cue)
            print_cue(console->get_cue(*cue));
        if (opts->group)
        {
            auto g = console->get_group(*opts->group);
            std::cout << "group " << eoslink::format_number(g.number) << " '" << g.label
                      << "': " << g.channel_selection() << "\n";
        }
        if (opts->macro)
        {
            auto m = console->get_macro(*opts->macro);
            std::cout << "macro " << eoslink::format_number(m.number) << " '" << m.label << "' ("
                      << m.mode << "):";
            for (const auto& line : m.command)
                std::cout << " " << line;
            std::cout << "\n";
        }

        if (opts->watch_ms)
        {
            console->set_on_state_change([](const eoslink::ConsoleState& s)
                                         { print_state(s); std::cout << "--\n"; });
            const auto until = std::chrono::steady_clock::now()
                             + std::chrono::milliseconds(*opts->watch_ms);
            while (g_running.load(std::memory_order_relaxed)
                   && std::chrono::steady_clock::now() < until)
            {
                console->update(console->config().poll_interval());
            }
        }
        else
        {
            console->update(console->config().poll_interval());
        }
        print_state(console->state());
    }
    catch (const eoslink::ConsoleError& e)
    {
        std::cerr << "[eoslink-cli] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
