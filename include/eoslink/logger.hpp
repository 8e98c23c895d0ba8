#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace eoslink
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

// Process-wide leveled logger. Sinks are invoked under the logger's mutex,
// so a sink must not log.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    // Accepts "trace", "debug", "info", "warn"/"warning", "error", "critical".
    static std::optional<LogLevel> parse_level(std::string_view name);

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        {
            const char* p = v;
            return p ? std::string(p) : std::string("(null)");
        }
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else if constexpr (std::is_same_v<D, char>)
            return std::string(1, v);
        else
            return std::to_string(v);
    }

    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        if constexpr (sizeof...(args) > 0)
        {
            size_t cursor       = 0;
            auto   replace_next = [&](auto&& arg)
            {
                auto pos = result.find("{}", cursor);
                if (pos == std::string::npos)
                    return;
                auto text = arg_to_string(std::forward<decltype(arg)>(arg));
                result.replace(pos, 2, text);
                cursor = pos + text.size();
            };
            (replace_next(std::forward<decltype(args)>(args)), ...);
        }
        return result;
    }
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
        return;

    try
    {
        log(level, category, format_message(format, std::forward<Args>(args)...));
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("format error: ") + e.what());
    }
}

namespace sinks
{
// Colored single-line output on stderr.
Logger::LogSink console_sink();
// Appends to `filename`; the file stays open for the sink's lifetime.
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
}   // namespace sinks

#define EOSLINK_LOG_AT(lvl, category, ...)                                         \
    do                                                                             \
    {                                                                              \
        if (::eoslink::Logger::instance().is_enabled(lvl))                         \
        {                                                                          \
            ::eoslink::Logger::instance().log_formatted(lvl, category, __VA_ARGS__); \
        }                                                                          \
    } while (0)

#define EOSLINK_LOG_TRACE(category, ...) \
    EOSLINK_LOG_AT(::eoslink::LogLevel::Trace, category, __VA_ARGS__)
#define EOSLINK_LOG_DEBUG(category, ...) \
    EOSLINK_LOG_AT(::eoslink::LogLevel::Debug, category, __VA_ARGS__)
#define EOSLINK_LOG_INFO(category, ...) \
    EOSLINK_LOG_AT(::eoslink::LogLevel::Info, category, __VA_ARGS__)
#define EOSLINK_LOG_WARN(category, ...) \
    EOSLINK_LOG_AT(::eoslink::LogLevel::Warning, category, __VA_ARGS__)
#define EOSLINK_LOG_ERROR(category, ...) \
    EOSLINK_LOG_AT(::eoslink::LogLevel::Error, category, __VA_ARGS__)
#define EOSLINK_LOG_CRITICAL(category, ...) \
    EOSLINK_LOG_AT(::eoslink::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace eoslink
