#pragma once

#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace expgrad
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
        else
            return std::to_string(v);
    }

   public:
    // Replaces each "{}" in order; surplus arguments are dropped.
    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        if constexpr (sizeof...(args) > 0)
        {
            std::size_t from = 0;
            auto replace_next = [&](auto&& arg)
            {
                auto pos = result.find("{}", from);
                if (pos != std::string::npos)
                {
                    std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
                    result.replace(pos, 2, text);
                    from = pos + text.size();
                }
            };
            (replace_next(std::forward<decltype(args)>(args)), ...);
        }
        return result;
    }

    static std::string level_to_string(LogLevel level);
    static std::optional<LogLevel> level_from_string(std::string_view name);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
    {
        return;
    }

    try
    {
        std::string formatted = format_message(format, std::forward<Args>(args)...);
        log(level, category, formatted);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", format_message("Format error: {}", e.what()));
    }
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
}  // namespace sinks

#define EXPGRAD_LOG_AT(lvl, category, ...)                                               \
    do                                                                                   \
    {                                                                                    \
        if (::expgrad::Logger::instance().is_enabled(lvl))                               \
        {                                                                                \
            ::expgrad::Logger::instance().log_formatted(lvl, category, __VA_ARGS__);     \
        }                                                                                \
    } while (0)

#define EXPGRAD_LOG_TRACE(category, ...) \
    EXPGRAD_LOG_AT(::expgrad::LogLevel::Trace, category, __VA_ARGS__)
#define EXPGRAD_LOG_DEBUG(category, ...) \
    EXPGRAD_LOG_AT(::expgrad::LogLevel::Debug, category, __VA_ARGS__)
#define EXPGRAD_LOG_INFO(category, ...) \
    EXPGRAD_LOG_AT(::expgrad::LogLevel::Info, category, __VA_ARGS__)
#define EXPGRAD_LOG_WARN(category, ...) \
    EXPGRAD_LOG_AT(::expgrad::LogLevel::Warning, category, __VA_ARGS__)
#define EXPGRAD_LOG_ERROR(category, ...) \
    EXPGRAD_LOG_AT(::expgrad::LogLevel::Error, category, __VA_ARGS__)
#define EXPGRAD_LOG_CRITICAL(category, ...) \
    EXPGRAD_LOG_AT(::expgrad::LogLevel::Critical, category, __VA_ARGS__)

}  // namespace expgrad
