#pragma once

#include <concepts>
#include <cstring>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

#ifndef PROJECT_ROOT
#define PROJECT_ROOT ""
#define PROJECT_ROOT_LENGTH 0
#endif

#define __RELATIVE_FILEPATH__                                  \
    (strncmp(__FILE__, PROJECT_ROOT, PROJECT_ROOT_LENGTH) == 0 \
         ? &(__FILE__[PROJECT_ROOT_LENGTH])                    \
         : __FILE__)

enum class LogLevel {
    NONE = -2,     // Special level to disable all logging
    INHERIT = -1,  // Special level for partitions to inherit global level
    ERROR = 0,
    WARNING = 1,
    INFO = 2,
    DEBUG = 3
};

class Logger
{
private:
    static LogLevel current_level_;
    static std::mutex log_mutex_;
    static std::ostream* output_stream_;
    static std::ostream* error_stream_;

    // Label of the calling thread, e.g. the batch worker it belongs to
    static thread_local std::string thread_label_;

    // "[hh:mm:ss.mmm] [LEVEL] [thread label] "
    static std::string
    format_prefix(LogLevel level);

    static void
    emit(LogLevel level, const std::string& line);

public:
    static bool
    enabled(LogLevel level)
    {
        return current_level_ != LogLevel::NONE && level <= current_level_;
    }

    static void
    set_level(LogLevel level);

    // Accepts error, warn, warning, info, debug (any case)
    static bool
    set_level(const std::string& level);

    static LogLevel
    get_level();

    // nullptr restores std::cout / std::cerr
    static void
    set_output_stream(std::ostream* output_stream);

    static void
    set_error_stream(std::ostream* error_stream);

    static void
    reset_streams();

    static void
    set_thread_label(std::string label);

    static const std::string&
    thread_label();

    template <typename... Args>
    static void
    log(LogLevel level, const Args&... args)
    {
        if (!enabled(level))
            return;

        // Format before taking the lock
        std::ostringstream oss;
        oss << format_prefix(level);
        (oss << ... << args);

        emit(level, oss.str());
    }
};

class LogPartition
{
public:
    LogPartition(const std::string& name, LogLevel level = LogLevel::INHERIT)
        : name_(name), level_(level)
    {
    }

    const std::string&
    name() const
    {
        return name_;
    }

    // INHERIT follows the global level
    LogLevel
    level() const
    {
        return level_ == LogLevel::INHERIT ? Logger::get_level() : level_;
    }

    void
    set_level(LogLevel level)
    {
        level_ = level;
    }

    bool
    should_log(LogLevel message_level) const
    {
        const LogLevel effective = level();
        return effective != LogLevel::NONE && message_level <= effective;
    }

private:
    std::string name_;
    LogLevel level_;
};

template <typename T>
concept PartitionedLogging = requires
{
    {
        T::get_log_partition()
    }
    ->std::convertible_to<const LogPartition&>;
};

namespace detail {

template <typename T, typename... Args>
inline void
log_for(
    LogLevel level,
    const char* file,
    int line,
    const T* /* self */,
    const Args&... args)
{
    if constexpr (PartitionedLogging<T>)
    {
        const LogPartition& partition = T::get_log_partition();
        if (!partition.should_log(level))
            return;
        Logger::log(
            level,
            "[",
            partition.name(),
            "] ",
            args...,
            " (",
            file,
            ":",
            line,
            ")");
    }
    else
    {
        Logger::log(level, args..., " (", file, ":", line, ")");
    }
}

}  // namespace detail

// Member-function logging; classes with a static get_log_partition() are
// tagged and filtered by their partition
#define OLOG_AT(level, ...) \
    ::detail::log_for(level, __RELATIVE_FILEPATH__, __LINE__, this, __VA_ARGS__)
#define OLOGE(...) OLOG_AT(LogLevel::ERROR, __VA_ARGS__)
#define OLOGW(...) OLOG_AT(LogLevel::WARNING, __VA_ARGS__)
#define OLOGI(...) OLOG_AT(LogLevel::INFO, __VA_ARGS__)
#define OLOGD(...) OLOG_AT(LogLevel::DEBUG, __VA_ARGS__)

#define LOG_AT(level, ...)              \
    do                                  \
    {                                   \
        if (Logger::enabled(level))     \
            Logger::log(                \
                level,                  \
                __VA_ARGS__,            \
                " (",                   \
                __RELATIVE_FILEPATH__,  \
                ":",                    \
                __LINE__,               \
                ")");                   \
    } while (0)
#define LOGE(...) LOG_AT(LogLevel::ERROR, __VA_ARGS__)
#define LOGW(...) LOG_AT(LogLevel::WARNING, __VA_ARGS__)
#define LOGI(...) LOG_AT(LogLevel::INFO, __VA_ARGS__)
#define LOGD(...) LOG_AT(LogLevel::DEBUG, __VA_ARGS__)
