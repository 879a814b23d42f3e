#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include "mctrim/core/logger.h"

LogLevel Logger::current_level_ = LogLevel::ERROR;
std::mutex Logger::log_mutex_;
std::ostream* Logger::output_stream_ = nullptr;  // nullptr = use std::cout
std::ostream* Logger::error_stream_ = nullptr;   // nullptr = use std::cerr
thread_local std::string Logger::thread_label_;

std::string
Logger::format_prefix(LogLevel level)
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch())
                            .count() %
        1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream prefix;
    prefix << '[' << std::put_time(&local, "%H:%M:%S") << '.'
           << std::setfill('0') << std::setw(3) << millis << "] ";

    switch (level)
    {
        case LogLevel::ERROR:
            prefix << "[ERROR] ";
            break;
        case LogLevel::WARNING:
            prefix << "[WARN]  ";
            break;
        case LogLevel::INFO:
            prefix << "[INFO]  ";
            break;
        case LogLevel::DEBUG:
            prefix << "[DEBUG] ";
            break;
        case LogLevel::NONE:
        case LogLevel::INHERIT:
            break;
    }

    if (!thread_label_.empty())
        prefix << '[' << thread_label_ << "] ";
    return prefix.str();
}

namespace {
std::string
get_level_string(const LogLevel& level)
{
    switch (level)
    {
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::NONE:
            return "NONE";
        case LogLevel::INHERIT:
            return "INHERIT";
        default:
            throw std::runtime_error("Invalid log level");
    }
}
}  // namespace

void
Logger::emit(LogLevel level, const std::string& line)
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::ostream* out = (level <= LogLevel::WARNING)
        ? (error_stream_ ? error_stream_ : &std::cerr)
        : (output_stream_ ? output_stream_ : &std::cout);
    *out << line << std::endl;
}

void
Logger::set_level(LogLevel level)
{
    LogLevel old_level = current_level_;
    current_level_ = level;
    if (enabled(LogLevel::INFO) && old_level != level)
    {
        emit(
            LogLevel::INFO,
            format_prefix(LogLevel::INFO) + "Log level set to " +
                get_level_string(level));
    }
}

bool
Logger::set_level(const std::string& level_str)
{
    static const std::unordered_map<std::string, LogLevel> level_map = {
        {"error", LogLevel::ERROR},
        {"warn", LogLevel::WARNING},
        {"warning", LogLevel::WARNING},
        {"info", LogLevel::INFO},
        {"debug", LogLevel::DEBUG}};

    std::string lower_level_str = level_str;
    std::ranges::transform(
        lower_level_str, lower_level_str.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });

    const auto it = level_map.find(lower_level_str);
    if (it == level_map.end())
    {
        return false;
    }

    set_level(it->second);
    return true;
}

LogLevel
Logger::get_level()
{
    return current_level_;
}

void
Logger::set_output_stream(std::ostream* output_stream)
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    output_stream_ = output_stream;
}

void
Logger::set_error_stream(std::ostream* error_stream)
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    error_stream_ = error_stream;
}

void
Logger::reset_streams()
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    output_stream_ = nullptr;
    error_stream_ = nullptr;
}

void
Logger::set_thread_label(std::string label)
{
    thread_label_ = std::move(label);
}

const std::string&
Logger::thread_label()
{
    return thread_label_;
}
