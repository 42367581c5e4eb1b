#pragma once

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include "error.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace puresend::core {

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warn = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

const char* to_string(LogLevel level);

// Process-wide "puresend" logger: colored console plus a rotating file.
class Logger {
public:
    static constexpr std::size_t MAX_FILE_SIZE = 5 * 1024 * 1024;
    static constexpr std::size_t MAX_FILES = 3;

    // An empty `log_file` logs to the console only. When the file cannot be opened the
    // console logger is still installed and IO_ERROR is returned.
    static Result initialize(const std::string& log_file, LogLevel level = LogLevel::Info);
    static void shutdown();

    static std::shared_ptr<spdlog::logger> get() { return logger_; }

    static void set_level(LogLevel level);
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::Info);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace puresend::core

// Routed through the default logger so messages emitted before initialize() still land on stdout.
#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
