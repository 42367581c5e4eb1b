#include "puresend/core/logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <vector>

namespace puresend::core {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {
    spdlog::level::level_enum to_spdlog(LogLevel level) {
        return static_cast<spdlog::level::level_enum>(level);
    }
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

Result Logger::initialize(const std::string& log_file, LogLevel level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    Result result;
    if (!log_file.empty()) {
        try {
            auto directory = std::filesystem::path(log_file).parent_path();
            if (!directory.empty()) {
                std::filesystem::create_directories(directory);
            }
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, MAX_FILE_SIZE, MAX_FILES);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");
            sinks.push_back(file_sink);
        } catch (const std::exception& e) {
            result = Result(ErrorCode::IO_ERROR, "Cannot open log file " + log_file + ": " + e.what());
        }
    }

    if (logger_) {
        spdlog::drop(logger_->name());
    }
    logger_ = std::make_shared<spdlog::logger>("puresend", sinks.begin(), sinks.end());
    logger_->set_level(to_spdlog(level));
    logger_->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger_);

    if (!result) {
        LOG_WARN("{}; logging to the console only", result.message);
    }
    LOG_DEBUG("Logging at {} to {}", to_string(level), log_file.empty() ? "console" : log_file);
    return result;
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(logger_->name());
        // LOG_* after shutdown lands on a plain console logger.
        spdlog::set_default_logger(std::make_shared<spdlog::logger>(
            "console", std::make_shared<spdlog::sinks::stdout_color_sink_mt>()));
        logger_.reset();
    }
}

void Logger::set_level(LogLevel level) {
    if (logger_) {
        logger_->set_level(to_spdlog(level));
    } else {
        spdlog::set_level(to_spdlog(level));
    }
}

LogLevel Logger::parse_level(const std::string& name, LogLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return fallback;
}

} // namespace puresend::core
