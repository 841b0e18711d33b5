#pragma once

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace mediapush::core {

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warn = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

class Logger {
public:
    // Console output goes to stderr; stdout is reserved for the upload report.
    static void initialize(const std::string& log_file, LogLevel level = LogLevel::Info);
    static void shutdown();

    static std::shared_ptr<spdlog::logger> get() {
        return logger_ ? logger_ : spdlog::default_logger();
    }

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

}

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::mediapush::core::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::mediapush::core::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(::mediapush::core::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(::mediapush::core::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::mediapush::core::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::mediapush::core::Logger::get(), __VA_ARGS__)
