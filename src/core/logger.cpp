#include "mediapush/core/logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <algorithm>
#include <vector>

namespace mediapush::core {

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::initialize(const std::string& log_file, LogLevel level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(level));
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, 1048576 * 5, 3);
    file_sink->set_level(spdlog::level::debug);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");
    
    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    logger_ = std::make_shared<spdlog::logger>("mediapush", sinks.begin(), sinks.end());
    // The logger itself passes debug through so the file sink always sees it.
    logger_->set_level(std::min(static_cast<spdlog::level::level_enum>(level), spdlog::level::debug));
    logger_->flush_on(spdlog::level::warn);
    
    spdlog::set_default_logger(logger_);
    
    LOG_DEBUG("Logger initialized with level: {}", static_cast<int>(level));
}

void Logger::shutdown() {
    if (logger_) {
        LOG_DEBUG("Shutting down logger");
        logger_->flush();
        logger_.reset();
        spdlog::set_default_logger(std::make_shared<spdlog::logger>(
            "mediapush", std::make_shared<spdlog::sinks::stderr_color_sink_mt>()));
    }
}

}
