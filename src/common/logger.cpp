#include "cube_entrypoint/common/logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>
#include <vector>

namespace cube_entrypoint {
namespace common {

static constexpr const char* LOGGER_NAME = "cube-entrypoint";

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const LoggingConfig& logging_config) {
    if (initialized_) {
        if (logger_) {
            logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        }
        return;
    }

    if (logger_) {
        spdlog::drop(LOGGER_NAME);
        logger_.reset();
    }

    auto spdlog_level = toSpdlogLevel(logging_config.level);

    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog_level);
        sinks.push_back(console_sink);

        if (!logging_config.file.empty()) {
            std::filesystem::path log_dir = std::filesystem::path(logging_config.file).parent_path();
            std::error_code ec;
            if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec)) {
                std::filesystem::create_directories(log_dir, ec);
            }

            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logging_config.file);
                file_sink->set_level(spdlog_level);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "[Logger] Failed to open log file: " << logging_config.file
                          << " - " << ex.what() << std::endl;
                std::cerr << "[Logger] Falling back to console output" << std::endl;
            }
        }

        logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());

        if (logging_config.format == LogFormat::JSON) {
            logger_->set_pattern(R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","message":"%v"})");
        } else {
            logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        }

        logger_->set_level(spdlog_level);
        logger_->flush_on(spdlog::level::warn);

        spdlog::register_logger(logger_);
        initialized_ = true;

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Initialization failed: " << ex.what() << std::endl;
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, console_sink);
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger_->set_level(spdlog_level);
        initialized_ = true;
    }
}

void Logger::setLevel(LogLevel level) {
    if (logger_) {
        auto spdlog_level = toSpdlogLevel(level);
        for (auto& sink : logger_->sinks()) {
            sink->set_level(spdlog_level);
        }
        logger_->set_level(spdlog_level);
    }
}

void Logger::reconfigure(const LoggingConfig& logging_config) {
    if (initialized_ && logging_config.format == LogFormat::TEXT && logging_config.file.empty()) {
        setLevel(logging_config.level);
        return;
    }
    shutdown();
    initialize(logging_config);
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(LOGGER_NAME);
        logger_.reset();
    }
    spdlog::shutdown();
    initialized_ = false;
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
        default: return spdlog::level::info;
    }
}

}}
