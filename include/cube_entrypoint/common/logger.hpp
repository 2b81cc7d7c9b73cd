#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <string>

namespace cube_entrypoint {
namespace common {

class Logger {
public:
    static Logger& instance();

    void initialize(const LoggingConfig& logging_config);
    // Console-only text output just changes the level; anything else rebuilds the sinks.
    void reconfigure(const LoggingConfig& logging_config);
    void setLevel(LogLevel level);
    void shutdown();

    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        if (logger_) logger_->error(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        if (logger_) logger_->warn(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        if (logger_) logger_->info(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        if (logger_) logger_->debug(fmt::runtime(format), std::forward<Args>(args)...);
    }

    void flush();

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> logger_;
    bool initialized_ = false;

    spdlog::level::level_enum toSpdlogLevel(LogLevel level);
};

}}
