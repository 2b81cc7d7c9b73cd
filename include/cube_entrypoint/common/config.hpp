#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <optional>

namespace cube_entrypoint {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    LogLevel level = LogLevel::INFO;
    LogFormat format = LogFormat::TEXT;
    std::string file;
};

struct DatabaseConfig {
    bool skip;
    std::string data_dir;
    std::string role;
    std::string bin_dir;
    std::string service_user;
};

struct IdentityConfig {
    std::string runner_user;
};

struct EnvironmentConfig {
    std::string root;
    std::vector<std::string> extras;
    std::string driver_manifest;
};

struct BootstrapConfig {
    DatabaseConfig database;
    IdentityConfig identity;
    EnvironmentConfig environment;
    LoggingConfig logging;
};

class Config {
public:
    Config();

    // Defaults, then the TOML file (if present), then environment overrides.
    bool load(const std::string& config_file, const Environment& env);

    const BootstrapConfig& global() const { return global_; }

    std::string getConfigPath() const { return current_config_path_; }
    const std::string& lastError() const { return last_error_; }

    static BootstrapConfig createDefaultConfig();
    static std::string resolveConfigPath(const std::string& cli_path, const Environment& env);
    static std::optional<LogLevel> parseLogLevel(const std::string& value);

private:
    BootstrapConfig global_;
    std::string current_config_path_;
    std::string last_error_;

    bool tryLoadTomlFile(const std::string& path);
    void applyEnvironment(const Environment& env);
};

std::string to_string(LogLevel level);

}}
