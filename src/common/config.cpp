#include "cube_entrypoint/common/config.hpp"
#include "cube_entrypoint/common/constants.hpp"
#include "cube_entrypoint/common/logger.hpp"
#include <toml.hpp>
#include <filesystem>
#include <unistd.h>

namespace cube_entrypoint {
namespace common {

Config::Config() {
    global_ = createDefaultConfig();
}

BootstrapConfig Config::createDefaultConfig() {
    BootstrapConfig config;

    config.database.skip = false;
    config.database.data_dir = constants::database::DEFAULT_DATA_DIR;
    config.database.role = constants::identity::DEFAULT_RUNNER_USER;
    config.database.bin_dir = "";
    config.database.service_user = constants::database::DEFAULT_SERVICE_USER;

    config.identity.runner_user = constants::identity::DEFAULT_RUNNER_USER;

    config.environment.root = constants::environment::DEFAULT_ROOT;
    config.environment.extras = constants::environment::getDefaultExtras();
    config.environment.driver_manifest = constants::environment::DEFAULT_DRIVER_MANIFEST;

    config.logging.level = LogLevel::INFO;
    config.logging.format = LogFormat::TEXT;
    config.logging.file = "";

    return config;
}

std::string Config::resolveConfigPath(const std::string& cli_path, const Environment& env) {
    if (!cli_path.empty()) {
        return cli_path;
    }
    if (auto from_env = lookupEnv(env, constants::env_vars::CONFIG_FILE)) {
        return *from_env;
    }
    return constants::system::DEFAULT_CONFIG_FILE;
}

std::optional<LogLevel> Config::parseLogLevel(const std::string& value) {
    if (value == "DEBUG" || value == "debug") return LogLevel::DEBUG;
    if (value == "INFO" || value == "info") return LogLevel::INFO;
    if (value == "WARN" || value == "warn") return LogLevel::WARN;
    if (value == "ERROR" || value == "error") return LogLevel::ERROR;
    return std::nullopt;
}

bool Config::load(const std::string& config_file, const Environment& env) {
    global_ = createDefaultConfig();
    last_error_.clear();
    current_config_path_ = config_file;

    bool has_file = false;
    if (!config_file.empty()) {
        if (std::filesystem::exists(config_file)) {
            if (!tryLoadTomlFile(config_file)) {
                return false;
            }
            has_file = true;
        } else {
            Logger::instance().debug("[Config] File not found | path={}", config_file);
        }
    }

    applyEnvironment(env);

    Logger::instance().debug("[Config] Loaded | path={} | from_file={} | skip_db={} | runner={}",
                            config_file, has_file, global_.database.skip,
                            global_.identity.runner_user);
    return true;
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (access(path.c_str(), R_OK) != 0) {
        last_error_ = "config file not readable: " + path;
        return false;
    }

    try {
        auto data = toml::parse(path);

        if (data.contains("database")) {
            auto section = data.at("database");

            if (section.contains("skip")) {
                global_.database.skip = toml::find<bool>(section, "skip");
            }
            if (section.contains("data_dir")) {
                global_.database.data_dir = toml::find<std::string>(section, "data_dir");
            }
            if (section.contains("role")) {
                global_.database.role = toml::find<std::string>(section, "role");
            }
            if (section.contains("bin_dir")) {
                global_.database.bin_dir = toml::find<std::string>(section, "bin_dir");
            }
            if (section.contains("service_user")) {
                global_.database.service_user = toml::find<std::string>(section, "service_user");
            }
        }

        if (data.contains("identity")) {
            auto section = data.at("identity");

            if (section.contains("runner_user")) {
                global_.identity.runner_user = toml::find<std::string>(section, "runner_user");
            }
        }

        if (data.contains("environment")) {
            auto section = data.at("environment");

            if (section.contains("root")) {
                global_.environment.root = toml::find<std::string>(section, "root");
            }
            if (section.contains("extras")) {
                global_.environment.extras = toml::find<std::vector<std::string>>(section, "extras");
            }
            if (section.contains("driver_manifest")) {
                global_.environment.driver_manifest = toml::find<std::string>(section, "driver_manifest");
            }
        }

        if (data.contains("logging")) {
            auto section = data.at("logging");

            if (section.contains("level")) {
                std::string level = toml::find<std::string>(section, "level");
                auto parsed = parseLogLevel(level);
                if (!parsed) {
                    last_error_ = "invalid logging.level: " + level;
                    return false;
                }
                global_.logging.level = *parsed;
            }
            if (section.contains("format")) {
                std::string format_str = toml::find<std::string>(section, "format");
                global_.logging.format = (format_str == "json") ? LogFormat::JSON : LogFormat::TEXT;
            }
            if (section.contains("file")) {
                global_.logging.file = toml::find<std::string>(section, "file");
            }
        }

        return true;
    } catch (const std::exception& e) {
        last_error_ = e.what();
        return false;
    }
}

void Config::applyEnvironment(const Environment& env) {
    namespace ev = constants::env_vars;

    if (auto skip = lookupEnv(env, ev::SKIP_DB)) {
        global_.database.skip = (*skip == constants::database::SKIP_VALUE);
    }
    if (auto data_dir = lookupEnv(env, ev::DB_DATA_DIR)) {
        global_.database.data_dir = *data_dir;
    }
    if (auto role = lookupEnv(env, ev::DB_ROLE)) {
        global_.database.role = *role;
    }
    if (auto bin_dir = lookupEnv(env, ev::DB_BIN_DIR)) {
        global_.database.bin_dir = *bin_dir;
    }
    if (auto runner = lookupEnv(env, ev::RUNNER_USER)) {
        global_.identity.runner_user = *runner;
    }
    if (auto root = lookupEnv(env, ev::PYENV)) {
        global_.environment.root = *root;
    }
    if (auto level = lookupEnv(env, ev::LOG_LEVEL)) {
        if (auto parsed = parseLogLevel(*level)) {
            global_.logging.level = *parsed;
        }
    }
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

}}
