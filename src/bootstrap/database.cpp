#include "cube_entrypoint/bootstrap/database.hpp"
#include "cube_entrypoint/common/constants.hpp"
#include "cube_entrypoint/common/logger.hpp"
#include <filesystem>
#include <optional>
#include <vector>

namespace cube_entrypoint {
namespace bootstrap {

using common::Logger;
using core::BootstrapErrorCode;
using core::StepResult;

DatabaseStarter::DatabaseStarter(system::HostSystem& host) : host_(host) {}

bool DatabaseStarter::isInitialized(const std::string& data_dir) const {
    std::error_code ec;
    return std::filesystem::exists(
        std::filesystem::path(data_dir) / constants::database::INIT_MARKER, ec);
}

std::optional<std::vector<unsigned long>> DatabaseStarter::parseVersion(const std::string& name) {
    std::vector<unsigned long> parts;
    size_t pos = 0;
    while (pos <= name.size()) {
        size_t dot = name.find('.', pos);
        std::string part = name.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
        if (part.empty() || part.size() > 9 ||
            part.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
        parts.push_back(std::stoul(part));
        if (dot == std::string::npos) {
            break;
        }
        pos = dot + 1;
    }
    return parts;
}

std::string DatabaseStarter::findLatestInstall(const std::string& install_root) {
    std::error_code ec;
    if (!std::filesystem::is_directory(install_root, ec)) {
        return "";
    }

    std::string best_dir;
    std::vector<unsigned long> best_version;
    for (const auto& entry : std::filesystem::directory_iterator(install_root, ec)) {
        if (!entry.is_directory(ec)) continue;

        auto version = parseVersion(entry.path().filename().string());
        if (!version) continue;

        auto bin = entry.path() / "bin";
        if (!std::filesystem::is_directory(bin, ec)) continue;

        if (best_dir.empty() || *version > best_version) {
            best_version = *version;
            best_dir = bin.string();
        }
    }
    return best_dir;
}

std::string DatabaseStarter::resolveBinDir(const std::string& configured) const {
    if (!configured.empty()) {
        return configured;
    }
    return findLatestInstall(constants::database::INSTALL_ROOT);
}

std::string DatabaseStarter::tool(const std::string& bin_dir, const std::string& name) const {
    if (bin_dir.empty()) {
        return name;
    }
    return (std::filesystem::path(bin_dir) / name).string();
}

StepResult DatabaseStarter::runStep(const std::vector<std::string>& argv,
                                    const common::Account& service_account,
                                    BootstrapErrorCode on_failure) {
    system::CommandSpec spec;
    spec.argv = argv;
    spec.run_as = service_account;

    auto result = host_.run(spec);
    if (result.succeeded()) {
        return StepResult::success();
    }

    Logger::instance().debug("[Database] Step failed | cmd={} | exit_code={} | spawn_errno={}",
                            system::describeCommand(argv), result.exit_code, result.spawn_errno);
    return StepResult::failure(on_failure, system::describeCommand(argv));
}

StepResult DatabaseStarter::start(const common::DatabaseConfig& config) {
    if (config.skip) {
        Logger::instance().info("[Database] Skipped by configuration");
        return StepResult::success();
    }

    auto service_account = host_.lookupAccount(config.service_user);
    if (!service_account) {
        Logger::instance().debug("[Database] Service account missing | user={}", config.service_user);
        Logger::instance().warn(constants::messages::DB_LAUNCH_WARNING);
        return StepResult::failure(BootstrapErrorCode::ACCOUNT_NOT_FOUND, config.service_user);
    }

    const std::string bin_dir = resolveBinDir(config.bin_dir);
    const std::string& data_dir = config.data_dir;

    Logger::instance().info("[Database] Starting | data_dir={} | role={} | bin_dir={}",
                           data_dir, config.role, bin_dir.empty() ? "PATH" : bin_dir);

    if (!isInitialized(data_dir)) {
        auto init = runStep({tool(bin_dir, "initdb"),
                             "-D", data_dir,
                             std::string("--auth-host=") + constants::database::HOST_AUTH_METHOD,
                             std::string("--encoding=") + constants::database::ENCODING},
                            *service_account, BootstrapErrorCode::DB_INIT_FAILED);
        if (!init.ok()) {
            Logger::instance().warn(constants::messages::DB_LAUNCH_WARNING);
            return init;
        }
    } else {
        Logger::instance().debug("[Database] Already initialized | data_dir={}", data_dir);
    }

    const std::string log_file =
        (std::filesystem::path(data_dir) / constants::database::LOG_FILE).string();
    auto started = runStep({tool(bin_dir, "pg_ctl"), "-D", data_dir, "-l", log_file, "start"},
                           *service_account, BootstrapErrorCode::DB_START_FAILED);
    if (!started.ok()) {
        Logger::instance().warn(constants::messages::DB_LAUNCH_WARNING);
        return started;
    }

    // Roles and databases survive restarts, so these fail on every start
    // after the first.
    StepResult first_failure = runStep({tool(bin_dir, "createuser"), "--superuser", config.role},
                                       *service_account, BootstrapErrorCode::DB_ROLE_CREATE_FAILED);

    std::vector<std::string> databases = {config.role};
    for (const auto* name : constants::database::FIXED_DATABASES) {
        databases.emplace_back(name);
    }

    for (const auto& database : databases) {
        auto created = runStep({tool(bin_dir, "createdb"), database},
                               *service_account, BootstrapErrorCode::DB_CREATE_FAILED);
        if (first_failure.ok() && !created.ok()) {
            first_failure = created;
        }
    }

    if (!first_failure.ok()) {
        Logger::instance().warn(constants::messages::DB_LAUNCH_WARNING);
        return first_failure;
    }

    Logger::instance().info("[Database] Ready | data_dir={} | role={}", data_dir, config.role);
    return StepResult::success();
}

}}
