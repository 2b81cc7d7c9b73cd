#include "cube_entrypoint/bootstrap/config_writer.hpp"
#include "cube_entrypoint/common/constants.hpp"
#include "cube_entrypoint/common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace cube_entrypoint {
namespace bootstrap {

using core::BootstrapErrorCode;
using core::StepResult;

namespace {

void writeProfile(std::ostringstream& out, const char* name, const char* driver) {
    out << "[" << name << "]\n";
    out << "db_hostname:\n";
    out << "db_database: " << constants::integration::DATABASE << "\n";
    out << "index_driver: " << driver << "\n";
}

}

std::string IntegrationConfigWriter::render() {
    std::ostringstream out;
    writeProfile(out, constants::integration::DEFAULT_PROFILE, constants::integration::DEFAULT_DRIVER);
    out << "\n";
    writeProfile(out, constants::integration::BROKEN_PROFILE, constants::integration::BROKEN_DRIVER);
    return out.str();
}

std::string IntegrationConfigWriter::targetPath(const std::string& home_dir) {
    return (std::filesystem::path(home_dir) / constants::integration::CONFIG_FILENAME).string();
}

std::string IntegrationConfigWriter::resolveHome(const common::ExecutionContext& ctx,
                                                 system::HostSystem& host) {
    if (auto home = common::lookupEnv(ctx.env, constants::env_vars::HOME)) {
        return *home;
    }
    if (auto account = host.lookupAccount(ctx.uid)) {
        return account->home;
    }
    return "";
}

StepResult IntegrationConfigWriter::write(const std::string& home_dir) {
    if (home_dir.empty()) {
        return StepResult::failure(BootstrapErrorCode::HOME_NOT_FOUND);
    }

    const std::string path = targetPath(home_dir);
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        common::Logger::instance().error("[Config] Integration config open failed | path={}", path);
        return StepResult::failure(BootstrapErrorCode::CONFIG_ARTIFACT_WRITE_FAILED, path);
    }

    file << render();
    file.close();
    if (!file) {
        common::Logger::instance().error("[Config] Integration config write failed | path={}", path);
        return StepResult::failure(BootstrapErrorCode::CONFIG_ARTIFACT_WRITE_FAILED, path);
    }

    common::Logger::instance().debug("[Config] Integration config written | path={}", path);
    return StepResult::success();
}

}}
