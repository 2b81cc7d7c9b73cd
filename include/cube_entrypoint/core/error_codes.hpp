#pragma once

#include "../common/error_framework.hpp"
#include <string>
#include <unordered_map>

namespace cube_entrypoint {
namespace core {

enum class BootstrapErrorCode {
    NONE = 0,

    DB_INIT_FAILED = 200,
    DB_START_FAILED = 201,
    DB_ROLE_CREATE_FAILED = 202,
    DB_CREATE_FAILED = 203,

    ACCOUNT_NOT_FOUND = 300,
    ACCOUNT_IS_ROOT = 301,
    ACCOUNT_GROUP_MODIFY_FAILED = 302,
    ACCOUNT_USER_MODIFY_FAILED = 303,
    HOME_CHOWN_FAILED = 304,
    PRIVILEGE_DROP_FAILED = 305,

    CONFIG_ARTIFACT_WRITE_FAILED = 400,
    HOME_NOT_FOUND = 401,
    DEPENDENCY_INSTALL_FAILED = 402,
    GDAL_DATA_UNRESOLVED = 403,

    EXEC_FAILED = 500,
    COMMAND_NOT_FOUND = 501,
    SPAWN_FAILED = 502
};

enum class FailurePolicy {
    IGNORE,
    WARN,
    ABORT
};

struct StepResult {
    BootstrapErrorCode code = BootstrapErrorCode::NONE;
    std::string detail;

    bool ok() const { return code == BootstrapErrorCode::NONE; }

    static StepResult success() { return {}; }
    static StepResult failure(BootstrapErrorCode code, std::string detail = "") {
        return {code, std::move(detail)};
    }
};

using BootstrapErrorCodeHelper = common::ErrorRegistry<BootstrapErrorCode>;

std::string to_string(FailurePolicy policy);

}
}

namespace cube_entrypoint {
namespace common {

template<>
inline const std::unordered_map<core::BootstrapErrorCode, ErrorInfo<core::BootstrapErrorCode>>&
ErrorRegistry<core::BootstrapErrorCode>::getInfoMap() {
    static const std::unordered_map<core::BootstrapErrorCode, ErrorInfo<core::BootstrapErrorCode>> map = {
        {core::BootstrapErrorCode::NONE, {
            core::BootstrapErrorCode::NONE,
            "NONE",
            "No error"
        }},
        {core::BootstrapErrorCode::DB_INIT_FAILED, {
            core::BootstrapErrorCode::DB_INIT_FAILED,
            "DB_INIT_FAILED",
            "Database storage initialization failed"
        }},
        {core::BootstrapErrorCode::DB_START_FAILED, {
            core::BootstrapErrorCode::DB_START_FAILED,
            "DB_START_FAILED",
            "Database server start failed"
        }},
        {core::BootstrapErrorCode::DB_ROLE_CREATE_FAILED, {
            core::BootstrapErrorCode::DB_ROLE_CREATE_FAILED,
            "DB_ROLE_CREATE_FAILED",
            "Database role creation failed"
        }},
        {core::BootstrapErrorCode::DB_CREATE_FAILED, {
            core::BootstrapErrorCode::DB_CREATE_FAILED,
            "DB_CREATE_FAILED",
            "Database creation failed"
        }},
        {core::BootstrapErrorCode::ACCOUNT_NOT_FOUND, {
            core::BootstrapErrorCode::ACCOUNT_NOT_FOUND,
            "ACCOUNT_NOT_FOUND",
            "Runner account not found"
        }},
        {core::BootstrapErrorCode::ACCOUNT_IS_ROOT, {
            core::BootstrapErrorCode::ACCOUNT_IS_ROOT,
            "ACCOUNT_IS_ROOT",
            "Runner account has the administrative uid"
        }},
        {core::BootstrapErrorCode::ACCOUNT_GROUP_MODIFY_FAILED, {
            core::BootstrapErrorCode::ACCOUNT_GROUP_MODIFY_FAILED,
            "ACCOUNT_GROUP_MODIFY_FAILED",
            "Runner group id change failed"
        }},
        {core::BootstrapErrorCode::ACCOUNT_USER_MODIFY_FAILED, {
            core::BootstrapErrorCode::ACCOUNT_USER_MODIFY_FAILED,
            "ACCOUNT_USER_MODIFY_FAILED",
            "Runner user id change failed"
        }},
        {core::BootstrapErrorCode::HOME_CHOWN_FAILED, {
            core::BootstrapErrorCode::HOME_CHOWN_FAILED,
            "HOME_CHOWN_FAILED",
            "Runner home ownership change failed"
        }},
        {core::BootstrapErrorCode::PRIVILEGE_DROP_FAILED, {
            core::BootstrapErrorCode::PRIVILEGE_DROP_FAILED,
            "PRIVILEGE_DROP_FAILED",
            "Privilege drop failed"
        }},
        {core::BootstrapErrorCode::CONFIG_ARTIFACT_WRITE_FAILED, {
            core::BootstrapErrorCode::CONFIG_ARTIFACT_WRITE_FAILED,
            "CONFIG_ARTIFACT_WRITE_FAILED",
            "Integration config could not be written"
        }},
        {core::BootstrapErrorCode::HOME_NOT_FOUND, {
            core::BootstrapErrorCode::HOME_NOT_FOUND,
            "HOME_NOT_FOUND",
            "Home directory could not be determined"
        }},
        {core::BootstrapErrorCode::DEPENDENCY_INSTALL_FAILED, {
            core::BootstrapErrorCode::DEPENDENCY_INSTALL_FAILED,
            "DEPENDENCY_INSTALL_FAILED",
            "Dependency installation failed"
        }},
        {core::BootstrapErrorCode::GDAL_DATA_UNRESOLVED, {
            core::BootstrapErrorCode::GDAL_DATA_UNRESOLVED,
            "GDAL_DATA_UNRESOLVED",
            "GDAL data directory could not be resolved"
        }},
        {core::BootstrapErrorCode::EXEC_FAILED, {
            core::BootstrapErrorCode::EXEC_FAILED,
            "EXEC_FAILED",
            "Process image replacement failed"
        }},
        {core::BootstrapErrorCode::COMMAND_NOT_FOUND, {
            core::BootstrapErrorCode::COMMAND_NOT_FOUND,
            "COMMAND_NOT_FOUND",
            "Command not found"
        }},
        {core::BootstrapErrorCode::SPAWN_FAILED, {
            core::BootstrapErrorCode::SPAWN_FAILED,
            "SPAWN_FAILED",
            "External command could not be spawned"
        }}
    };
    return map;
}

}
}
