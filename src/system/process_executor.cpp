#include "cube_entrypoint/system/process.hpp"
#include "cube_entrypoint/system/host.hpp"
#include "cube_entrypoint/common/constants.hpp"
#include "cube_entrypoint/common/logger.hpp"
#include "cube_entrypoint/common/security.hpp"
#include <unistd.h>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <vector>

namespace cube_entrypoint {
namespace system {

void ProcessExecutor::applyEnvironment(const common::Environment& env) {
    clearenv();
    for (const auto& [key, value] : env) {
        setenv(key.c_str(), value.c_str(), 1);
    }
}

core::BootstrapErrorCode ProcessExecutor::classifyExecError(int err) {
    return err == ENOENT ? core::BootstrapErrorCode::COMMAND_NOT_FOUND
                         : core::BootstrapErrorCode::EXEC_FAILED;
}

int ProcessExecutor::exitCodeFor(core::BootstrapErrorCode code) {
    switch (code) {
        case core::BootstrapErrorCode::NONE:
            return constants::exit_codes::SUCCESS;
        case core::BootstrapErrorCode::COMMAND_NOT_FOUND:
            return constants::exit_codes::COMMAND_NOT_FOUND;
        case core::BootstrapErrorCode::EXEC_FAILED:
            return constants::exit_codes::EXEC_FAILED;
        default:
            return constants::exit_codes::BOOTSTRAP_FAILED;
    }
}

int ProcessExecutor::perform(const bootstrap::Handoff& handoff) {
    auto& logger = common::Logger::instance();

    if (handoff.kind == common::HandoffKind::EXIT) {
        logger.debug("[Handoff] No command given, exiting");
        logger.flush();
        return constants::exit_codes::SUCCESS;
    }

    if (handoff.argv.empty() || handoff.program.empty()) {
        logger.error("[Handoff] Empty command | kind={} | code={}", common::to_string(handoff.kind),
                     core::BootstrapErrorCodeHelper::toString(core::BootstrapErrorCode::EXEC_FAILED));
        return exitCodeFor(core::BootstrapErrorCode::EXEC_FAILED);
    }

    if (handoff.kind == common::HandoffKind::REEXEC) {
        if (!handoff.account || !common::PrivilegeManager::dropPrivileges(*handoff.account)) {
            logger.error("[Handoff] {} | user={}",
                         core::BootstrapErrorCodeHelper::getMessage(core::BootstrapErrorCode::PRIVILEGE_DROP_FAILED),
                         handoff.account ? handoff.account->name : "");
            logger.flush();
            return exitCodeFor(core::BootstrapErrorCode::PRIVILEGE_DROP_FAILED);
        }
    }

    std::vector<char*> c_args;
    c_args.reserve(handoff.argv.size() + 1);
    for (const auto& arg : handoff.argv) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    applyEnvironment(handoff.env);

    logger.info("[Handoff] Exec | kind={} | cmd={}",
                common::to_string(handoff.kind), describeCommand(handoff.argv));
    logger.flush();

    if (handoff.kind == common::HandoffKind::REEXEC) {
        execv(handoff.program.c_str(), c_args.data());
    } else {
        execvp(handoff.program.c_str(), c_args.data());
    }

    int err = errno;
    auto code = classifyExecError(err);
    logger.error("[Handoff] Exec failed | program={} | code={} | error={}",
                 handoff.program, core::BootstrapErrorCodeHelper::toString(code), strerror(err));
    logger.flush();
    return exitCodeFor(code);
}

}}
