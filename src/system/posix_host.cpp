#include "cube_entrypoint/system/host.hpp"
#include "cube_entrypoint/common/logger.hpp"
#include "cube_entrypoint/common/security.hpp"
#include "cube_entrypoint/core/error_codes.hpp"
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <pwd.h>
#include <cstdlib>
#include <cstring>
#include <cerrno>

namespace cube_entrypoint {
namespace system {

namespace {

std::optional<common::Account> toAccount(const struct passwd* pw) {
    if (pw == nullptr) {
        return std::nullopt;
    }
    common::Account account;
    account.name = pw->pw_name;
    account.uid = pw->pw_uid;
    account.gid = pw->pw_gid;
    account.home = pw->pw_dir ? pw->pw_dir : "";
    return account;
}

std::vector<char*> toArgv(const std::vector<std::string>& args) {
    std::vector<char*> c_args;
    c_args.reserve(args.size() + 1);
    for (const auto& arg : args) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);
    return c_args;
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}

std::string describeCommand(const std::vector<std::string>& argv) {
    std::string result;
    for (const auto& arg : argv) {
        if (!result.empty()) {
            result += " ";
        }
        result += arg;
    }
    return result;
}

CommandResult PosixHostSystem::run(const CommandSpec& spec) {
    CommandResult result;

    if (spec.argv.empty()) {
        result.spawn_errno = EINVAL;
        return result;
    }

    int pipe_fds[2] = {-1, -1};
    if (spec.capture_output && pipe(pipe_fds) != 0) {
        result.spawn_errno = errno;
        common::Logger::instance().debug("[Host] pipe failed | code={} | error={}",
                                        core::BootstrapErrorCodeHelper::toString(core::BootstrapErrorCode::SPAWN_FAILED),
                                        strerror(result.spawn_errno));
        return result;
    }

    common::Logger::instance().debug("[Host] Running | cmd={} | as={}",
                                    describeCommand(spec.argv),
                                    spec.run_as ? spec.run_as->name : "self");
    common::Logger::instance().flush();

    pid_t pid = fork();

    if (pid < 0) {
        result.spawn_errno = errno;
        if (spec.capture_output) {
            close(pipe_fds[0]);
            close(pipe_fds[1]);
        }
        common::Logger::instance().error("[Host] fork failed | cmd={} | code={} | error={}",
                                        spec.argv[0],
                                        core::BootstrapErrorCodeHelper::toString(core::BootstrapErrorCode::SPAWN_FAILED),
                                        strerror(result.spawn_errno));
        return result;
    }

    if (pid == 0) {
        if (spec.capture_output) {
            close(pipe_fds[0]);
            if (dup2(pipe_fds[1], STDOUT_FILENO) < 0) {
                _exit(127);
            }
            close(pipe_fds[1]);
        }

        if (spec.run_as && !common::PrivilegeManager::becomeAccount(*spec.run_as)) {
            _exit(126);
        }

        if (spec.env) {
            clearenv();
            for (const auto& [key, value] : *spec.env) {
                setenv(key.c_str(), value.c_str(), 1);
            }
        }

        auto c_args = toArgv(spec.argv);
        execvp(c_args[0], c_args.data());
        _exit(errno == ENOENT ? 127 : 126);
    }

    if (spec.capture_output) {
        close(pipe_fds[1]);
        char buffer[4096];
        ssize_t n;
        while ((n = read(pipe_fds[0], buffer, sizeof(buffer))) != 0) {
            if (n < 0) {
                if (errno == EINTR) continue;
                break;
            }
            result.output.append(buffer, static_cast<size_t>(n));
        }
        close(pipe_fds[0]);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.spawn_errno = errno;
            return result;
        }
    }

    result.exit_code = decodeWaitStatus(status);
    return result;
}

std::optional<common::Account> PosixHostSystem::lookupAccount(const std::string& name) {
    return toAccount(getpwnam(name.c_str()));
}

std::optional<common::Account> PosixHostSystem::lookupAccount(uid_t uid) {
    return toAccount(getpwuid(uid));
}

}}
