#include "cube_entrypoint/bootstrap/handoff.hpp"
#include "cube_entrypoint/common/constants.hpp"

namespace cube_entrypoint {
namespace bootstrap {

Handoff Handoff::exitSuccess() {
    return Handoff{};
}

Handoff Handoff::execCommand(std::vector<std::string> command, common::Environment env) {
    Handoff handoff;
    handoff.kind = common::HandoffKind::EXEC_COMMAND;
    handoff.program = command.empty() ? "" : command.front();
    handoff.argv = std::move(command);
    handoff.env = std::move(env);
    return handoff;
}

Handoff Handoff::reexec(std::string self_exe, std::vector<std::string> argv,
                        common::Environment env, common::Account account) {
    namespace ev = constants::env_vars;

    env[ev::HOME] = account.home;
    env[ev::USER] = account.name;
    env[ev::LOGNAME] = account.name;

    Handoff handoff;
    handoff.kind = common::HandoffKind::REEXEC;
    handoff.program = std::move(self_exe);
    handoff.argv = std::move(argv);
    handoff.env = std::move(env);
    handoff.account = std::move(account);
    return handoff;
}

}}
