#pragma once

#include "../common/types.hpp"
#include <string>
#include <vector>
#include <optional>

namespace cube_entrypoint {
namespace bootstrap {

// The last thing an invocation does: exit, exec the caller's command, or
// re-exec this program as the runner account.
struct Handoff {
    common::HandoffKind kind = common::HandoffKind::EXIT;
    std::string program;
    std::vector<std::string> argv;
    common::Environment env;
    std::optional<common::Account> account;

    static Handoff exitSuccess();
    static Handoff execCommand(std::vector<std::string> command, common::Environment env);
    static Handoff reexec(std::string self_exe, std::vector<std::string> argv,
                          common::Environment env, common::Account account);
};

}}
