#pragma once

#include "context.hpp"
#include "types.hpp"
#include <string>
#include <sys/types.h>

namespace cube_entrypoint {
namespace common {

bool isElevated(const ExecutionContext& ctx);

class PrivilegeManager {
public:
    // Switches supplementary groups, gid and uid to the account, then checks
    // that uid 0 can no longer be regained.
    static bool dropPrivileges(const Account& account);

    static bool becomeAccount(const Account& account);

private:
    static bool validateUsername(const std::string& username);
};

}}
