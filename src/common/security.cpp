#include "cube_entrypoint/common/security.hpp"
#include "cube_entrypoint/common/constants.hpp"
#include "cube_entrypoint/common/logger.hpp"
#include <unistd.h>
#include <sys/types.h>
#include <grp.h>
#include <cctype>
#include <cstring>
#include <cerrno>

namespace cube_entrypoint {
namespace common {

bool isElevated(const ExecutionContext& ctx) {
    return ctx.uid == constants::system::ROOT_UID;
}

bool PrivilegeManager::dropPrivileges(const Account& account) {
    if (!validateUsername(account.name)) {
        return false;
    }

    if (account.uid == constants::system::ROOT_UID) {
        Logger::instance().error("[Security] Refusing to drop to uid 0 | user={}", account.name);
        return false;
    }

    uid_t old_uid = getuid();
    gid_t old_gid = getgid();

    if (!becomeAccount(account)) {
        return false;
    }

    if (setuid(0) == 0) {
        Logger::instance().error("[Security] Privilege drop verification failed - still have root");
        return false;
    }

    Logger::instance().debug("[Security] Privileges dropped | from_uid={} | to_uid={} | from_gid={} | to_gid={} | user={}",
                            old_uid, getuid(), old_gid, getgid(), account.name);
    return true;
}

bool PrivilegeManager::becomeAccount(const Account& account) {
    if (initgroups(account.name.c_str(), account.gid) != 0) {
        Logger::instance().error("[Security] initgroups failed | user={} | error={}",
                                account.name, strerror(errno));
        return false;
    }

    if (setgid(account.gid) != 0) {
        Logger::instance().error("[Security] setgid failed | gid={} | error={}",
                                account.gid, strerror(errno));
        return false;
    }

    if (setuid(account.uid) != 0) {
        Logger::instance().error("[Security] setuid failed | uid={} | error={}",
                                account.uid, strerror(errno));
        return false;
    }

    return true;
}

bool PrivilegeManager::validateUsername(const std::string& username) {
    if (username.empty()) {
        Logger::instance().error("[Security] Empty username");
        return false;
    }

    if (username.length() > 32) {
        Logger::instance().error("[Security] Username too long | user={}", username);
        return false;
    }

    for (char c : username) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.') {
            Logger::instance().error("[Security] Invalid character in username | char={}", c);
            return false;
        }
    }

    return true;
}

}}
