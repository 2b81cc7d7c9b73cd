#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sys/types.h>

namespace cube_entrypoint {
namespace common {

using Environment = std::map<std::string, std::string>;

enum class BootstrapState {
    RUNNING_AS_ROOT,
    RUNNING_AS_USER,
    REEXEC,
    FAILED
};

enum class HandoffKind {
    EXIT,
    EXEC_COMMAND,
    REEXEC
};

struct FileOwner {
    uid_t uid = 0;
    gid_t gid = 0;

    bool operator==(const FileOwner& other) const {
        return uid == other.uid && gid == other.gid;
    }
    bool operator!=(const FileOwner& other) const { return !(*this == other); }
};

struct Account {
    std::string name;
    uid_t uid = 0;
    gid_t gid = 0;
    std::string home;

    FileOwner owner() const { return {uid, gid}; }
};

std::string to_string(BootstrapState state);
std::string to_string(HandoffKind kind);

std::optional<std::string> lookupEnv(const Environment& env, const std::string& key);

}}
