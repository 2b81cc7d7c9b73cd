#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <sys/types.h>

namespace cube_entrypoint {
namespace common {

// Snapshot of the ambient process state. Stages read identity, cwd ownership
// and environment variables from here rather than from the live process.
struct ExecutionContext {
    uid_t uid = 0;
    gid_t gid = 0;
    std::string cwd;
    FileOwner cwd_owner;
    Environment env;
    std::string self_exe;
    std::vector<std::string> argv;

    static ExecutionContext capture(int argc, char** argv);
};

}}
