#include "cube_entrypoint/common/context.hpp"
#include "cube_entrypoint/common/constants.hpp"
#include "cube_entrypoint/common/logger.hpp"
#include <filesystem>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <sys/stat.h>

extern char** environ;

namespace cube_entrypoint {
namespace common {

ExecutionContext ExecutionContext::capture(int argc, char** argv) {
    ExecutionContext ctx;
    ctx.uid = geteuid();
    ctx.gid = getegid();

    std::error_code ec;
    ctx.cwd = std::filesystem::current_path(ec).string();
    if (ec) {
        Logger::instance().warn("[Context] Cannot read cwd | error={}", ec.message());
        ctx.cwd = ".";
    }

    struct stat st;
    if (stat(ctx.cwd.c_str(), &st) == 0) {
        ctx.cwd_owner = {st.st_uid, st.st_gid};
    } else {
        Logger::instance().warn("[Context] Cannot stat cwd | path={} | error={}",
                               ctx.cwd, strerror(errno));
    }

    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv(*entry);
        auto eq_pos = kv.find('=');
        if (eq_pos == std::string::npos) continue;
        ctx.env.emplace(kv.substr(0, eq_pos), kv.substr(eq_pos + 1));
    }

    ctx.self_exe = std::filesystem::read_symlink(constants::system::SELF_EXE_LINK, ec).string();
    if (ec || ctx.self_exe.empty()) {
        ctx.self_exe = argc > 0 ? argv[0] : "";
    }

    for (int i = 0; i < argc; ++i) {
        ctx.argv.emplace_back(argv[i]);
    }

    Logger::instance().debug("[Context] Captured | uid={} | gid={} | cwd={} | owner_uid={} | owner_gid={}",
                            ctx.uid, ctx.gid, ctx.cwd, ctx.cwd_owner.uid, ctx.cwd_owner.gid);
    return ctx;
}

}}
