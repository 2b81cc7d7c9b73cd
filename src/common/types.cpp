#include "cube_entrypoint/common/types.hpp"

namespace cube_entrypoint {
namespace common {

std::string to_string(BootstrapState state) {
    switch (state) {
        case BootstrapState::RUNNING_AS_ROOT: return "RUNNING_AS_ROOT";
        case BootstrapState::RUNNING_AS_USER: return "RUNNING_AS_USER";
        case BootstrapState::REEXEC: return "REEXEC";
        case BootstrapState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

std::string to_string(HandoffKind kind) {
    switch (kind) {
        case HandoffKind::EXIT: return "EXIT";
        case HandoffKind::EXEC_COMMAND: return "EXEC_COMMAND";
        case HandoffKind::REEXEC: return "REEXEC";
        default: return "UNKNOWN";
    }
}

std::optional<std::string> lookupEnv(const Environment& env, const std::string& key) {
    auto it = env.find(key);
    if (it == env.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

}}
