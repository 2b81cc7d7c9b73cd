#pragma once

#include "../bootstrap/handoff.hpp"
#include "../common/types.hpp"
#include "../core/error_codes.hpp"

namespace cube_entrypoint {
namespace system {

class ProcessExecutor {
public:
    // Returns only when no exec happened: the exit code for EXIT, or the
    // failure code when the image replacement could not be performed.
    static int perform(const bootstrap::Handoff& handoff);

    static void applyEnvironment(const common::Environment& env);

    static core::BootstrapErrorCode classifyExecError(int err);
    static int exitCodeFor(core::BootstrapErrorCode code);
};

}}
