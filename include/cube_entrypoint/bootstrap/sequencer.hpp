#pragma once

#include "handoff.hpp"
#include "../common/config.hpp"
#include "../common/context.hpp"
#include "../core/error_codes.hpp"
#include "../system/host.hpp"
#include <string>
#include <vector>

namespace cube_entrypoint {
namespace bootstrap {

struct SequencerOutcome {
    common::BootstrapState state = common::BootstrapState::FAILED;
    Handoff handoff;
    core::StepResult result;
    bool database_attempted = false;
    bool reconciler_entered = false;
    // Failures that were logged and stepped over, in stage order.
    std::vector<core::StepResult> tolerated;

    bool failed() const { return state == common::BootstrapState::FAILED; }
};

// Privilege gate, database, identity reconciliation, then environment
// activation and handoff. Only a missing or uid 0 runner account aborts.
// Re-exec happens at most once per chain: the re-executed process is never
// elevated, so it goes straight to stage 4.
class BootstrapSequencer {
public:
    BootstrapSequencer(const common::BootstrapConfig& config, system::HostSystem& host);

    SequencerOutcome run(const common::ExecutionContext& ctx,
                         const std::vector<std::string>& command);

private:
    const common::BootstrapConfig& config_;
    system::HostSystem& host_;

    void activateAndHandoff(const common::ExecutionContext& ctx,
                            const std::vector<std::string>& command,
                            SequencerOutcome& outcome);
    bool applyPolicy(const char* stage, const core::StepResult& result,
                     core::FailurePolicy policy, SequencerOutcome& outcome);
};

}}
