#pragma once

#include "handoff.hpp"
#include "../common/config.hpp"
#include "../common/context.hpp"
#include "../core/error_codes.hpp"
#include "../system/host.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cube_entrypoint {
namespace bootstrap {

struct Reconciliation {
    common::BootstrapState state = common::BootstrapState::FAILED;
    core::StepResult result;
    // First failing account mutation; never stops the re-exec.
    core::StepResult remap;
    std::optional<Handoff> handoff;
    bool account_modified = false;
};

class IdentityReconciler {
public:
    explicit IdentityReconciler(system::HostSystem& host);

    // Only meaningful for an elevated context. Ends in RUNNING_AS_ROOT when
    // the working directory is root-owned, otherwise in REEXEC as the runner.
    Reconciliation reconcile(const common::IdentityConfig& config,
                             const common::ExecutionContext& ctx);

private:
    system::HostSystem& host_;

    core::StepResult alignAccount(const common::Account& account, const common::FileOwner& owner);
    core::StepResult runMutation(const std::vector<std::string>& argv, core::BootstrapErrorCode on_failure);
};

}}
