#include "cube_entrypoint/bootstrap/sequencer.hpp"
#include "cube_entrypoint/bootstrap/config_writer.hpp"
#include "cube_entrypoint/bootstrap/database.hpp"
#include "cube_entrypoint/bootstrap/environment.hpp"
#include "cube_entrypoint/bootstrap/identity.hpp"
#include "cube_entrypoint/common/logger.hpp"
#include "cube_entrypoint/common/security.hpp"

namespace cube_entrypoint {
namespace bootstrap {

using common::BootstrapState;
using common::Logger;
using core::FailurePolicy;
using core::StepResult;

BootstrapSequencer::BootstrapSequencer(const common::BootstrapConfig& config,
                                       system::HostSystem& host)
    : config_(config), host_(host) {}

bool BootstrapSequencer::applyPolicy(const char* stage, const StepResult& result,
                                     FailurePolicy policy, SequencerOutcome& outcome) {
    if (result.ok()) {
        return true;
    }

    Logger::instance().debug("[Sequencer] Stage failed | stage={} | code={} | policy={} | detail={}",
                            stage, core::BootstrapErrorCodeHelper::toString(result.code),
                            core::to_string(policy), result.detail);

    switch (policy) {
        case FailurePolicy::IGNORE:
            outcome.tolerated.push_back(result);
            return true;
        case FailurePolicy::WARN:
            Logger::instance().warn("[Sequencer] Continuing after failure | stage={} | error={}",
                                   stage, core::BootstrapErrorCodeHelper::getMessage(result.code));
            outcome.tolerated.push_back(result);
            return true;
        case FailurePolicy::ABORT:
            Logger::instance().error("[Sequencer] Aborting | stage={} | error={}",
                                    stage, core::BootstrapErrorCodeHelper::getMessage(result.code));
            outcome.state = BootstrapState::FAILED;
            outcome.result = result;
            return false;
    }
    return false;
}

SequencerOutcome BootstrapSequencer::run(const common::ExecutionContext& ctx,
                                         const std::vector<std::string>& command) {
    SequencerOutcome outcome;

    if (!common::isElevated(ctx)) {
        Logger::instance().debug("[Sequencer] Not elevated | uid={}", ctx.uid);
        outcome.state = BootstrapState::RUNNING_AS_USER;
        activateAndHandoff(ctx, command, outcome);
        return outcome;
    }

    Logger::instance().debug("[Sequencer] Elevated entry | cwd={}", ctx.cwd);

    if (!config_.database.skip) {
        outcome.database_attempted = true;
        DatabaseStarter starter(host_);
        // The starter reports its own single warning.
        applyPolicy("database", starter.start(config_.database), FailurePolicy::IGNORE, outcome);
    }

    outcome.reconciler_entered = true;
    IdentityReconciler reconciler(host_);
    auto reconciliation = reconciler.reconcile(config_.identity, ctx);

    applyPolicy("identity.remap", reconciliation.remap, FailurePolicy::WARN, outcome);
    if (!applyPolicy("identity", reconciliation.result, FailurePolicy::ABORT, outcome)) {
        return outcome;
    }

    outcome.state = reconciliation.state;
    if (reconciliation.state == BootstrapState::REEXEC && reconciliation.handoff) {
        outcome.handoff = *reconciliation.handoff;
        outcome.result = StepResult::success();
        return outcome;
    }

    activateAndHandoff(ctx, command, outcome);
    return outcome;
}

void BootstrapSequencer::activateAndHandoff(const common::ExecutionContext& ctx,
                                            const std::vector<std::string>& command,
                                            SequencerOutcome& outcome) {
    auto written = IntegrationConfigWriter::write(IntegrationConfigWriter::resolveHome(ctx, host_));
    applyPolicy("config", written, FailurePolicy::WARN, outcome);

    EnvironmentActivator activator(host_);
    auto activation = activator.activate(config_.environment, ctx.env, ctx.cwd);
    applyPolicy("environment", activation.result, FailurePolicy::WARN, outcome);

    outcome.result = StepResult::success();
    if (command.empty()) {
        outcome.handoff = Handoff::exitSuccess();
    } else {
        outcome.handoff = Handoff::execCommand(command, std::move(activation.env));
    }

    Logger::instance().debug("[Sequencer] Handoff ready | state={} | kind={} | tolerated={}",
                            common::to_string(outcome.state), common::to_string(outcome.handoff.kind),
                            outcome.tolerated.size());
}

}}
