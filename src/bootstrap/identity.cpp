#include "cube_entrypoint/bootstrap/identity.hpp"
#include "cube_entrypoint/common/constants.hpp"
#include "cube_entrypoint/common/logger.hpp"
#include <string>
#include <vector>

namespace cube_entrypoint {
namespace bootstrap {

using common::BootstrapState;
using common::Logger;
using core::BootstrapErrorCode;
using core::StepResult;

IdentityReconciler::IdentityReconciler(system::HostSystem& host) : host_(host) {}

StepResult IdentityReconciler::runMutation(const std::vector<std::string>& argv,
                                           BootstrapErrorCode on_failure) {
    system::CommandSpec spec;
    spec.argv = argv;

    auto result = host_.run(spec);
    if (result.succeeded()) {
        return StepResult::success();
    }

    Logger::instance().debug("[Identity] Account step failed | cmd={} | exit_code={}",
                            system::describeCommand(argv), result.exit_code);
    return StepResult::failure(on_failure, system::describeCommand(argv));
}

StepResult IdentityReconciler::alignAccount(const common::Account& account,
                                            const common::FileOwner& owner) {
    const std::string uid = std::to_string(owner.uid);
    const std::string gid = std::to_string(owner.gid);

    // A gid already held by another group makes groupmod fail; usermod still
    // moves the account onto that gid, so every step runs regardless.
    StepResult first_failure = runMutation({"groupmod", "--gid", gid, account.name},
                                           BootstrapErrorCode::ACCOUNT_GROUP_MODIFY_FAILED);

    auto usermod = runMutation({"usermod", "--uid", uid, "--gid", gid, account.name},
                               BootstrapErrorCode::ACCOUNT_USER_MODIFY_FAILED);
    if (first_failure.ok()) {
        first_failure = usermod;
    }

    auto chown_home = runMutation({"chown", "-R", account.name + ":" + account.name, account.home},
                                  BootstrapErrorCode::HOME_CHOWN_FAILED);
    if (first_failure.ok()) {
        first_failure = chown_home;
    }

    return first_failure;
}

Reconciliation IdentityReconciler::reconcile(const common::IdentityConfig& config,
                                             const common::ExecutionContext& ctx) {
    Reconciliation outcome;
    const common::FileOwner& owner = ctx.cwd_owner;

    if (owner.uid == constants::system::ROOT_UID) {
        Logger::instance().warn(constants::messages::ROOT_WARNING);
        outcome.state = BootstrapState::RUNNING_AS_ROOT;
        outcome.result = StepResult::success();
        return outcome;
    }

    auto account = host_.lookupAccount(config.runner_user);
    if (!account) {
        Logger::instance().error("[Identity] Runner account not found | user={}", config.runner_user);
        outcome.result = StepResult::failure(BootstrapErrorCode::ACCOUNT_NOT_FOUND, config.runner_user);
        return outcome;
    }

    if (owner != account->owner()) {
        Logger::instance().info("[Identity] Remapping runner | user={} | from_uid={} | from_gid={} | to_uid={} | to_gid={}",
                               account->name, account->uid, account->gid, owner.uid, owner.gid);

        outcome.remap = alignAccount(*account, owner);
        outcome.account_modified = true;

        account = host_.lookupAccount(config.runner_user);
        if (!account) {
            outcome.result = StepResult::failure(BootstrapErrorCode::ACCOUNT_NOT_FOUND, config.runner_user);
            return outcome;
        }
    } else {
        Logger::instance().debug("[Identity] Runner already matches cwd owner | uid={} | gid={}",
                                owner.uid, owner.gid);
    }

    if (account->uid == constants::system::ROOT_UID) {
        Logger::instance().error("[Identity] Runner account has uid 0 | user={}", account->name);
        outcome.result = StepResult::failure(BootstrapErrorCode::ACCOUNT_IS_ROOT, account->name);
        return outcome;
    }

    outcome.state = BootstrapState::REEXEC;
    outcome.result = StepResult::success();
    outcome.handoff = Handoff::reexec(ctx.self_exe, ctx.argv, ctx.env, *account);
    return outcome;
}

}}
