#include "entrypoint_command.hpp"
#include "cube_entrypoint/bootstrap/sequencer.hpp"
#include "cube_entrypoint/common/config.hpp"
#include "cube_entrypoint/common/constants.hpp"
#include "cube_entrypoint/common/context.hpp"
#include "cube_entrypoint/common/logger.hpp"
#include "cube_entrypoint/system/host.hpp"
#include "cube_entrypoint/system/process.hpp"

namespace cube_entrypoint {
namespace cli {

EntrypointCommand::EntrypointCommand() = default;

void EntrypointCommand::setup(CLI::App* app) {
    app_ = app;
    app->add_option("-c,--config", config_path_,
                    "Configuration file path (default: " +
                    std::string(constants::system::DEFAULT_CONFIG_FILE) + ")");
    app->prefix_command();
    app->footer("Everything from the first non-option argument on is executed as the final command.");
}

std::vector<std::string> EntrypointCommand::command() const {
    if (app_ == nullptr) {
        return {};
    }
    std::vector<std::string> remaining = app_->remaining();
    if (!remaining.empty() && remaining.front() == "--") {
        remaining.erase(remaining.begin());
    }
    return remaining;
}

int EntrypointCommand::execute(int argc, char** argv) {
    // Defaults until the configuration is known, so capture and load can log.
    auto& logger = common::Logger::instance();
    logger.initialize(common::Config::createDefaultConfig().logging);

    auto ctx = common::ExecutionContext::capture(argc, argv);

    common::Config config;
    std::string config_file = common::Config::resolveConfigPath(config_path_, ctx.env);
    if (!config.load(config_file, ctx.env)) {
        logger.error("[Entrypoint] Invalid configuration | path={} | error={}",
                     config_file, config.lastError());
        logger.shutdown();
        return constants::exit_codes::BOOTSTRAP_FAILED;
    }

    logger.reconfigure(config.global().logging);
    logger.debug("[Entrypoint] Starting | version={} | uid={} | gid={} | cwd={} | config={} | level={}",
                 constants::version::getFullVersion(), ctx.uid, ctx.gid, ctx.cwd, config_file,
                 common::to_string(config.global().logging.level));

    system::PosixHostSystem host;
    bootstrap::BootstrapSequencer sequencer(config.global(), host);

    auto outcome = sequencer.run(ctx, command());
    if (outcome.failed()) {
        logger.error("[Entrypoint] Bootstrap failed | code={}",
                     core::BootstrapErrorCodeHelper::toString(outcome.result.code));
        logger.flush();
        return constants::exit_codes::BOOTSTRAP_FAILED;
    }

    int exit_code = system::ProcessExecutor::perform(outcome.handoff);
    logger.shutdown();
    return exit_code;
}

}}
