#include "cube_entrypoint/bootstrap/environment.hpp"
#include "cube_entrypoint/common/constants.hpp"
#include "cube_entrypoint/common/logger.hpp"
#include <filesystem>

namespace cube_entrypoint {
namespace bootstrap {

using common::Logger;
using core::BootstrapErrorCode;
using core::StepResult;

namespace {

std::string trimOutput(std::string value) {
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r' ||
                              value.back() == ' ' || value.back() == '\t')) {
        value.pop_back();
    }
    auto nl = value.rfind('\n');
    if (nl != std::string::npos) {
        value = value.substr(nl + 1);
    }
    return value;
}

std::string envBin(const std::string& root, const std::string& tool) {
    return (std::filesystem::path(root) / "bin" / tool).string();
}

}

EnvironmentActivator::EnvironmentActivator(system::HostSystem& host) : host_(host) {}

bool EnvironmentActivator::hasActivationMarker(const std::string& root) {
    std::error_code ec;
    return std::filesystem::exists(
        std::filesystem::path(root) / constants::environment::ACTIVATION_MARKER, ec);
}

common::Environment EnvironmentActivator::applyActivation(const std::string& root,
                                                          const common::Environment& env) {
    namespace ev = constants::env_vars;

    common::Environment activated = env;
    activated[ev::VIRTUAL_ENV] = root;

    const std::string bin = (std::filesystem::path(root) / "bin").string();
    auto path = common::lookupEnv(env, ev::PATH);
    activated[ev::PATH] = path ? bin + ":" + *path : bin;

    activated.erase(ev::PYTHONHOME);
    return activated;
}

std::string EnvironmentActivator::editableTarget(const std::vector<std::string>& extras) {
    if (extras.empty()) {
        return ".";
    }
    std::string target = ".[";
    for (size_t i = 0; i < extras.size(); ++i) {
        if (i > 0) target += ",";
        target += extras[i];
    }
    target += "]";
    return target;
}

StepResult EnvironmentActivator::pipInstall(const common::EnvironmentConfig& config,
                                            const common::Environment& env,
                                            const std::string& target) {
    system::CommandSpec spec;
    spec.argv = {envBin(config.root, "pip"), "install", "-e", target};
    spec.env = env;

    Logger::instance().info("[Environment] Installing | target={}", target);
    auto result = host_.run(spec);
    if (!result.succeeded()) {
        Logger::instance().debug("[Environment] Install failed | target={} | exit_code={}",
                                target, result.exit_code);
        return StepResult::failure(BootstrapErrorCode::DEPENDENCY_INSTALL_FAILED, target);
    }
    return StepResult::success();
}

StepResult EnvironmentActivator::installDependencies(const common::EnvironmentConfig& config,
                                                     const common::Environment& env,
                                                     const std::string& cwd) {
    std::error_code ec;
    const std::filesystem::path base(cwd);
    StepResult first_failure = StepResult::success();

    if (std::filesystem::exists(base / constants::environment::MANIFEST, ec)) {
        first_failure = pipInstall(config, env, editableTarget(config.extras));
    } else {
        Logger::instance().debug("[Environment] No manifest | cwd={}", cwd);
    }

    if (!config.driver_manifest.empty() &&
        std::filesystem::exists(base / config.driver_manifest, ec)) {
        auto installed = pipInstall(config, env, config.driver_manifest);
        if (first_failure.ok()) {
            first_failure = installed;
        }
    }

    return first_failure;
}

std::optional<std::string> EnvironmentActivator::probeRasterio(const common::EnvironmentConfig& config,
                                                               const common::Environment& env) {
    system::CommandSpec spec;
    spec.argv = {envBin(config.root, "python"), "-c", constants::environment::RASTERIO_LOCATOR};
    spec.env = env;
    spec.capture_output = true;

    auto result = host_.run(spec);
    if (!result.succeeded()) {
        Logger::instance().debug("[Environment] rasterio probe failed | exit_code={}", result.exit_code);
        return std::nullopt;
    }

    std::string package_dir = trimOutput(result.output);
    if (package_dir.empty()) {
        return std::nullopt;
    }

    auto candidate = std::filesystem::path(package_dir) / constants::environment::GDAL_DATA_DIRNAME;
    std::error_code ec;
    if (!std::filesystem::is_directory(candidate, ec)) {
        Logger::instance().debug("[Environment] rasterio has no bundled gdal_data | dir={}", package_dir);
        return std::nullopt;
    }
    return candidate.string();
}

std::optional<std::string> EnvironmentActivator::probeGdalConfig(const common::Environment& env) {
    system::CommandSpec spec;
    spec.argv = {constants::environment::GDAL_CONFIG, "--datadir"};
    spec.env = env;
    spec.capture_output = true;

    auto result = host_.run(spec);
    if (!result.succeeded()) {
        Logger::instance().debug("[Environment] gdal-config probe failed | exit_code={}", result.exit_code);
        return std::nullopt;
    }

    std::string datadir = trimOutput(result.output);
    if (datadir.empty()) {
        return std::nullopt;
    }
    return datadir;
}

std::optional<std::string> EnvironmentActivator::resolveGdalData(const common::EnvironmentConfig& config,
                                                                 const common::Environment& env) {
    if (auto preset = common::lookupEnv(env, constants::env_vars::GDAL_DATA)) {
        return preset;
    }

    if (auto bundled = probeRasterio(config, env)) {
        return bundled;
    }

    return probeGdalConfig(env);
}

Activation EnvironmentActivator::activate(const common::EnvironmentConfig& config,
                                          const common::Environment& env,
                                          const std::string& cwd) {
    Activation activation;
    activation.env = env;
    activation.result = StepResult::success();

    if (!hasActivationMarker(config.root)) {
        Logger::instance().debug("[Environment] No environment | root={}", config.root);
        return activation;
    }

    if (common::lookupEnv(env, constants::env_vars::VIRTUAL_ENV)) {
        Logger::instance().debug("[Environment] Already active | root={}", config.root);
        return activation;
    }

    activation.env = applyActivation(config.root, env);
    activation.activated = true;
    Logger::instance().info("[Environment] Activated | root={}", config.root);

    activation.result = installDependencies(config, activation.env, cwd);

    activation.gdal_data = resolveGdalData(config, activation.env);
    if (activation.gdal_data) {
        activation.env[constants::env_vars::GDAL_DATA] = *activation.gdal_data;
        Logger::instance().info("[Environment] GDAL data | path={}", *activation.gdal_data);
    } else {
        Logger::instance().debug("[Environment] {}",
                                core::BootstrapErrorCodeHelper::getMessage(BootstrapErrorCode::GDAL_DATA_UNRESOLVED));
    }

    return activation;
}

}}
