#pragma once

#include "../common/config.hpp"
#include "../core/error_codes.hpp"
#include "../system/host.hpp"
#include <string>
#include <vector>
#include <optional>

namespace cube_entrypoint {
namespace bootstrap {

struct Activation {
    bool activated = false;
    common::Environment env;
    core::StepResult result;
    std::optional<std::string> gdal_data;
};

class EnvironmentActivator {
public:
    explicit EnvironmentActivator(system::HostSystem& host);

    // Installs and GDAL resolution only happen on a fresh activation; an
    // already active environment (VIRTUAL_ENV set) is left untouched. A failed
    // install is reported in the result but the activated env is complete.
    Activation activate(const common::EnvironmentConfig& config,
                        const common::Environment& env,
                        const std::string& cwd);

    core::StepResult installDependencies(const common::EnvironmentConfig& config,
                                         const common::Environment& env,
                                         const std::string& cwd);

    std::optional<std::string> resolveGdalData(const common::EnvironmentConfig& config,
                                               const common::Environment& env);

    static bool hasActivationMarker(const std::string& root);
    static common::Environment applyActivation(const std::string& root, const common::Environment& env);
    static std::string editableTarget(const std::vector<std::string>& extras);

private:
    system::HostSystem& host_;

    std::optional<std::string> probeRasterio(const common::EnvironmentConfig& config,
                                             const common::Environment& env);
    std::optional<std::string> probeGdalConfig(const common::Environment& env);
    core::StepResult pipInstall(const common::EnvironmentConfig& config,
                                const common::Environment& env,
                                const std::string& target);
};

}}
