#pragma once

#include "../common/config.hpp"
#include "../core/error_codes.hpp"
#include "../system/host.hpp"
#include <string>
#include <optional>
#include <vector>

namespace cube_entrypoint {
namespace bootstrap {

class DatabaseStarter {
public:
    explicit DatabaseStarter(system::HostSystem& host);

    // Single attempt, no retries. Any failure is reported as one warning and
    // never stops the caller.
    core::StepResult start(const common::DatabaseConfig& config);

    bool isInitialized(const std::string& data_dir) const;
    std::string resolveBinDir(const std::string& configured) const;

    static std::string findLatestInstall(const std::string& install_root);
    // "9.10" -> {9, 10}; nullopt for anything that is not dotted digits.
    static std::optional<std::vector<unsigned long>> parseVersion(const std::string& name);

private:
    system::HostSystem& host_;

    core::StepResult runStep(const std::vector<std::string>& argv,
                             const common::Account& service_account,
                             core::BootstrapErrorCode on_failure);
    std::string tool(const std::string& bin_dir, const std::string& name) const;
};

}}
