#pragma once

#include "../common/context.hpp"
#include "../core/error_codes.hpp"
#include "../system/host.hpp"
#include <string>

namespace cube_entrypoint {
namespace bootstrap {

// Writes the datacube integration-test settings into the runner's home.
class IntegrationConfigWriter {
public:
    static std::string render();

    // Replaces the file; never merges with an existing one.
    static core::StepResult write(const std::string& home_dir);

    static std::string resolveHome(const common::ExecutionContext& ctx, system::HostSystem& host);
    static std::string targetPath(const std::string& home_dir);
};

}}
