#pragma once

#include <CLI/CLI.hpp>
#include <string>
#include <vector>

namespace cube_entrypoint {
namespace cli {

class EntrypointCommand {
public:
    EntrypointCommand();

    void setup(CLI::App* app);
    int execute(int argc, char** argv);

    // Everything from the first positional argument on, without a leading "--".
    std::vector<std::string> command() const;
    const std::string& configPath() const { return config_path_; }

private:
    CLI::App* app_ = nullptr;
    std::string config_path_;
};

}}
