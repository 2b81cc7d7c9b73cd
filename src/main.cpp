#include <CLI/CLI.hpp>
#include <iostream>

#include "cube_entrypoint/common/constants.hpp"
#include "cli/entrypoint_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{"Container bootstrap: database, runner identity, environment, then exec",
                     cube_entrypoint::constants::system::APPLICATION_NAME};
        app.set_version_flag("--version", cube_entrypoint::constants::version::getFullVersion());

        cube_entrypoint::cli::EntrypointCommand entrypoint;
        entrypoint.setup(&app);

        CLI11_PARSE(app, argc, argv);

        return entrypoint.execute(argc, argv);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return cube_entrypoint::constants::exit_codes::BOOTSTRAP_FAILED;
    }
}
