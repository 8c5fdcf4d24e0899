/**
 * toolshed CLI - Entry Point
 *
 * Tool library, mirror hydration, launching and project sealing.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace toolshed::cli::commands {
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_info(CLI::App* app, GlobalOptions& opts);
    void setup_remove(CLI::App* app, GlobalOptions& opts);
    void setup_hydrate(CLI::App* app, GlobalOptions& opts);
    void setup_mirror(CLI::App* app, GlobalOptions& opts);
    void setup_launch(CLI::App* app, GlobalOptions& opts);
    void setup_seal(CLI::App* app, GlobalOptions& opts);
    void setup_offline(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace toolshed::cli;

    CLI::App app{"toolshed - versioned tool library and project sealer"};
    app.set_version_flag("-V,--version", TOOLSHED_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--library", opts.library, "Library root (default: platform data directory)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    commands::setup_list(app.add_subcommand("list", "List library tools"), opts);
    commands::setup_info(app.add_subcommand("info", "Show one library entry"), opts);
    commands::setup_remove(app.add_subcommand("remove", "Remove a library entry"), opts);
    commands::setup_hydrate(app.add_subcommand("hydrate", "Install tools from a mirror"), opts);
    commands::setup_mirror(app.add_subcommand("mirror", "Inspect mirror manifests"), opts);
    commands::setup_launch(app.add_subcommand("launch", "Launch a project's tool"), opts);
    commands::setup_seal(app.add_subcommand("seal", "Seal a project into an offline archive"), opts);
    commands::setup_offline(app.add_subcommand("offline", "Show a project's offline state"), opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
