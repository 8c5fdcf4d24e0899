/**
 * toolshed CLI - offline command
 *
 * Report the offline state a project's config produces.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace toolshed::cli::commands {

namespace {

struct OfflineOptions {
    std::string project = ".";
    bool force = false;
};

int cmd_offline(const GlobalOptions& opts, const OfflineOptions& offline_opts) {
    configure_logging(opts);

    if (offline_opts.force) {
        auto written = write_offline_config(offline_opts.project);
        if (written.isErr()) {
            print_error(written.error().toString(), opts.json);
            return 1;
        }
    }

    auto config = load_offline_config(offline_opts.project);
    if (config.isErr()) {
        print_error(config.error().toString(), opts.json);
        return 1;
    }

    const OfflineConfig* raw = config.value() ? &*config.value() : nullptr;
    OfflineEnforcer::instance().apply(raw);
    OfflineState state = OfflineEnforcer::instance().state();

    if (opts.json) {
        output_json({{"offline", state.active}, {"reason", offline_reason_to_string(state.reason)}});
    } else {
        print_success(std::string(state.active ? "offline" : "online") + " (" +
                          offline_reason_to_string(state.reason) + ")",
                      opts);
    }
    return 0;
}

} // anonymous namespace

void setup_offline(CLI::App* app, GlobalOptions& opts) {
    static OfflineOptions offline_opts;

    app->add_option("project", offline_opts.project, "Project directory (default: current)");
    app->add_flag("--force", offline_opts.force, "Write forced-offline flags into the project config");

    app->callback([&opts]() {
        std::exit(cmd_offline(opts, offline_opts));
    });
}

} // namespace toolshed::cli::commands
