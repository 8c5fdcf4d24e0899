/**
 * toolshed CLI - hydrate command
 *
 * Install tools from a local or remote mirror into the library.
 */

#include "../common.hpp"
#include <toolshed/hydrator.hpp>
#include <CLI/CLI.hpp>

#include <chrono>
#include <memory>
#include <thread>

namespace toolshed::cli::commands {

namespace {

struct HydrateOptions {
    std::string mirror;
    std::vector<std::string> targets;
    std::string project;
    bool remote = false;
    bool offline = false;
    bool all = false;
};

int cmd_hydrate(const GlobalOptions& opts, const HydrateOptions& hydrate_opts) {
    configure_logging(opts);

    auto library = open_library(opts);
    if (!library.resolved()) {
        print_error("Library root could not be resolved; pass --library", opts.json);
        return 1;
    }

    std::string gate_error;
    std::optional<std::string> project;
    if (!hydrate_opts.project.empty()) project = hydrate_opts.project;
    if (!init_offline_gate(project, hydrate_opts.offline, gate_error)) {
        print_error(gate_error, opts.json);
        return 1;
    }

    std::vector<ToolReference> refs;
    for (const auto& target : hydrate_opts.targets) {
        auto ref = parse_tool_reference(target);
        if (!ref) {
            print_error("Expected <id>@<version>, got: " + target, opts.json);
            return 1;
        }
        refs.push_back(*ref);
    }

    if (hydrate_opts.all) {
        auto loaded = load_mirror_manifest(hydrate_opts.mirror);
        if (!loaded.ok) {
            print_error("Mirror manifest rejected: " + loaded.error, opts.json);
            return 1;
        }
        for (const auto& entry : loaded.manifest.tools) {
            refs.push_back(entry.ref());
        }
    }

    if (refs.empty()) {
        print_error("Nothing to hydrate: name tools as <id>@<version> or pass --all", opts.json);
        return 1;
    }

    std::unique_ptr<MirrorHydrator> hydrator;
    if (hydrate_opts.remote) {
        hydrator = std::make_unique<RemoteMirrorHydrator>(library, hydrate_opts.mirror);
    } else {
        hydrator = std::make_unique<MirrorHydrator>(library, hydrate_opts.mirror);
    }

    // Background run with events drained on this thread
    HydrationEvents events;
    if (!opts.json && !opts.quiet) {
        events.on_install_started = [](const ToolReference& ref) {
            std::cout << "Installing " << ref.to_string() << "..." << std::endl;
        };
        events.on_install_completed = [](const ToolReference& ref, bool ok, const std::string& message) {
            std::cout << (ok ? "  ok    " : "  FAIL  ") << ref.to_string() << ": " << message << std::endl;
        };
    }
    if (opts.verbose && !opts.json) {
        events.on_install_progress = [](const ToolReference& ref, uint64_t done, uint64_t total) {
            if (total > 0) {
                std::cout << "  " << ref.to_string() << " " << (done * 100 / total) << "%" << std::endl;
            }
        };
    }

    if (hydrator->hydrate_async(refs, events) != AsyncStartStatus::Started) {
        print_error("A hydration is already running", opts.json);
        return 1;
    }
    while (hydrator->is_running()) {
        hydrator->poll_events();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    hydrator->wait();
    hydrator->poll_events();

    HydrationReport report = hydrator->last_report();

    if (opts.json) {
        nlohmann::json result;
        result["ok"] = report.success();
        result["installed_count"] = report.installed_count;
        result["failed_count"] = report.failed_count;
        result["failed_tools"] = refs_to_json(report.failed_tools);
        result["outcomes"] = nlohmann::json::array();
        for (const auto& outcome : report.outcomes) {
            result["outcomes"].push_back({{"tool", outcome.ref.to_string()},
                                          {"success", outcome.success},
                                          {"message", outcome.message}});
        }
        output_json(result);
    } else {
        print_success(std::to_string(report.installed_count) + " installed, " +
                          std::to_string(report.failed_count) + " failed",
                      opts);
    }

    return report.success() ? 0 : 1;
}

} // anonymous namespace

void setup_hydrate(CLI::App* app, GlobalOptions& opts) {
    static HydrateOptions hydrate_opts;

    app->add_option("--mirror", hydrate_opts.mirror, "Path to the mirror manifest")->required();
    app->add_option("targets", hydrate_opts.targets, "Tools to install (id@version)");
    app->add_flag("--all", hydrate_opts.all, "Install every tool the mirror lists");
    app->add_flag("--remote", hydrate_opts.remote, "Allow downloading archive_url entries");
    app->add_option("--project", hydrate_opts.project, "Read offline flags from this project");
    app->add_flag("--offline", hydrate_opts.offline, "Treat the session as force-offline");

    app->callback([&opts]() {
        std::exit(cmd_hydrate(opts, hydrate_opts));
    });
}

} // namespace toolshed::cli::commands
