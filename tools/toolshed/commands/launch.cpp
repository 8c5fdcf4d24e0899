/**
 * toolshed CLI - launch command
 *
 * Launch a tool declared by a project's manifest.
 */

#include "../common.hpp"
#include <toolshed/launcher.hpp>
#include <CLI/CLI.hpp>

namespace toolshed::cli::commands {

namespace {

struct LaunchOptions {
    std::string tool;
    std::string project = ".";
    bool offline = false;
};

int cmd_launch(const GlobalOptions& opts, const LaunchOptions& launch_opts) {
    configure_logging(opts);

    auto manifest = load_project_manifest(launch_opts.project);
    if (manifest.isErr()) {
        print_error(manifest.error().toString(), opts.json);
        return 1;
    }

    // "id" picks the first entry with that id, "id@version" an exact one
    auto wanted = parse_tool_reference(launch_opts.tool);
    const ProjectToolEntry* entry = nullptr;
    for (const auto& candidate : manifest.value().tools) {
        bool match = wanted ? candidate.ref() == *wanted : candidate.id == launch_opts.tool;
        if (match) {
            entry = &candidate;
            break;
        }
    }
    if (!entry) {
        print_error("Project does not declare tool: " + launch_opts.tool, opts.json);
        return 1;
    }

    std::string gate_error;
    if (!init_offline_gate(launch_opts.project, launch_opts.offline, gate_error)) {
        print_error(gate_error, opts.json);
        return 1;
    }

    ToolLauncher launcher(open_library(opts));
    auto result = launcher.launch(*entry, launch_opts.project);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        j["tool"] = entry->ref().to_string();
        if (result.ok) {
            j["pid"] = *result.pid;
            j["executable"] = result.request.executable;
        } else {
            j["error_kind"] = launch_error_to_string(result.error_kind);
            j["error"] = result.error;
        }
        output_json(j);
    } else if (result.ok) {
        print_success("Launched " + entry->ref().to_string() + " (pid " + std::to_string(*result.pid) + ")", opts);
    } else {
        print_error(std::string(launch_error_to_string(result.error_kind)) + ": " + result.error, false);
    }

    return result.ok ? 0 : 1;
}

} // anonymous namespace

void setup_launch(CLI::App* app, GlobalOptions& opts) {
    static LaunchOptions launch_opts;

    app->add_option("tool", launch_opts.tool, "Tool id or id@version from the project manifest")->required();
    app->add_option("--project", launch_opts.project, "Project directory (default: current)");
    app->add_flag("--offline", launch_opts.offline, "Apply offline overrides");

    app->callback([&opts]() {
        std::exit(cmd_launch(opts, launch_opts));
    });
}

} // namespace toolshed::cli::commands
