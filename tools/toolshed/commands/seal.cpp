/**
 * toolshed CLI - seal command
 *
 * Embed a project's tools, force it offline and archive it.
 */

#include "../common.hpp"
#include <toolshed/sealer.hpp>
#include <spdlog/fmt/fmt.h>
#include <CLI/CLI.hpp>

namespace toolshed::cli::commands {

namespace {

struct SealCommandOptions {
    std::string project = ".";
    std::string output_dir;
    bool validate_only = false;
};

int cmd_seal(const GlobalOptions& opts, const SealCommandOptions& seal_opts) {
    configure_logging(opts);

    ProjectSealer sealer(open_library(opts));

    if (seal_opts.validate_only) {
        auto validation = sealer.validate(seal_opts.project);
        if (opts.json) {
            output_json({{"ok", validation.ok}, {"errors", validation.errors}});
        } else if (validation.ok) {
            print_success("Project is ready to seal (" + std::to_string(validation.manifest.tools.size()) +
                              " tools)",
                          opts);
        } else {
            for (const auto& error : validation.errors) {
                print_error(error, false);
            }
        }
        return validation.ok ? 0 : 1;
    }

    SealOptions options;
    options.output_dir = seal_opts.output_dir;
    auto result = sealer.seal(seal_opts.project, options);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.success;
        j["sealed_archive_path"] = result.sealed_archive_path;
        j["size_mb"] = result.size_mb;
        j["tools_copied"] = result.tools_copied;
        j["errors"] = result.errors;
        output_json(j);
    } else if (result.success) {
        print_success("Sealed " + result.sealed_archive_path + " (" +
                          fmt::format("{:.2f}", result.size_mb) + " MB)",
                      opts);
    } else {
        for (const auto& error : result.errors) {
            print_error(error, false);
        }
    }

    return result.success ? 0 : 1;
}

} // anonymous namespace

void setup_seal(CLI::App* app, GlobalOptions& opts) {
    static SealCommandOptions seal_opts;

    app->add_option("project", seal_opts.project, "Project directory (default: current)");
    app->add_option("-o,--output-dir", seal_opts.output_dir, "Where to write the archive (default: project parent)");
    app->add_flag("--validate-only", seal_opts.validate_only, "Only run the validation phase");

    app->callback([&opts]() {
        std::exit(cmd_seal(opts, seal_opts));
    });
}

} // namespace toolshed::cli::commands
