/**
 * toolshed CLI - mirror command
 *
 * mirror validate <manifest>   collect every schema violation
 * mirror list <manifest>       show the tools a mirror offers
 */

#include "../common.hpp"
#include <toolshed/mirror_manifest.hpp>
#include <CLI/CLI.hpp>

namespace toolshed::cli::commands {

namespace {

struct MirrorOptions {
    std::string manifest;
};

int cmd_mirror_validate(const GlobalOptions& opts, const MirrorOptions& mirror_opts) {
    configure_logging(opts);

    auto loaded = load_mirror_manifest(mirror_opts.manifest);

    if (opts.json) {
        nlohmann::json result;
        result["ok"] = loaded.ok;
        result["errors"] = loaded.errors;
        if (!loaded.ok && loaded.errors.empty()) {
            result["error"] = loaded.error;
        }
        output_json(result);
    } else if (loaded.ok) {
        print_success("Mirror '" + loaded.manifest.mirror_name + "' is valid (" +
                          std::to_string(loaded.manifest.tools.size()) + " tools)",
                      opts);
    } else if (loaded.errors.empty()) {
        print_error(loaded.error, false);
    } else {
        std::cerr << "Mirror manifest is invalid:" << std::endl;
        for (const auto& code : loaded.errors) {
            std::cerr << "  " << code << std::endl;
        }
    }

    return loaded.ok ? 0 : 1;
}

int cmd_mirror_list(const GlobalOptions& opts, const MirrorOptions& mirror_opts) {
    configure_logging(opts);

    auto loaded = load_mirror_manifest(mirror_opts.manifest);
    if (!loaded.ok) {
        print_error("Mirror manifest rejected: " + loaded.error, opts.json);
        return 1;
    }

    nlohmann::json tools = nlohmann::json::array();
    for (const auto& entry : loaded.manifest.tools) {
        nlohmann::json info;
        info["id"] = entry.id;
        info["version"] = entry.version;
        info["category"] = entry.category;
        info["source"] = entry.is_remote() ? *entry.archive_url : *entry.archive_path;
        info["sha256"] = entry.sha256;
        if (entry.size_bytes) info["size_bytes"] = *entry.size_bytes;
        tools.push_back(info);
    }

    if (opts.json) {
        output_json({{"mirror_name", loaded.manifest.mirror_name}, {"tools", tools}});
        return 0;
    }

    std::cout << loaded.manifest.mirror_name << ":" << std::endl;
    for (const auto& tool : tools) {
        std::cout << "  " << tool["id"].get<std::string>() << "@" << tool["version"].get<std::string>()
                  << " [" << tool["category"].get<std::string>() << "] "
                  << tool["source"].get<std::string>() << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_mirror(CLI::App* app, GlobalOptions& opts) {
    static MirrorOptions validate_opts;
    static MirrorOptions list_opts;

    app->require_subcommand(1);

    auto* validate_cmd = app->add_subcommand("validate", "Check a mirror manifest");
    validate_cmd->add_option("manifest", validate_opts.manifest, "Mirror manifest path")->required();
    validate_cmd->callback([&opts]() {
        std::exit(cmd_mirror_validate(opts, validate_opts));
    });

    auto* list_cmd = app->add_subcommand("list", "List the tools a mirror offers");
    list_cmd->add_option("manifest", list_opts.manifest, "Mirror manifest path")->required();
    list_cmd->callback([&opts]() {
        std::exit(cmd_mirror_list(opts, list_opts));
    });
}

} // namespace toolshed::cli::commands
