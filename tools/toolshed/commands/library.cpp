/**
 * toolshed CLI - list, info and remove commands
 */

#include "../common.hpp"
#include <toolshed/tool_profiles.hpp>
#include <CLI/CLI.hpp>

namespace toolshed::cli::commands {

namespace {

struct ListOptions {
    std::string id;
};

struct TargetOptions {
    std::string target;
};

bool parse_target_or_report(const std::string& target, ToolReference& ref, bool json) {
    auto parsed = parse_tool_reference(target);
    if (!parsed) {
        print_error("Expected <id>@<version>, got: " + target, json);
        return false;
    }
    ref = *parsed;
    return true;
}

int cmd_list(const GlobalOptions& opts, const ListOptions& list_opts) {
    configure_logging(opts);

    auto library = open_library(opts);
    if (!library.resolved()) {
        print_error("Library root could not be resolved; pass --library", opts.json);
        return 1;
    }

    std::vector<std::string> ids;
    if (list_opts.id.empty()) {
        ids = library.list_tools();
    } else {
        ids.push_back(list_opts.id);
    }

    nlohmann::json result;
    result["root"] = library.root();
    result["tools"] = nlohmann::json::array();
    for (const auto& id : ids) {
        for (const auto& version : library.list_versions(id)) {
            nlohmann::json info;
            info["id"] = id;
            info["version"] = version;
            info["category"] = default_category(id);
            result["tools"].push_back(info);
        }
    }

    if (opts.json) {
        output_json(result);
        return 0;
    }

    if (result["tools"].empty()) {
        std::cout << "No tools installed in " << library.root() << "." << std::endl;
        return 0;
    }
    for (const auto& tool : result["tools"]) {
        std::cout << "  " << tool["id"].get<std::string>() << "@" << tool["version"].get<std::string>()
                  << " (" << tool["category"].get<std::string>() << ")" << std::endl;
    }
    return 0;
}

int cmd_info(const GlobalOptions& opts, const TargetOptions& target_opts) {
    configure_logging(opts);

    ToolReference ref;
    if (!parse_target_or_report(target_opts.target, ref, opts.json)) {
        return 1;
    }

    auto library = open_library(opts);
    auto meta = library.tool_metadata(ref.id, ref.version);
    if (!meta.exists) {
        print_error("Tool not installed: " + ref.to_string(), opts.json);
        return 1;
    }

    nlohmann::json result;
    result["id"] = ref.id;
    result["version"] = ref.version;
    result["path"] = meta.path;
    result["size_bytes"] = meta.size_bytes;
    result["last_modified"] = meta.last_modified;

    auto record = library.read_install_record(ref);
    if (record.isOk()) {
        result["source"] = record.value().provenance.source;
        result["sha256"] = record.value().provenance.sha256;
        result["installed_at"] = record.value().provenance.installed_at;
        result["mirror_name"] = record.value().provenance.mirror_name;
    } else {
        spdlog::debug("no install record for {}: {}", ref.to_string(), record.error().toString());
    }

    if (opts.json) {
        output_json(result);
        return 0;
    }

    std::cout << ref.to_string() << std::endl;
    for (auto it = result.begin(); it != result.end(); ++it) {
        if (it.key() == "id" || it.key() == "version") continue;
        std::cout << "  " << it.key() << ": "
                  << (it->is_string() ? it->get<std::string>() : it->dump()) << std::endl;
    }
    return 0;
}

int cmd_remove(const GlobalOptions& opts, const TargetOptions& target_opts) {
    configure_logging(opts);

    ToolReference ref;
    if (!parse_target_or_report(target_opts.target, ref, opts.json)) {
        return 1;
    }

    auto removed = open_library(opts).remove_tool(ref);
    if (removed.isErr()) {
        print_error(removed.error().toString(), opts.json);
        return 1;
    }

    if (opts.json) {
        output_json({{"ok", true}, {"removed", ref.to_string()}});
    } else {
        print_success("Removed " + ref.to_string(), opts);
    }
    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    static ListOptions list_opts;

    app->add_option("id", list_opts.id, "Only list versions of this tool");

    app->callback([&opts]() {
        std::exit(cmd_list(opts, list_opts));
    });
}

void setup_info(CLI::App* app, GlobalOptions& opts) {
    static TargetOptions info_opts;

    app->add_option("target", info_opts.target, "Tool reference (id@version)")->required();

    app->callback([&opts]() {
        std::exit(cmd_info(opts, info_opts));
    });
}

void setup_remove(CLI::App* app, GlobalOptions& opts) {
    static TargetOptions remove_opts;

    app->add_option("target", remove_opts.target, "Tool reference (id@version)")->required();

    app->callback([&opts]() {
        std::exit(cmd_remove(opts, remove_opts));
    });
}

} // namespace toolshed::cli::commands
