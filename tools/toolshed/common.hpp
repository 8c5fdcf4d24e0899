/**
 * toolshed CLI - Common utilities and types
 */

#pragma once

#include <toolshed/library.hpp>
#include <toolshed/offline.hpp>
#include <toolshed/project.hpp>
#include <toolshed/types.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <optional>
#include <string>

namespace toolshed::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string library;           // --library
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route log output to stderr so --json output on stdout stays parseable.
 */
inline void configure_logging(const GlobalOptions& opts) {
    static bool installed = false;
    if (!installed) {
        spdlog::set_default_logger(spdlog::stderr_color_mt("toolshed"));
        spdlog::set_pattern("%^%l%$: %v");
        installed = true;
    }

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Library for this invocation.
 * Priority: --library flag > platform default
 */
inline LibraryManager open_library(const GlobalOptions& opts) {
    if (!opts.library.empty()) {
        return LibraryManager(opts.library);
    }
    return LibraryManager::with_default_root();
}

/**
 * Initialize the offline gate from a project config (when a project is
 * given) and the --offline flag. Without either the gate is Disabled.
 */
inline bool init_offline_gate(const std::optional<std::string>& project_dir, bool force_offline,
                              std::string& error) {
    OfflineConfig config;
    if (project_dir) {
        auto loaded = load_offline_config(*project_dir);
        if (loaded.isErr()) {
            error = loaded.error().toString();
            return false;
        }
        if (loaded.value()) {
            config = *loaded.value();
        }
    }
    if (force_offline) {
        config.force_offline = true;
    }
    OfflineEnforcer::instance().apply(config);
    return true;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_success(const std::string& msg, const GlobalOptions& opts) {
    if (!opts.json && !opts.quiet) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline nlohmann::json refs_to_json(const std::vector<ToolReference>& refs) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& ref : refs) {
        out.push_back(ref.to_string());
    }
    return out;
}

} // namespace toolshed::cli
