#pragma once

#include "toolshed/result.hpp"
#include "toolshed/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace toolshed {

// ============================================================================
// Project Files
// ============================================================================
//
//   <project>/toolshed.json            project manifest (name, tools[])
//   <project>/.toolshed/config.json    project config (offline flags, ...)
//   <project>/tools/<id>_<version>/    tools embedded by sealing

constexpr const char* PROJECT_MANIFEST_FILE = "toolshed.json";
constexpr const char* PROJECT_CONFIG_DIR = ".toolshed";
constexpr const char* PROJECT_CONFIG_FILE = ".toolshed/config.json";
constexpr const char* PROJECT_TOOLS_DIR = "tools";

struct ProjectManifest {
    std::string name;
    std::vector<ProjectToolEntry> tools;
};

std::string project_manifest_path(const std::string& project_dir);
std::string project_config_path(const std::string& project_dir);

// Directory name of an embedded tool: "<id>_<version>"
std::string embedded_tool_dirname(const ToolReference& ref);
std::string embedded_tool_path(const std::string& project_dir, const ToolReference& ref);

Result<ProjectManifest> parse_project_manifest(const std::string& json_str);
Result<ProjectManifest> load_project_manifest(const std::string& project_dir);

// No config file means no configuration: returns ok(nullopt).
Result<std::optional<OfflineConfig>> load_offline_config(const std::string& project_dir);

// Merge forced-offline flags (force_offline, offline_mode, sealed) into the
// project config, keeping every other key. Writing twice yields
// byte-identical files.
Result<void> write_offline_config(const std::string& project_dir);

} // namespace toolshed
