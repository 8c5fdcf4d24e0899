#pragma once

#include <string>
#include <vector>

namespace toolshed {

// ============================================================================
// Known Tools
// ============================================================================
//
// Everything that varies per tool (category, executable names, launch
// arguments, offline overrides) comes from one closed table. Unknown ids
// get the Unknown profile.

enum class ToolKind {
    Godot,
    Blender,
    Krita,
    Aseprite,
    Gimp,
    Inkscape,
    Audacity,
    Lmms,
    Unknown
};

enum class ArgumentStyle {
    None,
    ProjectPathFlag     // --path <project_dir>
};

enum class OfflineOverride {
    EnvironmentOnly,
    LaunchFlag,         // environment plus extra_offline_args
    ProjectConfig       // environment plus forced-offline project config
};

struct ToolProfile {
    ToolKind kind = ToolKind::Unknown;
    const char* id = "";
    const char* category = "Unknown";
    std::vector<std::string> executable_names;   // exact file names
    std::vector<std::string> executable_prefixes; // e.g. "Godot_v"
    ArgumentStyle arguments = ArgumentStyle::None;
    OfflineOverride offline = OfflineOverride::EnvironmentOnly;
    std::vector<std::string> extra_offline_args;
};

// Case-insensitive lookup; unknown ids return the Unknown profile.
const ToolProfile& tool_profile(const std::string& tool_id);

// Category used when a mirror entry does not declare one.
std::string default_category(const std::string& tool_id);

// Launch arguments. Depends only on (tool id, project directory).
std::vector<std::string> build_launch_arguments(const std::string& tool_id,
                                                const std::string& project_dir);

} // namespace toolshed
