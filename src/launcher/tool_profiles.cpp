#include "toolshed/tool_profiles.hpp"

#include <algorithm>
#include <cctype>

namespace toolshed {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::vector<ToolProfile>& profile_table() {
    static const std::vector<ToolProfile> table = {
        {ToolKind::Godot, "godot", "Engine",
         {"godot", "godot.exe", "godot.x86_64", "godot.app"},
         {"godot_v"},
         ArgumentStyle::ProjectPathFlag, OfflineOverride::ProjectConfig, {}},
        {ToolKind::Blender, "blender", "3D",
         {"blender", "blender.exe"},
         {},
         ArgumentStyle::None, OfflineOverride::LaunchFlag, {"--offline-mode"}},
        {ToolKind::Krita, "krita", "2D",
         {"krita", "krita.exe"},
         {"krita-"},
         ArgumentStyle::None, OfflineOverride::EnvironmentOnly, {}},
        {ToolKind::Aseprite, "aseprite", "2D",
         {"aseprite", "aseprite.exe"},
         {},
         ArgumentStyle::None, OfflineOverride::EnvironmentOnly, {}},
        {ToolKind::Gimp, "gimp", "2D",
         {"gimp", "gimp.exe"},
         {"gimp-"},
         ArgumentStyle::None, OfflineOverride::EnvironmentOnly, {}},
        {ToolKind::Inkscape, "inkscape", "2D",
         {"inkscape", "inkscape.exe"},
         {"inkscape-"},
         ArgumentStyle::None, OfflineOverride::EnvironmentOnly, {}},
        {ToolKind::Audacity, "audacity", "Audio",
         {"audacity", "audacity.exe"},
         {"audacity-"},
         ArgumentStyle::None, OfflineOverride::EnvironmentOnly, {}},
        {ToolKind::Lmms, "lmms", "Audio",
         {"lmms", "lmms.exe"},
         {"lmms-"},
         ArgumentStyle::None, OfflineOverride::EnvironmentOnly, {}},
    };
    return table;
}

} // namespace

const ToolProfile& tool_profile(const std::string& tool_id) {
    static const ToolProfile unknown{};
    std::string key = to_lower(tool_id);
    for (const auto& profile : profile_table()) {
        if (key == profile.id) {
            return profile;
        }
    }
    return unknown;
}

std::string default_category(const std::string& tool_id) {
    return tool_profile(tool_id).category;
}

std::vector<std::string> build_launch_arguments(const std::string& tool_id,
                                                const std::string& project_dir) {
    switch (tool_profile(tool_id).arguments) {
        case ArgumentStyle::ProjectPathFlag:
            return {"--path", project_dir};
        case ArgumentStyle::None:
        default:
            return {};
    }
}

} // namespace toolshed
