#pragma once

#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace toolshed {

// ============================================================================
// Tool Identity
// ============================================================================

// Identity key for every library, mirror and launch lookup.
struct ToolReference {
    std::string id;
    std::string version;

    std::string to_string() const { return id + "@" + version; }

    bool operator==(const ToolReference& other) const {
        return id == other.id && version == other.version;
    }
    bool operator!=(const ToolReference& other) const { return !(*this == other); }
    bool operator<(const ToolReference& other) const {
        return std::tie(id, version) < std::tie(other.id, other.version);
    }
};

// Parse "id@version". Returns nullopt when either half is empty.
std::optional<ToolReference> parse_tool_reference(const std::string& text);

// ============================================================================
// Project Tool Entry
// ============================================================================

// A tool as referenced by a project manifest. The optional path is relative
// to the project directory; the optional sha256 pins the executable.
struct ProjectToolEntry {
    std::string id;
    std::string version;
    std::optional<std::string> path;
    std::optional<std::string> sha256;

    ToolReference ref() const { return {id, version}; }
};

// ============================================================================
// Offline Configuration
// ============================================================================

// Offline flags as found in a project config. Unset flags count as false.
struct OfflineConfig {
    std::optional<bool> offline_mode;
    std::optional<bool> force_offline;
};

} // namespace toolshed
