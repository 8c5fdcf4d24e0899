#pragma once

/**
 * @file launcher.hpp
 * @brief Starts a project's tool from an explicit path, the project's
 *        embedded tools, or the library
 */

#include "toolshed/library.hpp"
#include "toolshed/process.hpp"
#include "toolshed/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace toolshed {

enum class LaunchErrorKind {
    None,
    InvalidPath,
    PathTraversal,
    ToolNotInstalled,
    ExecutableNotFound,
    HashInvalid,
    HashMismatch,
    OfflineOverrideFailed,
    SpawnFailed
};

inline const char* launch_error_to_string(LaunchErrorKind k) {
    switch (k) {
        case LaunchErrorKind::None: return "none";
        case LaunchErrorKind::InvalidPath: return "invalid_path";
        case LaunchErrorKind::PathTraversal: return "path_traversal";
        case LaunchErrorKind::ToolNotInstalled: return "tool_not_installed";
        case LaunchErrorKind::ExecutableNotFound: return "executable_not_found";
        case LaunchErrorKind::HashInvalid: return "hash_invalid";
        case LaunchErrorKind::HashMismatch: return "hash_mismatch";
        case LaunchErrorKind::OfflineOverrideFailed: return "offline_override_failed";
        case LaunchErrorKind::SpawnFailed: return "spawn_failed";
        default: return "unknown";
    }
}

struct LaunchResult {
    bool ok = false;
    LaunchErrorKind error_kind = LaunchErrorKind::None;
    std::string error;
    std::optional<int64_t> pid;
    SpawnRequest request;   // what was (or would have been) spawned
};

struct ExecutableResolution {
    bool ok = false;
    LaunchErrorKind error_kind = LaunchErrorKind::None;
    std::string error;
    std::string executable;
};

using Spawner = std::function<SpawnResult(const SpawnRequest&)>;

class ToolLauncher {
public:
    explicit ToolLauncher(LibraryManager library, Spawner spawner = spawn_detached);

    LaunchResult launch(const ProjectToolEntry& entry, const std::string& project_dir) const;

    // Resolution without hashing or spawning.
    ExecutableResolution resolve_executable(const ProjectToolEntry& entry,
                                            const std::string& project_dir) const;

private:
    LibraryManager library_;
    Spawner spawner_;
};

// Search a tool directory: the profile's known names first, then the first
// executable file found, breadth-first in sorted order.
std::optional<std::string> find_tool_executable(const std::string& tool_id,
                                                const std::string& tool_dir);

} // namespace toolshed
