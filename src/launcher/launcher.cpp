#include "toolshed/launcher.hpp"
#include "toolshed/integrity.hpp"
#include "toolshed/offline.hpp"
#include "toolshed/path_utils.hpp"
#include "toolshed/platform.hpp"
#include "toolshed/project.hpp"
#include "toolshed/tool_profiles.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <deque>
#include <filesystem>

namespace fs = std::filesystem;

namespace toolshed {

// Depth bound for the executable search inside a tool directory
static constexpr int MAX_SEARCH_DEPTH = 6;

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool matches_profile(const ToolProfile& profile, const std::string& file_name) {
    std::string lower = to_lower(file_name);
    for (const auto& name : profile.executable_names) {
        if (lower == name) return true;
    }
    for (const auto& prefix : profile.executable_prefixes) {
        if (lower.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

std::string absolute_project_dir(const std::string& project_dir) {
    std::error_code ec;
    fs::path abs = fs::absolute(project_dir, ec);
    if (ec) {
        return project_dir;
    }
    std::string out = abs.lexically_normal().string();
    while (out.size() > 1 && (out.back() == '/' || out.back() == '\\')) {
        out.pop_back();
    }
    return out;
}

ExecutableResolution resolution_error(LaunchErrorKind kind, std::string message) {
    ExecutableResolution r;
    r.error_kind = kind;
    r.error = std::move(message);
    return r;
}

} // namespace

std::optional<std::string> find_tool_executable(const std::string& tool_id,
                                                const std::string& tool_dir) {
    const ToolProfile& profile = tool_profile(tool_id);
    std::optional<std::string> first_executable;

    std::deque<std::pair<std::string, int>> pending;
    pending.emplace_back(tool_dir, 0);

    while (!pending.empty()) {
        auto [dir, depth] = pending.front();
        pending.pop_front();

        for (const auto& name : list_directory(dir)) {
            std::string full = join_path(dir, name);
            if (is_directory(full)) {
                if (depth + 1 < MAX_SEARCH_DEPTH) {
                    pending.emplace_back(full, depth + 1);
                }
                continue;
            }
            if (!is_executable_file(full)) {
                continue;
            }
            if (matches_profile(profile, name)) {
                return full;
            }
            if (!first_executable) {
                first_executable = full;
            }
        }
    }

    return first_executable;
}

ToolLauncher::ToolLauncher(LibraryManager library, Spawner spawner)
    : library_(std::move(library)), spawner_(std::move(spawner)) {}

ExecutableResolution ToolLauncher::resolve_executable(const ProjectToolEntry& entry,
                                                      const std::string& project_dir) const {
    std::string project = absolute_project_dir(project_dir);

    if (entry.path) {
        auto resolved = resolve_under_root(project, *entry.path);
        if (!resolved.ok) {
            LaunchErrorKind kind = is_traversal_error(resolved.error) ? LaunchErrorKind::PathTraversal
                                                                      : LaunchErrorKind::InvalidPath;
            return resolution_error(kind, std::string(path_error_to_string(resolved.error)) + ": '" +
                                              *entry.path + "' is not inside project " + project);
        }
        if (!is_regular_file(resolved.path)) {
            return resolution_error(LaunchErrorKind::ExecutableNotFound,
                                    "executable not found: " + resolved.path);
        }
        ExecutableResolution r;
        r.ok = true;
        r.executable = resolved.path;
        return r;
    }

    // id and version come from the manifest; the embedded directory they name
    // must be one plain entry under <project>/tools
    std::string dirname = embedded_tool_dirname(entry.ref());
    auto embedded = resolve_under_root(project, std::string(PROJECT_TOOLS_DIR) + "/" + dirname);
    if (!embedded.ok || dirname.find_first_of("/\\") != std::string::npos) {
        return resolution_error(LaunchErrorKind::PathTraversal,
                                "tool reference " + entry.ref().to_string() +
                                    " does not name a directory inside " + project);
    }

    std::string tool_dir = embedded.path;
    if (!is_directory(tool_dir)) {
        if (!library_.tool_exists(entry.ref())) {
            return resolution_error(LaunchErrorKind::ToolNotInstalled,
                                    "tool not installed: " + entry.ref().to_string());
        }
        tool_dir = library_.tool_path(entry.id, entry.version);
    }

    auto executable = find_tool_executable(entry.id, tool_dir);
    if (!executable) {
        return resolution_error(LaunchErrorKind::ExecutableNotFound,
                                "no executable found for " + entry.ref().to_string() + " in " + tool_dir);
    }

    ExecutableResolution r;
    r.ok = true;
    r.executable = *executable;
    return r;
}

LaunchResult ToolLauncher::launch(const ProjectToolEntry& entry, const std::string& project_dir) const {
    LaunchResult result;
    std::string project = absolute_project_dir(project_dir);

    auto fail = [&](LaunchErrorKind kind, const std::string& message) {
        spdlog::warn("launch {} refused ({}): {}", entry.ref().to_string(),
                     launch_error_to_string(kind), message);
        result.ok = false;
        result.error_kind = kind;
        result.error = message;
        return result;
    };

    auto resolved = resolve_executable(entry, project);
    if (!resolved.ok) {
        return fail(resolved.error_kind, resolved.error);
    }

    if (entry.sha256) {
        if (!is_valid_sha256(*entry.sha256)) {
            return fail(LaunchErrorKind::HashInvalid,
                        "malformed sha256 for " + entry.ref().to_string() + ": '" + *entry.sha256 + "'");
        }
        auto verified = verify_file_sha256(resolved.executable, *entry.sha256);
        if (!verified.ok) {
            return fail(LaunchErrorKind::HashMismatch, verified.error);
        }
    }

    result.request.executable = resolved.executable;
    result.request.arguments = build_launch_arguments(entry.id, project);
    result.request.working_directory = project;

    if (OfflineEnforcer::instance().is_offline()) {
        const ToolProfile& profile = tool_profile(entry.id);
        result.request.extra_environment["TOOLSHED_OFFLINE"] = "1";

        switch (profile.offline) {
            case OfflineOverride::LaunchFlag:
                result.request.arguments.insert(result.request.arguments.end(),
                                                profile.extra_offline_args.begin(),
                                                profile.extra_offline_args.end());
                break;
            case OfflineOverride::ProjectConfig: {
                auto written = write_offline_config(project);
                if (written.isErr()) {
                    return fail(LaunchErrorKind::OfflineOverrideFailed, written.error().toString());
                }
                break;
            }
            case OfflineOverride::EnvironmentOnly:
                break;
        }
        spdlog::debug("offline overrides applied for {}", entry.ref().to_string());
    }

    SpawnResult spawned = spawner_(result.request);
    if (!spawned.ok) {
        return fail(LaunchErrorKind::SpawnFailed, spawned.error);
    }

    spdlog::info("launched {} (pid {})", entry.ref().to_string(), spawned.pid);
    result.ok = true;
    result.pid = spawned.pid;
    return result;
}

} // namespace toolshed
