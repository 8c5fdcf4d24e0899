#include "toolshed/sealer.hpp"
#include "toolshed/archive.hpp"
#include "toolshed/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <set>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace toolshed {

namespace {

constexpr const char* SEALED_MARKER = "_Sealed_";
constexpr const char* PARTIAL_SUFFIX = ".partial";

std::string absolute_normal(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) {
        return path;
    }
    std::string out = abs.lexically_normal().string();
    while (out.size() > 1 && (out.back() == '/' || out.back() == '\\')) {
        out.pop_back();
    }
    return out;
}

// Tools declared with an explicit path already live inside the project
std::vector<ProjectToolEntry> library_tools(const std::vector<ProjectToolEntry>& tools) {
    std::vector<ProjectToolEntry> out;
    std::set<ToolReference> seen;
    for (const auto& tool : tools) {
        if (tool.path) continue;
        if (seen.insert(tool.ref()).second) {
            out.push_back(tool);
        }
    }
    return out;
}

} // namespace

// ============================================================================
// Directory Walking
// ============================================================================

bool copy_directory_tree(const std::string& source, const std::string& destination,
                         std::string& error) {
    if (!is_directory(source)) {
        error = "source is not a directory: " + source;
        return false;
    }

    std::vector<std::pair<fs::path, fs::path>> stack;
    stack.emplace_back(fs::path(source), fs::path(destination));

    while (!stack.empty()) {
        auto [src_dir, dst_dir] = stack.back();
        stack.pop_back();

        std::error_code ec;
        fs::create_directories(dst_dir, ec);
        if (ec) {
            error = "failed to create " + dst_dir.string() + ": " + ec.message();
            return false;
        }

        fs::directory_iterator it(src_dir, ec);
        if (ec) {
            error = "failed to read " + src_dir.string() + ": " + ec.message();
            return false;
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            const fs::path& src = it->path();
            fs::path dst = dst_dir / src.filename();

            auto link_status = fs::symlink_status(src, ec);
            if (ec) {
                error = "failed to stat " + src.string() + ": " + ec.message();
                return false;
            }

            if (fs::is_symlink(link_status) && fs::is_directory(src, ec)) {
                error = "symlinked directory not supported: " + src.string();
                return false;
            }

            if (fs::is_directory(link_status)) {
                stack.emplace_back(src, dst);
                continue;
            }

            fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                error = "failed to copy " + src.string() + ": " + ec.message();
                return false;
            }
        }
        if (ec) {
            error = "failed to read " + src_dir.string() + ": " + ec.message();
            return false;
        }
    }

    return true;
}

std::vector<std::string> enumerate_project_files(const std::string& project_dir,
                                                 const std::vector<std::string>& exclude) {
    std::set<std::string> excluded;
    for (const auto& path : exclude) {
        excluded.insert(absolute_normal(path));
    }

    std::string root = absolute_normal(project_dir);
    std::vector<std::string> files;

    std::vector<std::string> stack{""};
    while (!stack.empty()) {
        std::string rel_dir = stack.back();
        stack.pop_back();

        std::string dir = rel_dir.empty() ? root : join_path(root, rel_dir);
        for (const auto& name : list_directory(dir)) {
            std::string rel = rel_dir.empty() ? name : rel_dir + "/" + name;
            std::string full = join_path(root, rel);
            if (excluded.count(absolute_normal(full))) {
                continue;
            }

            std::error_code ec;
            auto status = fs::symlink_status(full, ec);
            if (ec) {
                spdlog::warn("skipping unreadable entry {}: {}", full, ec.message());
                continue;
            }
            if (fs::is_directory(status)) {
                stack.push_back(rel);
            } else if (is_regular_file(full)) {
                files.push_back(rel);
            }
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

// ============================================================================
// Archive Naming
// ============================================================================

std::string sealed_archive_path(const std::string& project_dir, const std::string& output_dir) {
    std::string project = absolute_normal(project_dir);
    std::string name = get_filename(project);
    std::string stamp = get_filename_timestamp();

    // stamp is YYYYMMDD_HHMMSS_mmm
    auto split = stamp.find_last_of('_');
    std::string prefix = stamp.substr(0, split + 1);
    int millis = std::stoi(stamp.substr(split + 1));

    std::string candidate;
    for (;;) {
        std::string ms = std::to_string(millis);
        if (ms.size() < 3) ms.insert(0, 3 - ms.size(), '0');
        candidate = join_path(output_dir, name + SEALED_MARKER + prefix + ms + ".zip");
        if (!path_exists(candidate)) break;
        ++millis;
    }
    return candidate;
}

// ============================================================================
// Phases
// ============================================================================

ArchiveResult archive_project(const std::string& project_dir, const std::string& output_path) {
    ArchiveResult result;

    if (path_exists(output_path) && !remove_file(output_path)) {
        result.errors.push_back("failed to replace existing archive: " + output_path);
        return result;
    }

    auto files = enumerate_project_files(project_dir,
                                         {output_path, output_path + PARTIAL_SUFFIX});
    auto written = write_zip_archive(project_dir, files, output_path);
    if (!written.ok) {
        result.errors.push_back("failed to write archive: " + written.error);
        return result;
    }

    result.ok = true;
    result.archive_path = output_path;
    result.size_bytes = written.archive_size;
    spdlog::info("archived {} files into {}", written.entry_count, output_path);
    return result;
}

ProjectSealer::ProjectSealer(LibraryManager library) : library_(std::move(library)) {}

ValidationResult ProjectSealer::validate(const std::string& project_dir) const {
    ValidationResult result;

    if (!is_directory(project_dir)) {
        result.errors.push_back("project directory not found: " + project_dir);
        return result;
    }

    auto manifest = load_project_manifest(project_dir);
    if (manifest.isErr()) {
        result.errors.push_back(manifest.error().toString());
        return result;
    }
    result.manifest = manifest.value();

    auto tools = library_tools(result.manifest.tools);
    if (!tools.empty() && !library_.resolved()) {
        result.errors.push_back("library root unresolved");
        return result;
    }

    for (const auto& tool : tools) {
        if (!library_.tool_exists(tool.ref())) {
            result.errors.push_back("tool not in library: " + tool.ref().to_string());
        }
    }

    result.ok = result.errors.empty();
    return result;
}

CopyResult ProjectSealer::copy_tools(const std::string& project_dir,
                                     const std::vector<ProjectToolEntry>& tools) const {
    CopyResult result;
    auto pending = library_tools(tools);

    std::string tools_root = join_path(project_dir, PROJECT_TOOLS_DIR);
    if (!pending.empty() && !create_directories(tools_root)) {
        result.errors.push_back("failed to create tools directory: " + tools_root);
        return result;
    }

    for (const auto& tool : pending) {
        ToolReference ref = tool.ref();
        std::string source = library_.tool_path(ref.id, ref.version);
        std::string dest = embedded_tool_path(project_dir, ref);
        std::string partial = dest + PARTIAL_SUFFIX;

        if (path_exists(partial) && !remove_directory(partial)) {
            result.errors.push_back("failed to clear stale " + partial);
            continue;
        }

        std::string error;
        if (!copy_directory_tree(source, partial, error)) {
            if (path_exists(partial) && !remove_directory(partial)) {
                spdlog::warn("failed to remove incomplete copy {}", partial);
            }
            result.errors.push_back("failed to copy " + ref.to_string() + ": " + error);
            continue;
        }

        auto replaced = replace_directory(partial, dest);
        if (!replaced.ok) {
            result.errors.push_back("failed to copy " + ref.to_string() + ": " + replaced.error);
            continue;
        }

        spdlog::info("embedded {} into {}", ref.to_string(), dest);
        result.tools_copied.push_back(ref.to_string());
    }

    result.ok = result.errors.empty();
    return result;
}

SealResult ProjectSealer::seal(const std::string& project_dir, const SealOptions& options) const {
    SealResult result;
    std::string project = absolute_normal(project_dir);

    auto validation = validate(project);
    if (!validation.ok) {
        result.errors = validation.errors;
        return result;
    }

    auto copied = copy_tools(project, validation.manifest.tools);
    result.tools_copied = copied.tools_copied;
    if (!copied.ok) {
        result.errors = copied.errors;
        return result;
    }

    auto configured = write_offline_config(project);
    if (configured.isErr()) {
        result.errors.push_back(configured.error().toString());
        return result;
    }

    std::string output_dir = options.output_dir.empty() ? get_parent_directory(project)
                                                        : absolute_normal(options.output_dir);
    if (!create_directories(output_dir)) {
        result.errors.push_back("failed to create output directory: " + output_dir);
        return result;
    }

    auto archived = archive_project(project, sealed_archive_path(project, output_dir));
    if (!archived.ok) {
        result.errors = archived.errors;
        return result;
    }

    result.success = true;
    result.sealed_archive_path = archived.archive_path;
    result.size_mb = static_cast<double>(archived.size_bytes) / (1024.0 * 1024.0);
    spdlog::info("sealed {} -> {} ({:.2f} MB)", project, result.sealed_archive_path, result.size_mb);
    return result;
}

} // namespace toolshed
