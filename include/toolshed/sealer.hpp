#pragma once

/**
 * @file sealer.hpp
 * @brief Turns a linked project into a self-contained, forced-offline archive
 *
 * Phases run in order and stop at the first one that fails:
 *   validate  -> project, manifest and every referenced library tool exist
 *   copy      -> <project>/tools/<id>_<version>/ per tool
 *   configure -> <project>/.toolshed/config.json with forced-offline flags
 *   archive   -> <parent>/<project>_Sealed_<timestamp>.zip
 */

#include "toolshed/library.hpp"
#include "toolshed/project.hpp"
#include "toolshed/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace toolshed {

struct SealResult {
    bool success = false;
    std::string sealed_archive_path;
    double size_mb = 0.0;
    std::vector<std::string> tools_copied;  // "id@version"
    std::vector<std::string> errors;        // empty on success
};

struct PhaseResult {
    bool ok = false;
    std::vector<std::string> errors;
};

struct ValidationResult : PhaseResult {
    ProjectManifest manifest;
};

struct CopyResult : PhaseResult {
    std::vector<std::string> tools_copied;
};

struct ArchiveResult : PhaseResult {
    std::string archive_path;
    uint64_t size_bytes = 0;
};

struct SealOptions {
    std::string output_dir;   // default: the project's parent directory
};

class ProjectSealer {
public:
    explicit ProjectSealer(LibraryManager library);

    SealResult seal(const std::string& project_dir, const SealOptions& options = {}) const;

    ValidationResult validate(const std::string& project_dir) const;
    CopyResult copy_tools(const std::string& project_dir,
                          const std::vector<ProjectToolEntry>& tools) const;

private:
    LibraryManager library_;
};

// Every regular file under project_dir, relative, forward slashes, sorted.
// Paths in `exclude` (absolute) are skipped.
std::vector<std::string> enumerate_project_files(const std::string& project_dir,
                                                 const std::vector<std::string>& exclude = {});

// Zip the project into output_path, replacing anything already there.
ArchiveResult archive_project(const std::string& project_dir, const std::string& output_path);

// "<output_dir>/<project name>_Sealed_<YYYYMMDD_HHMMSS_mmm>.zip", never an
// existing file.
std::string sealed_archive_path(const std::string& project_dir, const std::string& output_dir);

// Copy a directory tree with an explicit work stack; stops at the first error.
bool copy_directory_tree(const std::string& source, const std::string& destination,
                         std::string& error);

} // namespace toolshed
