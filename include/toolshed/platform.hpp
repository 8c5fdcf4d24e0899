#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolshed {

// ============================================================================
// Platform Detection
// ============================================================================

// Selects the default library root (see library_root())
enum class Platform { Linux, macOS, Windows, Unknown };

Platform get_current_platform();

// ============================================================================
// Atomic Replacement
// ============================================================================
//
// Readers of a library entry, install record or project config see either the
// old content or the new content, never a partial write.

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Hidden sibling temp file, fsync, rename over path, fsync the directory.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Move a fully staged directory into place. A previous destination is moved
// aside first and restored if the final rename fails.
AtomicWriteResult replace_directory(const std::string& staged, const std::string& destination);

// ============================================================================
// Paths and Files
// ============================================================================
//
// Thin error_code wrappers over std::filesystem: failures come back as
// false/empty, never as exceptions.

// Backslashes to forward slashes; archive entries and record paths use this form
std::string to_portable_path(const std::string& path);

std::string get_parent_directory(const std::string& path);
std::string get_filename(const std::string& path);
std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// Regular file with any execute bit (POSIX), or .exe/.bat/.cmd (Windows)
bool is_executable_file(const std::string& path);

// List directory entry names, sorted. Empty when path is not a directory.
std::vector<std::string> list_directory(const std::string& path);

bool create_directories(const std::string& path);
bool remove_directory(const std::string& path);
bool remove_file(const std::string& path);
bool copy_file(const std::string& src, const std::string& dst);

std::optional<uint64_t> file_size(const std::string& path);

// Recursively sum regular file sizes below a directory
uint64_t directory_size(const std::string& path);

// Last modification time as RFC3339, empty when unavailable
std::string last_write_timestamp(const std::string& path);

// ============================================================================
// Environment and Time
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Snapshot of the process environment; spawned tools start from it
std::unordered_map<std::string, std::string> get_all_env();

// UTC, RFC3339 ("2024-05-01T12:00:00Z"); install records use it
std::string get_current_timestamp();

// Local-time stamp for file names: YYYYMMDD_HHMMSS_mmm
std::string get_filename_timestamp();

std::string generate_uuid();

} // namespace toolshed
