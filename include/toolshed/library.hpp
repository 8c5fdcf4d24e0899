#pragma once

/**
 * @file library.hpp
 * @brief Version-keyed tool library (cache) layout and queries
 *
 * Layout under the library root:
 *
 *   <root>/<id>/<version>/...          hydrated tool contents
 *   <root>/.registry/<id>@<version>.json install records
 *   <root>/.staging/<uuid>/             private extraction area
 *
 * Entries whose names start with '.' are never reported as tools.
 */

#include "toolshed/result.hpp"
#include "toolshed/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace toolshed {

// ============================================================================
// Library Root
// ============================================================================

// Platform default library root, or the testing override when one is set.
// Returns an empty string when no base directory can be resolved.
std::string library_root();

// Only tests may call these. Nothing reads the override from the environment.
void set_library_root_override_for_testing(const std::string& path);
void clear_library_root_override_for_testing();

// ============================================================================
// Install Record
// ============================================================================

struct InstallRecord {
    ToolReference tool;
    struct {
        std::string source;       // archive path or URL
        std::string sha256;       // archive digest verified at install time
        std::string installed_at; // RFC3339 timestamp
        std::string mirror_name;
    } provenance;
};

// ============================================================================
// Library Manager
// ============================================================================

struct ToolMetadata {
    bool exists = false;
    std::string path;
    uint64_t size_bytes = 0;
    std::string last_modified;  // RFC3339, empty when unknown
};

class LibraryManager {
public:
    explicit LibraryManager(std::string root);

    // Library rooted at library_root(); root() is empty when unresolved.
    static LibraryManager with_default_root();

    const std::string& root() const { return root_; }
    bool resolved() const { return !root_.empty(); }

    // Directory for (id, version). Empty when the root is unresolved or the
    // id/version would not name a single directory level.
    std::string tool_path(const std::string& id, const std::string& version) const;

    // True when the entry directory exists and is not empty.
    bool tool_exists(const std::string& id, const std::string& version) const;
    bool tool_exists(const ToolReference& ref) const { return tool_exists(ref.id, ref.version); }

    // Tool ids, sorted. Empty when the root is missing.
    std::vector<std::string> list_tools() const;

    // Versions of a tool, oldest first.
    std::vector<std::string> list_versions(const std::string& id) const;

    ToolMetadata tool_metadata(const std::string& id, const std::string& version) const;

    Result<void> remove_tool(const ToolReference& ref) const;

    std::string staging_root() const;
    std::string registry_root() const;

    Result<void> write_install_record(const InstallRecord& record) const;
    Result<InstallRecord> read_install_record(const ToolReference& ref) const;

private:
    std::string root_;
};

// Natural ordering for version strings: numeric runs compare by value.
bool version_less(const std::string& a, const std::string& b);

} // namespace toolshed
