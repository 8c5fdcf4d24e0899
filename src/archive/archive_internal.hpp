#pragma once

#include <cstdint>
#include <string>

namespace toolshed {
namespace archive_detail {

struct EntryTarget {
    bool ok = false;
    std::string error;
    std::string relative;   // normalized, forward slashes
    std::string full_path;  // dest_dir joined with relative
};

// Validate an archive member name against the extraction root.
EntryTarget resolve_entry(const std::string& entry_name, const std::string& dest_dir);

// Apply 0755 or 0644 depending on whether any execute bit is set in mode.
void apply_file_mode(const std::string& path, uint32_t mode);

} // namespace archive_detail
} // namespace toolshed
