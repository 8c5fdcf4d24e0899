#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace toolshed {

// ============================================================================
// Archive Formats
// ============================================================================

enum class ArchiveFormat {
    Zip,        // PK\x03\x04 local file header
    TarGz,      // gzip magic 1f 8b wrapping a ustar stream
    Plain       // anything else: installed as a single file
};

// Detect the format from the first bytes of the file
ArchiveFormat detect_archive_format(const std::string& path);

// ============================================================================
// Safe Extraction
// ============================================================================

// Extraction safety:
//   - Reject absolute paths and drive letters
//   - Reject paths with .. or escaping the destination
//   - Reject symlinks, hardlinks, device files, FIFOs
//   - Materialize only regular files and directories

struct ExtractResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> entries;  // Relative paths of extracted entries
};

// Extract a zip archive into dest_dir. Stored and deflated members only.
ExtractResult extract_zip(const std::string& archive_path, const std::string& dest_dir);

// Extract a gzip-compressed tar archive into dest_dir.
ExtractResult extract_tar_gz(const std::string& archive_path, const std::string& dest_dir);

// Dispatch on detect_archive_format(). Plain files are copied into dest_dir
// under plain_name (or the archive's own file name when plain_name is empty).
ExtractResult extract_archive(const std::string& archive_path,
                              const std::string& dest_dir,
                              const std::string& plain_name = "");

// If dir holds exactly one entry and it is a directory, move that
// directory's children up into dir and remove it. Returns false on I/O error.
bool strip_single_wrapper_directory(const std::string& dir);

// ============================================================================
// Zip Writing
// ============================================================================

struct ZipWriteResult {
    bool ok = false;
    std::string error;
    uint64_t archive_size = 0;
    size_t entry_count = 0;
};

// Write the listed files (relative to base_dir, forward slashes) into a new
// zip at output_path, in the order given. Any existing output is replaced.
// Entries are deflated; timestamps are taken from each file's mtime.
ZipWriteResult write_zip_archive(const std::string& base_dir,
                                 const std::vector<std::string>& relative_files,
                                 const std::string& output_path);

} // namespace toolshed
