#pragma once

#include <string>

namespace toolshed {

enum class PathError {
    None,
    Empty,
    ContainsNul,
    AbsoluteNotAllowed,
    ParentSegment,
    EscapesRoot,
};

inline const char* path_error_to_string(PathError e) {
    switch (e) {
        case PathError::None: return "none";
        case PathError::Empty: return "path_empty";
        case PathError::ContainsNul: return "path_contains_nul";
        case PathError::AbsoluteNotAllowed: return "path_absolute";
        case PathError::ParentSegment: return "path_traversal";
        case PathError::EscapesRoot: return "path_escapes_root";
        default: return "unknown";
    }
}

// Traversal-class errors are the ones a caller must treat as hostile input.
inline bool is_traversal_error(PathError e) {
    return e == PathError::AbsoluteNotAllowed ||
           e == PathError::ParentSegment ||
           e == PathError::EscapesRoot;
}

struct PathResult {
    bool ok = false;
    std::string path;  // normalized absolute path when ok
    PathError error = PathError::None;
};

// Resolve a relative path under root without touching the filesystem.
// - Treats '\\' as a separator on every platform
// - Rejects empty input, NUL bytes, absolute paths and drive letters
// - Rejects any ".." segment outright
// - Collapses "." segments and repeated separators
// - Fails unless the case-folded result equals or lies under the case-folded root
PathResult resolve_under_root(const std::string& root, const std::string& relative_path);

// Case-insensitive lexical containment check on already-absolute paths.
bool is_path_within(const std::string& root, const std::string& candidate);

// Resolve an archive path declared by a mirror manifest against the mirror root.
struct ArchivePathResult {
    bool ok = false;
    std::string full_path;
    std::string error;
    PathError path_error = PathError::None;
};

ArchivePathResult resolve_archive_path(const std::string& mirror_root,
                                       const std::string& relative_path);

} // namespace toolshed
