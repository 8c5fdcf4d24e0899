#include "toolshed/path_utils.hpp"
#include "toolshed/platform.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace toolshed {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

bool looks_absolute(const std::string& portable) {
    if (!portable.empty() && portable[0] == '/') return true;
    // Drive letters ("C:", "c:/...") are absolute on every platform we accept input from
    if (portable.size() >= 2 && std::isalpha(static_cast<unsigned char>(portable[0])) &&
        portable[1] == ':') {
        return true;
    }
    return false;
}

// Lexically normalized, forward slashes, lowercase, no trailing separator
std::string fold_path(const std::string& path) {
    std::string portable = to_portable_path(path);
    std::string normal = to_portable_path(
        std::filesystem::path(portable).lexically_normal().generic_string());
    std::transform(normal.begin(), normal.end(), normal.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

} // namespace

bool is_path_within(const std::string& root, const std::string& candidate) {
    if (root.empty() || candidate.empty()) return false;

    std::string folded_root = fold_path(root);
    std::string folded = fold_path(candidate);

    if (folded == folded_root) return true;
    if (folded_root == "/") return folded.rfind("/", 0) == 0;
    return folded.size() > folded_root.size() &&
           folded.compare(0, folded_root.size(), folded_root) == 0 &&
           folded[folded_root.size()] == '/';
}

PathResult resolve_under_root(const std::string& root, const std::string& relative_path) {
    if (relative_path.empty() || root.empty()) {
        return {false, {}, PathError::Empty};
    }
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    std::string portable = to_portable_path(relative_path);
    if (looks_absolute(portable)) {
        return {false, {}, PathError::AbsoluteNotAllowed};
    }

    std::vector<std::string> normalized;
    for (const auto& part : split(portable, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            return {false, {}, PathError::ParentSegment};
        }
        normalized.push_back(part);
    }

    std::filesystem::path p(to_portable_path(root));
    for (const auto& c : normalized) {
        p /= c;
    }
    std::string out = to_portable_path(p.lexically_normal().generic_string());
    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }

    if (!is_path_within(root, out)) {
        return {false, {}, PathError::EscapesRoot};
    }

    return {true, out, PathError::None};
}

ArchivePathResult resolve_archive_path(const std::string& mirror_root,
                                       const std::string& relative_path) {
    ArchivePathResult result;

    auto resolved = resolve_under_root(mirror_root, relative_path);
    if (!resolved.ok) {
        result.path_error = resolved.error;
        result.error = std::string(path_error_to_string(resolved.error)) +
                       ": '" + relative_path + "' is not inside mirror root " + mirror_root;
        return result;
    }

    result.ok = true;
    result.full_path = resolved.path;
    return result;
}

} // namespace toolshed
