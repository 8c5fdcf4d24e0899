#include "toolshed/archive.hpp"
#include "toolshed/path_utils.hpp"
#include "toolshed/platform.hpp"
#include "archive_internal.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace toolshed {

namespace archive_detail {

EntryTarget resolve_entry(const std::string& entry_name, const std::string& dest_dir) {
    EntryTarget target;

    std::string name = to_portable_path(entry_name);
    while (!name.empty() && name.back() == '/') {
        name.pop_back();
    }
    if (name.rfind("./", 0) == 0) {
        name = name.substr(2);
    }
    if (name.empty() || name == ".") {
        target.error = "empty entry name";
        return target;
    }

    auto resolved = resolve_under_root(dest_dir, name);
    if (!resolved.ok) {
        if (resolved.error == PathError::AbsoluteNotAllowed) {
            target.error = "absolute path not allowed: " + entry_name;
        } else if (is_traversal_error(resolved.error)) {
            target.error = "path traversal not allowed: " + entry_name;
        } else {
            target.error = "invalid entry path: " + entry_name;
        }
        return target;
    }

    target.ok = true;
    target.full_path = resolved.path;
    target.relative = to_portable_path(fs::path(resolved.path).lexically_relative(
        fs::path(to_portable_path(dest_dir)).lexically_normal()).generic_string());
    return target;
}

void apply_file_mode(const std::string& path, uint32_t mode) {
    std::error_code ec;
    if ((mode & 0111) != 0) {
        fs::permissions(path, fs::perms::owner_all | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read |
                        fs::perms::others_exec, ec);
    } else {
        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write |
                        fs::perms::group_read | fs::perms::others_read, ec);
    }
}

} // namespace archive_detail

ArchiveFormat detect_archive_format(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    unsigned char magic[4] = {0, 0, 0, 0};
    file.read(reinterpret_cast<char*>(magic), sizeof(magic));
    std::streamsize got = file.gcount();

    if (got >= 4 && magic[0] == 'P' && magic[1] == 'K' && magic[2] == 0x03 && magic[3] == 0x04) {
        return ArchiveFormat::Zip;
    }
    if (got >= 2 && magic[0] == 0x1f && magic[1] == 0x8b) {
        return ArchiveFormat::TarGz;
    }
    return ArchiveFormat::Plain;
}

ExtractResult extract_archive(const std::string& archive_path,
                              const std::string& dest_dir,
                              const std::string& plain_name) {
    if (!is_regular_file(archive_path)) {
        ExtractResult result;
        result.error = "archive not found: " + archive_path;
        return result;
    }

    switch (detect_archive_format(archive_path)) {
        case ArchiveFormat::Zip:
            return extract_zip(archive_path, dest_dir);
        case ArchiveFormat::TarGz:
            return extract_tar_gz(archive_path, dest_dir);
        case ArchiveFormat::Plain:
        default:
            break;
    }

    ExtractResult result;
    std::string name = plain_name.empty() ? get_filename(archive_path) : plain_name;
    auto target = archive_detail::resolve_entry(name, dest_dir);
    if (!target.ok) {
        result.error = target.error;
        return result;
    }

    if (!create_directories(dest_dir) || !copy_file(archive_path, target.full_path)) {
        result.error = "failed to copy " + archive_path + " into " + dest_dir;
        return result;
    }
    archive_detail::apply_file_mode(target.full_path, 0755);

    result.entries.push_back(target.relative);
    result.ok = true;
    return result;
}

bool strip_single_wrapper_directory(const std::string& dir) {
    auto entries = list_directory(dir);
    if (entries.size() != 1) {
        return true;
    }

    std::string wrapper = join_path(dir, entries[0]);
    if (!is_directory(wrapper)) {
        return true;
    }

    // Move the wrapper aside first: it may contain a child with its own name
    std::string moved = join_path(dir, ".wrapper-" + generate_uuid());
    std::error_code ec;
    fs::rename(wrapper, moved, ec);
    if (ec) {
        spdlog::error("failed to move {} aside: {}", wrapper, ec.message());
        return false;
    }

    for (const auto& child : list_directory(moved)) {
        fs::rename(join_path(moved, child), join_path(dir, child), ec);
        if (ec) {
            spdlog::error("failed to lift {} out of {}: {}", child, wrapper, ec.message());
            return false;
        }
    }

    fs::remove(moved, ec);
    if (ec) {
        spdlog::error("failed to remove emptied wrapper {}: {}", moved, ec.message());
        return false;
    }

    spdlog::debug("stripped wrapper folder '{}'", entries[0]);
    return true;
}

} // namespace toolshed
