#include "toolshed/library.hpp"
#include "toolshed/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>

namespace toolshed {

namespace fs = std::filesystem;

namespace {

constexpr const char* APP_DIR_NAME = "toolshed";
constexpr const char* LIBRARY_DIR_NAME = "library";
constexpr const char* REGISTRY_DIR_NAME = ".registry";
constexpr const char* STAGING_DIR_NAME = ".staging";
constexpr const char* INSTALL_RECORD_SCHEMA = "toolshed.install.v1";

std::mutex& override_mutex() {
    static std::mutex m;
    return m;
}

std::optional<std::string>& root_override() {
    static std::optional<std::string> value;
    return value;
}

std::optional<std::string> non_empty_env(const char* name) {
    auto value = get_env(name);
    if (value && !value->empty()) return value;
    return std::nullopt;
}

std::string platform_default_root() {
    std::string base;
    switch (get_current_platform()) {
        case Platform::Windows: {
            if (auto local = non_empty_env("LOCALAPPDATA")) {
                base = *local;
            } else if (auto profile = non_empty_env("USERPROFILE")) {
                base = *profile + "/AppData/Local";
            }
            break;
        }
        case Platform::macOS: {
            if (auto home = non_empty_env("HOME")) {
                base = *home + "/Library/Application Support";
            }
            break;
        }
        default: {
            if (auto xdg = non_empty_env("XDG_DATA_HOME")) {
                base = *xdg;
            } else if (auto home = non_empty_env("HOME")) {
                base = *home + "/.local/share";
            }
            break;
        }
    }

    if (base.empty()) {
        return "";
    }
    return join_path(join_path(base, APP_DIR_NAME), LIBRARY_DIR_NAME);
}

bool is_hidden(const std::string& name) {
    return !name.empty() && name[0] == '.';
}

// A single, plain directory level: no separators and no leading '.', which
// also keeps ids off ".registry" and ".staging"
bool is_plain_component(const std::string& s) {
    if (s.empty() || s[0] == '.') return false;
    return s.find('/') == std::string::npos &&
           s.find('\\') == std::string::npos &&
           s.find('\0') == std::string::npos;
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) return "";
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

} // namespace

std::string library_root() {
    {
        std::lock_guard<std::mutex> lock(override_mutex());
        if (root_override()) {
            return *root_override();
        }
    }
    return platform_default_root();
}

void set_library_root_override_for_testing(const std::string& path) {
    std::lock_guard<std::mutex> lock(override_mutex());
    root_override() = path;
}

void clear_library_root_override_for_testing() {
    std::lock_guard<std::mutex> lock(override_mutex());
    root_override().reset();
}

bool version_less(const std::string& a, const std::string& b) {
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        bool da = std::isdigit(static_cast<unsigned char>(a[i])) != 0;
        bool db = std::isdigit(static_cast<unsigned char>(b[j])) != 0;
        if (da && db) {
            size_t si = i;
            size_t sj = j;
            while (i < a.size() && std::isdigit(static_cast<unsigned char>(a[i]))) ++i;
            while (j < b.size() && std::isdigit(static_cast<unsigned char>(b[j]))) ++j;
            std::string na = a.substr(si, i - si);
            std::string nb = b.substr(sj, j - sj);
            na.erase(0, std::min(na.find_first_not_of('0'), na.size()));
            nb.erase(0, std::min(nb.find_first_not_of('0'), nb.size()));
            if (na.size() != nb.size()) return na.size() < nb.size();
            if (na != nb) return na < nb;
        } else {
            if (a[i] != b[j]) return a[i] < b[j];
            ++i;
            ++j;
        }
    }
    return (a.size() - i) < (b.size() - j);
}

LibraryManager::LibraryManager(std::string root) : root_(std::move(root)) {}

LibraryManager LibraryManager::with_default_root() {
    std::string root = library_root();
    if (root.empty()) {
        spdlog::warn("library root could not be resolved; no home or data directory found");
    }
    return LibraryManager(root);
}

std::string LibraryManager::tool_path(const std::string& id, const std::string& version) const {
    if (root_.empty() || !is_plain_component(id) || !is_plain_component(version)) {
        return "";
    }
    return join_path(join_path(root_, id), version);
}

bool LibraryManager::tool_exists(const std::string& id, const std::string& version) const {
    std::string path = tool_path(id, version);
    if (path.empty() || !is_directory(path)) {
        return false;
    }
    std::error_code ec;
    return fs::directory_iterator(path, ec) != fs::directory_iterator() && !ec;
}

std::vector<std::string> LibraryManager::list_tools() const {
    std::vector<std::string> tools;
    if (root_.empty()) return tools;

    for (const auto& name : list_directory(root_)) {
        if (is_hidden(name)) continue;
        if (!is_directory(join_path(root_, name))) continue;
        tools.push_back(name);
    }
    return tools;
}

std::vector<std::string> LibraryManager::list_versions(const std::string& id) const {
    std::vector<std::string> versions;
    if (root_.empty() || !is_plain_component(id)) return versions;

    std::string tool_dir = join_path(root_, id);
    for (const auto& name : list_directory(tool_dir)) {
        if (is_hidden(name)) continue;
        if (!is_directory(join_path(tool_dir, name))) continue;
        versions.push_back(name);
    }
    std::sort(versions.begin(), versions.end(), version_less);
    return versions;
}

ToolMetadata LibraryManager::tool_metadata(const std::string& id, const std::string& version) const {
    ToolMetadata meta;
    meta.path = tool_path(id, version);
    if (meta.path.empty()) return meta;

    meta.exists = tool_exists(id, version);
    if (meta.exists) {
        meta.size_bytes = directory_size(meta.path);
        meta.last_modified = last_write_timestamp(meta.path);
    }
    return meta;
}

std::string LibraryManager::staging_root() const {
    if (root_.empty()) return "";
    return join_path(root_, STAGING_DIR_NAME);
}

std::string LibraryManager::registry_root() const {
    if (root_.empty()) return "";
    return join_path(root_, REGISTRY_DIR_NAME);
}

Result<void> LibraryManager::remove_tool(const ToolReference& ref) const {
    std::string path = tool_path(ref.id, ref.version);
    if (path.empty()) {
        ErrorCode code = root_.empty() ? ErrorCode::ROOT_UNRESOLVED : ErrorCode::INVALID_INPUT;
        return Result<void>::err(Error(code, "cannot resolve library path for " + ref.to_string()));
    }
    if (!is_directory(path)) {
        return Result<void>::err(Error(ErrorCode::TOOL_NOT_INSTALLED,
                                       "tool not in library: " + ref.to_string()));
    }
    if (!remove_directory(path)) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "failed to remove " + path));
    }

    remove_file(join_path(registry_root(), ref.to_string() + ".json"));

    // Drop the tool directory once its last version is gone
    std::string tool_dir = join_path(root_, ref.id);
    if (list_directory(tool_dir).empty() && !remove_directory(tool_dir)) {
        spdlog::warn("failed to remove empty tool directory {}", tool_dir);
    }

    spdlog::info("removed {} from library", ref.to_string());
    return Result<void>::ok();
}

Result<void> LibraryManager::write_install_record(const InstallRecord& record) const {
    if (root_.empty()) {
        return Result<void>::err(Error(ErrorCode::ROOT_UNRESOLVED, "library root unresolved"));
    }

    std::string dir = registry_root();
    if (!create_directories(dir)) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "failed to create " + dir));
    }

    nlohmann::json j;
    j["$schema"] = INSTALL_RECORD_SCHEMA;
    j["tool"]["id"] = record.tool.id;
    j["tool"]["version"] = record.tool.version;
    j["provenance"]["source"] = record.provenance.source;
    j["provenance"]["sha256"] = record.provenance.sha256;
    j["provenance"]["installed_at"] = record.provenance.installed_at;
    j["provenance"]["mirror_name"] = record.provenance.mirror_name;

    std::string path = join_path(dir, record.tool.to_string() + ".json");
    auto write_result = atomic_write_file(path, j.dump(2) + "\n");
    if (!write_result.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, write_result.error));
    }
    return Result<void>::ok();
}

Result<InstallRecord> LibraryManager::read_install_record(const ToolReference& ref) const {
    if (root_.empty()) {
        return Result<InstallRecord>::err(Error(ErrorCode::ROOT_UNRESOLVED, "library root unresolved"));
    }

    std::string path = join_path(registry_root(), ref.to_string() + ".json");
    std::string content = read_file(path);
    if (content.empty()) {
        return Result<InstallRecord>::err(Error(ErrorCode::FILE_NOT_FOUND,
                                                "install record not found: " + path));
    }

    auto j = nlohmann::json::parse(content, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Result<InstallRecord>::err(Error(ErrorCode::PARSE_ERROR,
                                                "install record is not a JSON object: " + path));
    }
    if (j.value("$schema", "") != INSTALL_RECORD_SCHEMA) {
        return Result<InstallRecord>::err(Error(ErrorCode::PARSE_ERROR,
                                                "$schema mismatch: expected " +
                                                std::string(INSTALL_RECORD_SCHEMA)));
    }

    InstallRecord record;
    record.tool = ref;
    if (j.contains("provenance") && j["provenance"].is_object()) {
        const auto& prov = j["provenance"];
        record.provenance.source = prov.value("source", "");
        record.provenance.sha256 = prov.value("sha256", "");
        record.provenance.installed_at = prov.value("installed_at", "");
        record.provenance.mirror_name = prov.value("mirror_name", "");
    }
    return Result<InstallRecord>::ok(record);
}

} // namespace toolshed
