#include "toolshed/project.hpp"
#include "toolshed/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace toolshed {

namespace {

std::optional<std::string> read_text_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

Error manifest_error(ErrorCode code, const std::string& message) {
    return Error(code, "project manifest: " + message);
}

} // namespace

std::string project_manifest_path(const std::string& project_dir) {
    return join_path(project_dir, PROJECT_MANIFEST_FILE);
}

std::string project_config_path(const std::string& project_dir) {
    return join_path(project_dir, PROJECT_CONFIG_FILE);
}

std::string embedded_tool_dirname(const ToolReference& ref) {
    return ref.id + "_" + ref.version;
}

std::string embedded_tool_path(const std::string& project_dir, const ToolReference& ref) {
    return join_path(join_path(project_dir, PROJECT_TOOLS_DIR), embedded_tool_dirname(ref));
}

Result<ProjectManifest> parse_project_manifest(const std::string& json_str) {
    auto j = nlohmann::json::parse(json_str, nullptr, false);
    if (j.is_discarded()) {
        return Result<ProjectManifest>::err(manifest_error(ErrorCode::PARSE_ERROR, "invalid JSON"));
    }
    if (!j.is_object()) {
        return Result<ProjectManifest>::err(manifest_error(ErrorCode::PARSE_ERROR, "root is not an object"));
    }

    ProjectManifest manifest;
    if (j.contains("name")) {
        if (!j["name"].is_string()) {
            return Result<ProjectManifest>::err(manifest_error(ErrorCode::INVALID_INPUT, "name must be a string"));
        }
        manifest.name = j["name"].get<std::string>();
    }

    if (!j.contains("tools")) {
        return Result<ProjectManifest>::ok(manifest);
    }
    if (!j["tools"].is_array()) {
        return Result<ProjectManifest>::err(manifest_error(ErrorCode::INVALID_INPUT, "tools must be an array"));
    }

    size_t index = 0;
    for (const auto& item : j["tools"]) {
        std::string where = "tools[" + std::to_string(index++) + "]";
        if (!item.is_object()) {
            return Result<ProjectManifest>::err(manifest_error(ErrorCode::INVALID_INPUT, where + " is not an object"));
        }

        ProjectToolEntry entry;
        if (!item.contains("id") || !item["id"].is_string() || item["id"].get<std::string>().empty()) {
            return Result<ProjectManifest>::err(manifest_error(ErrorCode::INVALID_INPUT, where + ".id missing"));
        }
        if (!item.contains("version") || !item["version"].is_string() ||
            item["version"].get<std::string>().empty()) {
            return Result<ProjectManifest>::err(manifest_error(ErrorCode::INVALID_INPUT, where + ".version missing"));
        }
        entry.id = item["id"].get<std::string>();
        entry.version = item["version"].get<std::string>();

        if (item.contains("path") && !item["path"].is_null()) {
            if (!item["path"].is_string()) {
                return Result<ProjectManifest>::err(manifest_error(ErrorCode::INVALID_INPUT, where + ".path must be a string"));
            }
            entry.path = item["path"].get<std::string>();
        }
        if (item.contains("sha256") && !item["sha256"].is_null()) {
            if (!item["sha256"].is_string()) {
                return Result<ProjectManifest>::err(manifest_error(ErrorCode::INVALID_INPUT, where + ".sha256 must be a string"));
            }
            entry.sha256 = item["sha256"].get<std::string>();
        }

        manifest.tools.push_back(std::move(entry));
    }

    return Result<ProjectManifest>::ok(manifest);
}

Result<ProjectManifest> load_project_manifest(const std::string& project_dir) {
    std::string path = project_manifest_path(project_dir);
    auto content = read_text_file(path);
    if (!content) {
        return Result<ProjectManifest>::err(Error(ErrorCode::FILE_NOT_FOUND, "project manifest not found: " + path));
    }

    auto parsed = parse_project_manifest(*content);
    if (parsed.isErr()) {
        return Result<ProjectManifest>::err(parsed.error().withContext(path));
    }

    ProjectManifest manifest = parsed.value();
    if (manifest.name.empty()) {
        std::error_code ec;
        auto abs = std::filesystem::absolute(project_dir, ec);
        manifest.name = ec ? get_filename(project_dir) : abs.lexically_normal().filename().string();
    }
    return Result<ProjectManifest>::ok(manifest);
}

Result<std::optional<OfflineConfig>> load_offline_config(const std::string& project_dir) {
    using ConfigResult = Result<std::optional<OfflineConfig>>;

    std::string path = project_config_path(project_dir);
    if (!path_exists(path)) {
        return ConfigResult::ok(std::nullopt);
    }

    auto content = read_text_file(path);
    if (!content) {
        return ConfigResult::err(Error(ErrorCode::IO_ERROR, "failed to read " + path));
    }

    auto j = nlohmann::json::parse(*content, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return ConfigResult::err(Error(ErrorCode::PARSE_ERROR, "project config is not a JSON object: " + path));
    }

    OfflineConfig config;
    for (const char* key : {"offline_mode", "force_offline"}) {
        if (!j.contains(key) || j[key].is_null()) continue;
        if (!j[key].is_boolean()) {
            return ConfigResult::err(Error(ErrorCode::INVALID_INPUT,
                                           std::string(key) + " must be a boolean: " + path));
        }
        bool value = j[key].get<bool>();
        if (std::string(key) == "offline_mode") {
            config.offline_mode = value;
        } else {
            config.force_offline = value;
        }
    }
    return ConfigResult::ok(config);
}

Result<void> write_offline_config(const std::string& project_dir) {
    std::string path = project_config_path(project_dir);

    nlohmann::json config = nlohmann::json::object();
    if (path_exists(path)) {
        auto content = read_text_file(path);
        if (!content) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR, "failed to read " + path));
        }
        config = nlohmann::json::parse(*content, nullptr, false);
        if (config.is_discarded() || !config.is_object()) {
            return Result<void>::err(Error(ErrorCode::PARSE_ERROR,
                                           "existing project config is not a JSON object: " + path));
        }
    }

    config["force_offline"] = true;
    config["offline_mode"] = true;
    config["sealed"] = true;

    if (!create_directories(get_parent_directory(path))) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "failed to create " + get_parent_directory(path)));
    }

    auto written = atomic_write_file(path, config.dump(2) + "\n");
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, written.error));
    }

    spdlog::debug("wrote forced-offline config {}", path);
    return Result<void>::ok();
}

} // namespace toolshed
