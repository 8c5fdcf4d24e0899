#include "toolshed/mirror_manifest.hpp"
#include "toolshed/integrity.hpp"
#include "toolshed/platform.hpp"
#include "toolshed/tool_profiles.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace toolshed {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string indexed(const std::string& code, size_t index) {
    return code + ":" + std::to_string(index);
}

bool is_non_empty_string(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_string() && !trim(j[key].get<std::string>()).empty();
}

// Exactly 1, as an integer or an integral float
bool is_supported_schema_version(const nlohmann::json& v) {
    if (v.is_number_unsigned()) return v.get<uint64_t>() == MIRROR_SCHEMA_VERSION;
    if (v.is_number_integer()) return v.get<int64_t>() == MIRROR_SCHEMA_VERSION;
    if (v.is_number_float()) {
        double d = v.get<double>();
        return std::isfinite(d) && std::floor(d) == d &&
               d == static_cast<double>(MIRROR_SCHEMA_VERSION);
    }
    return false;
}

bool is_positive_integer(const nlohmann::json& v) {
    if (v.is_number_unsigned()) return v.get<uint64_t>() > 0;
    if (v.is_number_integer()) return v.get<int64_t>() > 0;
    return false;
}

void validate_tool_entry(const nlohmann::json& tool, size_t index, std::set<std::string>& errors) {
    if (!tool.is_object()) {
        errors.insert(indexed("tool_not_object", index));
        return;
    }

    if (!is_non_empty_string(tool, "id")) {
        errors.insert(indexed("id_missing", index));
    }
    if (!is_non_empty_string(tool, "version")) {
        errors.insert(indexed("version_missing", index));
    }

    bool has_path = is_non_empty_string(tool, "archive_path");
    bool has_url = is_non_empty_string(tool, "archive_url");
    if (!has_path && !has_url) {
        errors.insert(indexed("archive_source_missing", index));
    } else if (has_path && has_url) {
        errors.insert(indexed("archive_source_conflict", index));
    }

    if (!tool.contains("sha256") || tool["sha256"].is_null()) {
        errors.insert(indexed("sha256_missing", index));
    } else if (!tool["sha256"].is_string() || !is_valid_sha256(tool["sha256"].get<std::string>())) {
        errors.insert(indexed("sha256_invalid", index));
    }

    if (tool.contains("size") && !is_positive_integer(tool["size"])) {
        errors.insert(indexed("size_invalid", index));
    }
    if (tool.contains("size_bytes") && !is_positive_integer(tool["size_bytes"])) {
        errors.insert(indexed("size_bytes_invalid", index));
    }

    if (tool.contains("category") && !is_non_empty_string(tool, "category")) {
        errors.insert(indexed("category_empty", index));
    }
}

} // namespace

std::set<std::string> validate_mirror_manifest(const nlohmann::json& data) {
    std::set<std::string> errors;

    if (!data.is_object()) {
        errors.insert("manifest_not_object");
        return errors;
    }

    if (!data.contains("schema_version")) {
        errors.insert("schema_version_missing");
    } else if (!is_supported_schema_version(data["schema_version"])) {
        errors.insert("schema_version_unsupported");
    }

    if (!data.contains("mirror_name")) {
        errors.insert("mirror_name_missing");
    } else if (!data["mirror_name"].is_string()) {
        errors.insert("mirror_name_invalid");
    } else if (trim(data["mirror_name"].get<std::string>()).empty()) {
        errors.insert("mirror_name_empty");
    }

    if (!data.contains("tools")) {
        errors.insert("tools_missing");
    } else if (!data["tools"].is_array()) {
        errors.insert("tools_not_array");
    } else if (data["tools"].empty()) {
        errors.insert("tools_empty");
    } else {
        const auto& tools = data["tools"];
        for (size_t i = 0; i < tools.size(); ++i) {
            validate_tool_entry(tools[i], i, errors);
        }
    }

    return errors;
}

MirrorManifest mirror_manifest_from_json(const nlohmann::json& data) {
    MirrorManifest manifest;
    manifest.mirror_name = trim(data.value("mirror_name", ""));

    if (!data.contains("tools") || !data["tools"].is_array()) {
        return manifest;
    }

    for (const auto& tool : data["tools"]) {
        if (!tool.is_object()) continue;

        MirrorToolEntry entry;
        entry.id = tool.value("id", "");
        entry.version = tool.value("version", "");
        entry.sha256 = tool.value("sha256", "");

        if (is_non_empty_string(tool, "category")) {
            entry.category = tool["category"].get<std::string>();
        } else {
            entry.category = default_category(entry.id);
        }

        if (is_non_empty_string(tool, "archive_path")) {
            entry.archive_path = tool["archive_path"].get<std::string>();
        }
        if (is_non_empty_string(tool, "archive_url")) {
            entry.archive_url = tool["archive_url"].get<std::string>();
        }

        if (tool.contains("size_bytes") && is_positive_integer(tool["size_bytes"])) {
            entry.size_bytes = tool["size_bytes"].get<uint64_t>();
        } else if (tool.contains("size") && is_positive_integer(tool["size"])) {
            entry.size_bytes = tool["size"].get<uint64_t>();
        }

        manifest.tools.push_back(std::move(entry));
    }

    return manifest;
}

std::string describe_manifest_errors(const std::set<std::string>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += ", ";
        out += e;
    }
    return out;
}

MirrorManifestLoadResult load_mirror_manifest(const std::string& manifest_path) {
    MirrorManifestLoadResult result;
    std::error_code ec;
    auto absolute = std::filesystem::absolute(std::filesystem::path(manifest_path), ec);
    if (!ec) {
        result.mirror_root = to_portable_path(absolute.lexically_normal().parent_path().string());
    }

    std::ifstream file(manifest_path);
    if (!file) {
        result.errors.insert("manifest_unreadable");
        result.error = "mirror manifest unreadable: " + manifest_path;
        return result;
    }
    std::stringstream ss;
    ss << file.rdbuf();

    auto data = nlohmann::json::parse(ss.str(), nullptr, false);
    if (data.is_discarded()) {
        result.errors.insert("manifest_parse_error");
        result.error = "mirror manifest is not valid JSON: " + manifest_path;
        return result;
    }

    result.errors = validate_mirror_manifest(data);
    if (!result.errors.empty()) {
        result.error = "invalid mirror manifest " + manifest_path + ": " +
                       describe_manifest_errors(result.errors);
        spdlog::warn("{}", result.error);
        return result;
    }

    result.manifest = mirror_manifest_from_json(data);
    result.ok = true;
    return result;
}

const MirrorToolEntry* find_mirror_tool(const MirrorManifest& manifest, const ToolReference& ref) {
    for (const auto& entry : manifest.tools) {
        if (entry.id == ref.id && entry.version == ref.version) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace toolshed
