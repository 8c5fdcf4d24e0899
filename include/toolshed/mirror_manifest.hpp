#pragma once

#include "toolshed/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace toolshed {

// ============================================================================
// Mirror Manifest
// ============================================================================

constexpr int MIRROR_SCHEMA_VERSION = 1;

struct MirrorToolEntry {
    std::string id;
    std::string version;
    std::string category;                 // declared, or from the tool table
    std::optional<std::string> archive_path;  // relative to the mirror root
    std::optional<std::string> archive_url;
    std::string sha256;                   // 64 lowercase hex
    std::optional<uint64_t> size_bytes;   // from "size_bytes" or "size"

    ToolReference ref() const { return {id, version}; }
    bool is_remote() const { return archive_url.has_value(); }
};

struct MirrorManifest {
    int schema_version = MIRROR_SCHEMA_VERSION;
    std::string mirror_name;
    std::vector<MirrorToolEntry> tools;
};

// Validate a parsed manifest document. Every violation is collected; codes
// have the form <field>_<problem>[:index], e.g. "sha256_invalid:2".
std::set<std::string> validate_mirror_manifest(const nlohmann::json& data);

// Convert an already validated document into the typed manifest.
MirrorManifest mirror_manifest_from_json(const nlohmann::json& data);

struct MirrorManifestLoadResult {
    bool ok = false;
    std::set<std::string> errors;
    std::string error;          // display summary of errors
    MirrorManifest manifest;
    std::string mirror_root;    // directory containing the manifest file
};

// Read, parse and validate a manifest file. Always reads from disk.
MirrorManifestLoadResult load_mirror_manifest(const std::string& manifest_path);

const MirrorToolEntry* find_mirror_tool(const MirrorManifest& manifest, const ToolReference& ref);

// Join error codes into one deterministic display string.
std::string describe_manifest_errors(const std::set<std::string>& errors);

} // namespace toolshed
