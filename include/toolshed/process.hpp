#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolshed {

// ============================================================================
// Process Spawning
// ============================================================================

struct SpawnRequest {
    std::string executable;
    std::vector<std::string> arguments;          // argv[1..]
    std::string working_directory;               // empty: inherit
    std::unordered_map<std::string, std::string> extra_environment;
};

struct SpawnResult {
    bool ok = false;
    int64_t pid = -1;
    std::string error;
};

// Start the process without waiting for it. Output is inherited; capturing
// it belongs to whoever supervises the child.
SpawnResult spawn_detached(const SpawnRequest& request);

} // namespace toolshed
