#pragma once

/**
 * @file offline.hpp
 * @brief Process-wide gate deciding whether network access is permitted
 *
 * The gate starts in Unknown. apply() re-derives it from a configuration,
 * reset() forces Disabled. Readers on any thread get a consistent snapshot:
 * the state is one value and writers replace it whole.
 */

#include "toolshed/types.hpp"

#include <mutex>
#include <string>

namespace toolshed {

enum class OfflineReason {
    Unknown,
    OfflineMode,
    ForceOffline,
    Disabled,
    Reset
};

inline const char* offline_reason_to_string(OfflineReason r) {
    switch (r) {
        case OfflineReason::Unknown: return "unknown";
        case OfflineReason::OfflineMode: return "offline_mode";
        case OfflineReason::ForceOffline: return "force_offline";
        case OfflineReason::Disabled: return "disabled";
        case OfflineReason::Reset: return "reset";
        default: return "unknown";
    }
}

struct OfflineState {
    bool active = false;
    OfflineReason reason = OfflineReason::Unknown;
};

struct NetworkGuardResult {
    bool allowed = false;
    std::string error_code;   // empty when allowed
    std::string message;      // embeds the caller's context when blocked
};

class OfflineEnforcer {
public:
    static OfflineEnforcer& instance();

    // nullptr means "no configuration" and returns the gate to Unknown.
    void apply(const OfflineConfig* config);
    void apply(const OfflineConfig& config) { apply(&config); }

    // Forces Disabled. Intended for test isolation.
    void reset();

    OfflineState state() const;
    bool is_offline() const { return state().active; }
    bool initialized() const { return state().reason != OfflineReason::Unknown; }

    // Blocked while offline, and also while Unknown: an uninitialized gate
    // fails closed.
    NetworkGuardResult guard_network_call(const std::string& context) const;

    OfflineEnforcer(const OfflineEnforcer&) = delete;
    OfflineEnforcer& operator=(const OfflineEnforcer&) = delete;

private:
    OfflineEnforcer() = default;

    void publish(OfflineState next);

    mutable std::mutex mutex_;
    OfflineState state_;
};

// Pure transition used by apply()
OfflineState derive_offline_state(const OfflineConfig* config);

} // namespace toolshed
