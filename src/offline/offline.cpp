#include "toolshed/offline.hpp"

#include <spdlog/spdlog.h>

namespace toolshed {

OfflineState derive_offline_state(const OfflineConfig* config) {
    if (!config) {
        return OfflineState{false, OfflineReason::Unknown};
    }
    // force_offline wins over offline_mode when both are set
    if (config->force_offline.value_or(false)) {
        return OfflineState{true, OfflineReason::ForceOffline};
    }
    if (config->offline_mode.value_or(false)) {
        return OfflineState{true, OfflineReason::OfflineMode};
    }
    return OfflineState{false, OfflineReason::Disabled};
}

OfflineEnforcer& OfflineEnforcer::instance() {
    static OfflineEnforcer enforcer;
    return enforcer;
}

void OfflineEnforcer::apply(const OfflineConfig* config) {
    publish(derive_offline_state(config));
}

void OfflineEnforcer::reset() {
    publish(OfflineState{false, OfflineReason::Reset});
}

OfflineState OfflineEnforcer::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void OfflineEnforcer::publish(OfflineState next) {
    OfflineState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = state_;
        state_ = next;
    }
    if (previous.active != next.active || previous.reason != next.reason) {
        spdlog::debug("offline gate: {} ({}) -> {} ({})",
                      previous.active ? "offline" : "online",
                      offline_reason_to_string(previous.reason),
                      next.active ? "offline" : "online",
                      offline_reason_to_string(next.reason));
    }
}

NetworkGuardResult OfflineEnforcer::guard_network_call(const std::string& context) const {
    OfflineState current = state();
    NetworkGuardResult result;

    if (current.active) {
        result.error_code = "network_blocked_offline";
        result.message = "network access blocked while offline (" +
                         std::string(offline_reason_to_string(current.reason)) + "): " + context;
        spdlog::warn("{}", result.message);
        return result;
    }
    if (current.reason == OfflineReason::Unknown) {
        result.error_code = "offline_state_unknown";
        result.message = "network access blocked until offline state is initialized: " + context;
        spdlog::warn("{}", result.message);
        return result;
    }

    result.allowed = true;
    return result;
}

} // namespace toolshed
