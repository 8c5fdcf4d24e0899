#include <doctest/doctest.h>
#include <toolshed/offline.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace toolshed;

namespace {

OfflineConfig config(std::optional<bool> offline_mode, std::optional<bool> force_offline) {
    OfflineConfig c;
    c.offline_mode = offline_mode;
    c.force_offline = force_offline;
    return c;
}

} // namespace

// ============================================================================
// Transitions
// ============================================================================

TEST_CASE("derive_offline_state transition table") {
    SUBCASE("no configuration is unknown") {
        auto s = derive_offline_state(nullptr);
        CHECK_FALSE(s.active);
        CHECK(s.reason == OfflineReason::Unknown);
    }
    SUBCASE("force_offline wins regardless of offline_mode") {
        auto a = config(false, true);
        auto b = config(true, true);
        auto c = config(std::nullopt, true);
        CHECK(derive_offline_state(&a).reason == OfflineReason::ForceOffline);
        CHECK(derive_offline_state(&b).reason == OfflineReason::ForceOffline);
        CHECK(derive_offline_state(&c).active);
    }
    SUBCASE("offline_mode alone") {
        auto c = config(true, false);
        auto s = derive_offline_state(&c);
        CHECK(s.active);
        CHECK(s.reason == OfflineReason::OfflineMode);
    }
    SUBCASE("both false is disabled") {
        auto c = config(false, false);
        auto s = derive_offline_state(&c);
        CHECK_FALSE(s.active);
        CHECK(s.reason == OfflineReason::Disabled);
    }
    SUBCASE("unset flags count as false") {
        OfflineConfig c;
        CHECK(derive_offline_state(&c).reason == OfflineReason::Disabled);
    }
}

TEST_CASE("OfflineEnforcer apply and reset") {
    auto& gate = OfflineEnforcer::instance();

    gate.apply(nullptr);
    CHECK_FALSE(gate.is_offline());
    CHECK_FALSE(gate.initialized());
    CHECK(std::string(offline_reason_to_string(gate.state().reason)) == "unknown");

    gate.apply(config(false, true));
    CHECK(gate.is_offline());
    CHECK(gate.state().reason == OfflineReason::ForceOffline);

    gate.apply(config(false, false));
    CHECK_FALSE(gate.is_offline());
    CHECK(std::string(offline_reason_to_string(gate.state().reason)) == "disabled");

    gate.apply(config(true, false));
    CHECK(gate.is_offline());

    gate.reset();
    CHECK_FALSE(gate.is_offline());
    CHECK(gate.initialized());
    CHECK(gate.state().reason == OfflineReason::Reset);
}

// ============================================================================
// Network Guard
// ============================================================================

TEST_CASE("guard_network_call blocks while offline and embeds the context") {
    auto& gate = OfflineEnforcer::instance();
    gate.apply(config(true, false));

    auto r = gate.guard_network_call("fetch godot@4.3");
    CHECK_FALSE(r.allowed);
    CHECK(r.error_code == "network_blocked_offline");
    CHECK(r.message.find("fetch godot@4.3") != std::string::npos);
    CHECK(r.message.find("offline_mode") != std::string::npos);

    gate.reset();
}

TEST_CASE("guard_network_call fails closed before initialization") {
    auto& gate = OfflineEnforcer::instance();
    gate.apply(nullptr);

    auto r = gate.guard_network_call("update check");
    CHECK_FALSE(r.allowed);
    CHECK(r.error_code == "offline_state_unknown");
    CHECK(r.message.find("update check") != std::string::npos);

    gate.reset();
}

TEST_CASE("guard_network_call allows traffic when disabled") {
    auto& gate = OfflineEnforcer::instance();
    gate.apply(config(false, false));

    auto r = gate.guard_network_call("fetch");
    CHECK(r.allowed);
    CHECK(r.error_code.empty());

    gate.reset();
    CHECK(gate.guard_network_call("fetch").allowed);
}

TEST_CASE("concurrent readers always see a consistent state") {
    auto& gate = OfflineEnforcer::instance();
    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&]() {
            while (!stop.load()) {
                OfflineState s = gate.state();
                bool expected_active = s.reason == OfflineReason::ForceOffline ||
                                       s.reason == OfflineReason::OfflineMode;
                if (s.active != expected_active) {
                    torn++;
                }
            }
        });
    }

    for (int i = 0; i < 2000; ++i) {
        gate.apply(config(false, i % 2 == 0));
        gate.apply(config(i % 3 == 0, false));
    }
    stop = true;
    for (auto& t : readers) t.join();

    CHECK(torn.load() == 0);
    gate.reset();
}
