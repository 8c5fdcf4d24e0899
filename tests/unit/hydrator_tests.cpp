#include <doctest/doctest.h>
#include <toolshed/hydrator.hpp>

#include "test_helpers.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>

using namespace toolshed;
using nlohmann::json;
using toolshed::testing::make_tar_gz;
using toolshed::testing::make_zip;
using toolshed::testing::OfflineGateGuard;
using toolshed::testing::read_file;
using toolshed::testing::sha256_of;
using toolshed::testing::TempDir;
using toolshed::testing::write_file;

namespace {

// A mirror directory with a manifest and a godot 4.3 zip wrapped in one folder
struct MirrorFixture {
    TempDir temp;
    std::string mirror_dir;
    std::string manifest_path;
    std::string library_dir;
    std::string godot_zip;
    json manifest;

    MirrorFixture() {
        mirror_dir = temp / "mirror";
        manifest_path = mirror_dir + "/manifest.json";
        library_dir = temp / "library";
        godot_zip = mirror_dir + "/archives/godot-4.3.zip";

        fs::create_directories(mirror_dir + "/archives");
        make_zip(temp / "build",
                 {{"Godot_v4.3/Godot_v4.3-stable_linux.x86_64", "godot binary"},
                  {"Godot_v4.3/README.txt", "readme"}},
                 godot_zip);

        manifest = json{
            {"schema_version", 1},
            {"mirror_name", "test-mirror"},
            {"tools", json::array({json{{"id", "godot"},
                                        {"version", "4.3"},
                                        {"archive_path", "archives/godot-4.3.zip"},
                                        {"sha256", sha256_of(godot_zip)}}})},
        };
        save();
    }

    void save() const { write_file(manifest_path, manifest.dump(2)); }

    LibraryManager library() const { return LibraryManager(library_dir); }
};

std::string flip_last_hex(std::string digest) {
    digest.back() = digest.back() == '0' ? '1' : '0';
    return digest;
}

// Copies a local file in place of a download and reports two progress steps
FetchFunction copying_fetch(const std::string& source, std::atomic<int>* calls = nullptr) {
    return [source, calls](const std::string&, const std::string& dest, const FetchProgress& progress) {
        if (calls) (*calls)++;
        FetchResult r;
        uint64_t total = fs::file_size(source);
        if (progress) progress(total / 2, total);
        if (!toolshed::copy_file(source, dest)) {
            r.error = "copy failed";
            return r;
        }
        if (progress) progress(total, total);
        r.ok = true;
        r.http_status = 200;
        r.bytes_written = total;
        return r;
    };
}

} // namespace

// ============================================================================
// Local Hydration
// ============================================================================

TEST_CASE("hydrate installs a tool whose archive matches its digest") {
    MirrorFixture fx;
    MirrorHydrator hydrator(fx.library(), fx.manifest_path);

    auto report = hydrator.hydrate({{"godot", "4.3"}});
    CHECK(report.installed_count == 1);
    CHECK(report.failed_count == 0);
    CHECK(report.success());
    CHECK(fx.library().tool_exists("godot", "4.3"));

    // The single wrapping folder is stripped
    CHECK(fs::exists(fx.library().tool_path("godot", "4.3") + "/Godot_v4.3-stable_linux.x86_64"));
    CHECK(fs::exists(fx.library().tool_path("godot", "4.3") + "/README.txt"));

    // The mirror is never modified and staging is cleaned up
    CHECK(fs::exists(fx.godot_zip));
    CHECK(fs::is_empty(fx.library().staging_root()));

    auto record = fx.library().read_install_record({"godot", "4.3"});
    REQUIRE(record.isOk());
    CHECK(record.value().provenance.sha256 == sha256_of(fx.godot_zip));
    CHECK(record.value().provenance.mirror_name == "test-mirror");
}

TEST_CASE("hydrate refuses to extract when the digest differs") {
    MirrorFixture fx;
    fx.manifest["tools"][0]["sha256"] = flip_last_hex(sha256_of(fx.godot_zip));
    fx.save();

    MirrorHydrator hydrator(fx.library(), fx.manifest_path);
    auto report = hydrator.hydrate({{"godot", "4.3"}});

    CHECK(report.installed_count == 0);
    CHECK(report.failed_count == 1);
    REQUIRE(report.failed_tools.size() == 1);
    CHECK(report.failed_tools[0] == ToolReference{"godot", "4.3"});
    CHECK(report.outcomes[0].message.find("mismatch") != std::string::npos);
    CHECK_FALSE(fx.library().tool_exists("godot", "4.3"));
    CHECK_FALSE(fs::exists(fx.library_dir + "/godot/4.3"));
}

TEST_CASE("already installed tools succeed without touching the mirror") {
    MirrorFixture fx;
    write_file(fx.library_dir + "/godot/4.3/godot", "previously installed");
    fs::remove(fx.godot_zip);

    MirrorHydrator hydrator(fx.library(), fx.manifest_path);
    auto report = hydrator.hydrate({{"godot", "4.3"}});
    CHECK(report.installed_count == 1);
    CHECK(report.outcomes[0].message == "already installed");
    CHECK(read_file(fx.library_dir + "/godot/4.3/godot") == "previously installed");
}

TEST_CASE("a tool missing from the mirror fails alone") {
    MirrorFixture fx;
    MirrorHydrator hydrator(fx.library(), fx.manifest_path);

    auto report = hydrator.hydrate({{"krita", "5.2"}, {"godot", "4.3"}});
    CHECK(report.installed_count == 1);
    CHECK(report.failed_count == 1);
    REQUIRE(report.failed_tools.size() == 1);
    CHECK(report.failed_tools[0] == ToolReference{"krita", "5.2"});
    CHECK(fx.library().tool_exists("godot", "4.3"));
}

TEST_CASE("an invalid manifest fails every requested tool identically") {
    MirrorFixture fx;
    fx.manifest["schema_version"] = 2;
    fx.save();

    MirrorHydrator hydrator(fx.library(), fx.manifest_path);
    auto report = hydrator.hydrate({{"godot", "4.3"}, {"blender", "4.1"}});
    CHECK(report.failed_count == 2);
    REQUIRE(report.outcomes.size() == 2);
    CHECK(report.outcomes[0].message == report.outcomes[1].message);
    CHECK(report.outcomes[0].message.find("schema_version_unsupported") != std::string::npos);
}

TEST_CASE("the manifest is re-read on every batch") {
    MirrorFixture fx;
    fx.manifest["schema_version"] = 2;
    fx.save();

    MirrorHydrator hydrator(fx.library(), fx.manifest_path);
    CHECK(hydrator.hydrate({{"godot", "4.3"}}).failed_count == 1);

    fx.manifest["schema_version"] = 1;
    fx.save();
    CHECK(hydrator.hydrate({{"godot", "4.3"}}).installed_count == 1);
}

TEST_CASE("archive paths escaping the mirror root fail") {
    MirrorFixture fx;
    write_file(fx.temp / "outside.zip", "not in the mirror");
    fx.manifest["tools"][0]["archive_path"] = "../outside.zip";
    fx.save();

    MirrorHydrator hydrator(fx.library(), fx.manifest_path);
    auto report = hydrator.hydrate({{"godot", "4.3"}});
    CHECK(report.failed_count == 1);
    CHECK(report.outcomes[0].message.find("path_traversal") != std::string::npos);
}

TEST_CASE("a missing archive file fails") {
    MirrorFixture fx;
    fs::remove(fx.godot_zip);

    MirrorHydrator hydrator(fx.library(), fx.manifest_path);
    auto report = hydrator.hydrate({{"godot", "4.3"}});
    CHECK(report.failed_count == 1);
    CHECK(report.outcomes[0].message.find("archive not found") != std::string::npos);
}

TEST_CASE("the local hydrator does not download") {
    MirrorFixture fx;
    fx.manifest["tools"][0].erase("archive_path");
    fx.manifest["tools"][0]["archive_url"] = "https://mirror.example/godot.zip";
    fx.save();

    MirrorHydrator hydrator(fx.library(), fx.manifest_path);
    auto report = hydrator.hydrate({{"godot", "4.3"}});
    CHECK(report.failed_count == 1);
    CHECK(report.outcomes[0].message.find("remote-only") != std::string::npos);
}

TEST_CASE("tar.gz archives install") {
    MirrorFixture fx;
    std::string tarball = fx.mirror_dir + "/archives/blender-4.1.tar.gz";
    REQUIRE(make_tar_gz({{"blender-4.1/", ""}, {"blender-4.1/blender", "ELF", 0, 0755}}, tarball));
    fx.manifest["tools"].push_back(json{{"id", "blender"},
                                        {"version", "4.1"},
                                        {"archive_path", "archives/blender-4.1.tar.gz"},
                                        {"sha256", sha256_of(tarball)}});
    fx.save();

    MirrorHydrator hydrator(fx.library(), fx.manifest_path);
    auto report = hydrator.hydrate({{"blender", "4.1"}});
    CHECK(report.installed_count == 1);
    CHECK(is_executable_file(fx.library().tool_path("blender", "4.1") + "/blender"));
}

TEST_CASE("an unresolved library root fails the batch") {
    MirrorFixture fx;
    MirrorHydrator hydrator(LibraryManager(""), fx.manifest_path);
    auto report = hydrator.hydrate({{"godot", "4.3"}});
    CHECK(report.failed_count == 1);
    CHECK(report.outcomes[0].message.find("unresolved") != std::string::npos);
}

// ============================================================================
// Background Hydration
// ============================================================================

TEST_CASE("hydrate_async delivers events only through poll_events") {
    MirrorFixture fx;
    MirrorHydrator hydrator(fx.library(), fx.manifest_path);

    std::vector<std::string> log;
    bool finished_ok = false;
    std::vector<ToolReference> finished_failed;

    HydrationEvents events;
    events.on_install_started = [&](const ToolReference& ref) { log.push_back("start " + ref.to_string()); };
    events.on_install_completed = [&](const ToolReference& ref, bool ok, const std::string&) {
        log.push_back(std::string(ok ? "ok " : "fail ") + ref.to_string());
    };
    events.on_hydration_completed = [&](bool ok, const std::vector<ToolReference>& failed) {
        log.push_back("done");
        finished_ok = ok;
        finished_failed = failed;
    };

    REQUIRE(hydrator.hydrate_async({{"godot", "4.3"}, {"krita", "5.2"}}, events) == AsyncStartStatus::Started);
    hydrator.wait();
    CHECK(log.empty());

    CHECK(hydrator.poll_events() == 5);
    REQUIRE(log.size() == 5);
    CHECK(log[0] == "start godot@4.3");
    CHECK(log[1] == "ok godot@4.3");
    CHECK(log[2] == "start krita@5.2");
    CHECK(log[3] == "fail krita@5.2");
    CHECK(log[4] == "done");
    CHECK_FALSE(finished_ok);
    REQUIRE(finished_failed.size() == 1);
    CHECK(finished_failed[0] == ToolReference{"krita", "5.2"});

    auto report = hydrator.last_report();
    CHECK(report.installed_count == 1);
    CHECK(report.failed_count == 1);
    CHECK_FALSE(hydrator.is_running());
}

TEST_CASE("a second start while running is reported, not queued") {
    MirrorFixture fx;
    OfflineGateGuard gate;
    fx.manifest["tools"][0].erase("archive_path");
    fx.manifest["tools"][0]["archive_url"] = "https://mirror.example/godot-4.3.zip";
    fx.save();

    std::mutex m;
    std::condition_variable cv;
    bool released = false;
    auto inner = copying_fetch(fx.godot_zip);
    FetchFunction blocking = [&](const std::string& url, const std::string& dest, const FetchProgress& p) {
        std::unique_lock<std::mutex> lock(m);
        cv.wait(lock, [&] { return released; });
        return inner(url, dest, p);
    };

    RemoteMirrorHydrator hydrator(fx.library(), fx.manifest_path, blocking);
    REQUIRE(hydrator.hydrate_async({{"godot", "4.3"}}, {}) == AsyncStartStatus::Started);
    CHECK(hydrator.is_running());
    CHECK(hydrator.hydrate_async({{"godot", "4.3"}}, {}) == AsyncStartStatus::AlreadyRunning);

    {
        std::lock_guard<std::mutex> lock(m);
        released = true;
    }
    cv.notify_all();
    hydrator.wait();

    CHECK(hydrator.last_report().installed_count == 1);
    CHECK(fx.library().tool_exists("godot", "4.3"));
}

TEST_CASE("cancel suppresses further notifications") {
    MirrorFixture fx;
    MirrorHydrator hydrator(fx.library(), fx.manifest_path);

    int callbacks = 0;
    HydrationEvents events;
    events.on_install_started = [&](const ToolReference&) { callbacks++; };
    events.on_install_completed = [&](const ToolReference&, bool, const std::string&) { callbacks++; };
    events.on_hydration_completed = [&](bool, const std::vector<ToolReference>&) { callbacks++; };

    REQUIRE(hydrator.hydrate_async({{"godot", "4.3"}}, events) == AsyncStartStatus::Started);
    hydrator.cancel();
    hydrator.wait();

    CHECK(hydrator.poll_events() == 0);
    CHECK(callbacks == 0);
}

// ============================================================================
// Remote Hydration
// ============================================================================

TEST_CASE("remote hydration downloads, verifies and reports progress") {
    MirrorFixture fx;
    OfflineGateGuard gate;
    fx.manifest["tools"][0].erase("archive_path");
    fx.manifest["tools"][0]["archive_url"] = "https://mirror.example/dl/godot-4.3.zip?token=abc";
    fx.manifest["tools"][0]["size_bytes"] = 4096;
    fx.save();

    std::atomic<int> calls{0};
    RemoteMirrorHydrator hydrator(fx.library(), fx.manifest_path, copying_fetch(fx.godot_zip, &calls));

    std::vector<std::pair<uint64_t, uint64_t>> progress;
    HydrationEvents events;
    events.on_install_progress = [&](const ToolReference&, uint64_t done, uint64_t total) {
        progress.emplace_back(done, total);
    };

    REQUIRE(hydrator.hydrate_async({{"godot", "4.3"}}, events) == AsyncStartStatus::Started);
    hydrator.wait();
    hydrator.poll_events();

    CHECK(calls.load() == 1);
    CHECK(hydrator.last_report().installed_count == 1);
    REQUIRE(progress.size() == 2);
    CHECK(progress[1].first == progress[1].second);

    auto record = fx.library().read_install_record({"godot", "4.3"});
    REQUIRE(record.isOk());
    CHECK(record.value().provenance.source == "https://mirror.example/dl/godot-4.3.zip?token=abc");
}

TEST_CASE("remote hydration refuses a download with the wrong digest") {
    MirrorFixture fx;
    OfflineGateGuard gate;
    fx.manifest["tools"][0].erase("archive_path");
    fx.manifest["tools"][0]["archive_url"] = "https://mirror.example/godot-4.3.zip";
    fx.manifest["tools"][0]["sha256"] = flip_last_hex(sha256_of(fx.godot_zip));
    fx.save();

    RemoteMirrorHydrator hydrator(fx.library(), fx.manifest_path, copying_fetch(fx.godot_zip));
    auto report = hydrator.hydrate({{"godot", "4.3"}});
    CHECK(report.failed_count == 1);
    CHECK_FALSE(fx.library().tool_exists("godot", "4.3"));
}

TEST_CASE("remote hydration fails everything while offline") {
    MirrorFixture fx;
    OfflineGateGuard gate;
    std::atomic<int> calls{0};

    OfflineConfig offline;
    offline.force_offline = true;
    OfflineEnforcer::instance().apply(offline);

    RemoteMirrorHydrator hydrator(fx.library(), fx.manifest_path, copying_fetch(fx.godot_zip, &calls));
    auto report = hydrator.hydrate({{"godot", "4.3"}, {"blender", "4.1"}});
    CHECK(report.failed_count == 2);
    CHECK(report.installed_count == 0);
    CHECK(report.outcomes[0].message.find("offline") != std::string::npos);
    CHECK(calls.load() == 0);
    CHECK_FALSE(fx.library().tool_exists("godot", "4.3"));
}

TEST_CASE("remote hydration fails closed when the gate was never initialized") {
    MirrorFixture fx;
    OfflineGateGuard gate;
    fx.manifest["tools"][0].erase("archive_path");
    fx.manifest["tools"][0]["archive_url"] = "https://mirror.example/godot-4.3.zip";
    fx.save();

    std::atomic<int> calls{0};
    OfflineEnforcer::instance().apply(nullptr);

    RemoteMirrorHydrator hydrator(fx.library(), fx.manifest_path, copying_fetch(fx.godot_zip, &calls));
    auto report = hydrator.hydrate({{"godot", "4.3"}});
    CHECK(report.failed_count == 1);
    CHECK(report.outcomes[0].message.find("offline_state_unknown") != std::string::npos);
    CHECK(calls.load() == 0);
}

TEST_CASE("remote hydrator installs local entries without downloading") {
    MirrorFixture fx;
    OfflineGateGuard gate;
    std::atomic<int> calls{0};

    RemoteMirrorHydrator hydrator(fx.library(), fx.manifest_path, copying_fetch(fx.godot_zip, &calls));
    auto report = hydrator.hydrate({{"godot", "4.3"}});
    CHECK(report.installed_count == 1);
    CHECK(calls.load() == 0);
}

TEST_CASE("concurrent hydrators install the same tool once") {
    MirrorFixture fx;
    MirrorHydrator a(fx.library(), fx.manifest_path);
    MirrorHydrator b(fx.library(), fx.manifest_path);

    REQUIRE(a.hydrate_async({{"godot", "4.3"}}, {}) == AsyncStartStatus::Started);
    REQUIRE(b.hydrate_async({{"godot", "4.3"}}, {}) == AsyncStartStatus::Started);
    a.wait();
    b.wait();

    CHECK(a.last_report().installed_count == 1);
    CHECK(b.last_report().installed_count == 1);
    bool one_skipped = a.last_report().outcomes[0].message == "already installed" ||
                       b.last_report().outcomes[0].message == "already installed";
    CHECK(one_skipped);
    CHECK(fx.library().tool_exists("godot", "4.3"));
}
