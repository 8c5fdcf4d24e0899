#include <doctest/doctest.h>
#include <toolshed/archive.hpp>
#include <toolshed/hydrator.hpp>
#include <toolshed/launcher.hpp>
#include <toolshed/offline.hpp>
#include <toolshed/project.hpp>
#include <toolshed/sealer.hpp>

#include "test_helpers.hpp"

using namespace toolshed;
using nlohmann::json;
using toolshed::testing::make_executable;
using toolshed::testing::OfflineGateGuard;
using toolshed::testing::read_file;
using toolshed::testing::sha256_of;
using toolshed::testing::TempDir;
using toolshed::testing::write_file;

// Mirror -> library -> sealed archive -> unpacked elsewhere -> offline launch
TEST_CASE("a sealed project launches its embedded tool offline") {
    TempDir temp;
    OfflineGateGuard gate;

    std::string mirror_dir = temp / "mirror";
    std::string staging = temp / "build";
    write_file(staging + "/Godot_v4.3/Godot_v4.3-stable_linux.x86_64", "godot binary");
    make_executable(staging + "/Godot_v4.3/Godot_v4.3-stable_linux.x86_64");
    write_file(staging + "/Godot_v4.3/README.txt", "readme");

    std::string archive = mirror_dir + "/archives/godot-4.3.zip";
    fs::create_directories(mirror_dir + "/archives");
    auto zipped = write_zip_archive(
        staging, {"Godot_v4.3/Godot_v4.3-stable_linux.x86_64", "Godot_v4.3/README.txt"}, archive);
    REQUIRE(zipped.ok);

    json manifest{
        {"schema_version", 1},
        {"mirror_name", "studio"},
        {"tools", json::array({json{{"id", "godot"},
                                    {"version", "4.3"},
                                    {"archive_path", "archives/godot-4.3.zip"},
                                    {"sha256", sha256_of(archive)}}})},
    };
    write_file(mirror_dir + "/manifest.json", manifest.dump(2));

    LibraryManager library(temp / "library");
    MirrorHydrator hydrator(library, mirror_dir + "/manifest.json");
    auto report = hydrator.hydrate({{"godot", "4.3"}});
    REQUIRE(report.success());
    REQUIRE(library.tool_exists({"godot", "4.3"}));

    std::string project = temp / "workspace/space-game";
    write_file(project + "/toolshed.json",
               R"({"name": "space-game", "tools": [{"id": "godot", "version": "4.3"}]})");
    write_file(project + "/project.godot", "config_version=5");

    ProjectSealer sealer(library);
    auto sealed = sealer.seal(project);
    REQUIRE(sealed.success);

    std::string delivered = temp / "delivered";
    auto extracted = extract_zip(sealed.sealed_archive_path, delivered);
    REQUIRE(extracted.ok);

    auto config = load_offline_config(delivered);
    REQUIRE(config.isOk());
    REQUIRE(config.value().has_value());
    OfflineEnforcer::instance().apply(*config.value());
    REQUIRE(OfflineEnforcer::instance().is_offline());

    // The library is gone on the delivery machine
    std::vector<SpawnRequest> spawned;
    ToolLauncher launcher(LibraryManager(temp / "empty-library"), [&spawned](const SpawnRequest& request) {
        spawned.push_back(request);
        SpawnResult r;
        r.ok = true;
        r.pid = 4242;
        return r;
    });

    auto manifest_loaded = load_project_manifest(delivered);
    REQUIRE(manifest_loaded.isOk());
    auto launched = launcher.launch(manifest_loaded.value().tools[0], delivered);
    REQUIRE(launched.ok);
    CHECK(launched.pid.value() == 4242);

    REQUIRE(spawned.size() == 1);
    CHECK(get_filename(spawned[0].executable) == "Godot_v4.3-stable_linux.x86_64");
    CHECK(spawned[0].executable.find("/tools/godot_4.3/") != std::string::npos);
    CHECK(spawned[0].extra_environment.at("TOOLSHED_OFFLINE") == "1");
    CHECK(read_file(spawned[0].executable) == "godot binary");

    // Remote hydration is refused once the gate is closed
    RemoteMirrorHydrator remote(library, mirror_dir + "/manifest.json");
    auto refused = remote.hydrate({{"krita", "5.2"}});
    CHECK_FALSE(refused.success());
    CHECK(refused.failed_tools.size() == 1);
}
