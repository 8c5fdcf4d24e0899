#include <doctest/doctest.h>
#include <toolshed/archive.hpp>
#include <toolshed/sealer.hpp>

#include "test_helpers.hpp"

#include <algorithm>

using namespace toolshed;
using toolshed::testing::make_executable;
using toolshed::testing::read_file;
using toolshed::testing::TempDir;
using toolshed::testing::write_file;

namespace {

struct SealFixture {
    TempDir temp;
    std::string project;
    std::string library_dir;

    SealFixture() {
        project = temp / "workspace/space-game";
        library_dir = temp / "library";
        write_file(project + "/scenes/main.tscn", "[gd_scene]");
        write_file(project + "/project.godot", "config_version=5");
    }

    void manifest(const std::string& tools_json) const {
        write_file(project + "/toolshed.json", R"({"name": "space-game", "tools": )" + tools_json + "}");
    }

    void install(const std::string& id, const std::string& version) const {
        std::string dir = library_dir + "/" + id + "/" + version;
        write_file(dir + "/" + id, "binary of " + id);
        make_executable(dir + "/" + id);
        write_file(dir + "/share/data/readme.txt", "docs");
    }

    LibraryManager library() const { return LibraryManager(library_dir); }
};

} // namespace

// ============================================================================
// Validate
// ============================================================================

TEST_CASE("validate reports every missing tool") {
    SealFixture fx;
    fx.install("godot", "4.3");
    fx.manifest(R"([{"id": "godot", "version": "4.3"},
                    {"id": "krita", "version": "5.2"},
                    {"id": "audacity", "version": "3.4"}])");

    ProjectSealer sealer(fx.library());
    auto v = sealer.validate(fx.project);
    CHECK_FALSE(v.ok);
    REQUIRE(v.errors.size() == 2);
    CHECK(v.errors[0] == "tool not in library: krita@5.2");
    CHECK(v.errors[1] == "tool not in library: audacity@3.4");
}

TEST_CASE("validate requires the project directory and manifest") {
    SealFixture fx;
    ProjectSealer sealer(fx.library());

    auto no_dir = sealer.validate(fx.temp / "nowhere");
    CHECK_FALSE(no_dir.ok);
    CHECK(no_dir.errors[0].find("project directory not found") != std::string::npos);

    auto no_manifest = sealer.validate(fx.project);
    CHECK_FALSE(no_manifest.ok);
    CHECK(no_manifest.errors[0].find("project manifest not found") != std::string::npos);
}

TEST_CASE("validate skips tools declared with an explicit project path") {
    SealFixture fx;
    fx.manifest(R"([{"id": "aseprite", "version": "1.3", "path": "bin/aseprite"}])");
    ProjectSealer sealer(fx.library());
    CHECK(sealer.validate(fx.project).ok);
}

// ============================================================================
// Copy
// ============================================================================

TEST_CASE("copy_tools embeds each tool under id_version") {
    SealFixture fx;
    fx.install("godot", "4.3");
    fx.install("blender", "4.1");

    ProjectSealer sealer(fx.library());
    std::vector<ProjectToolEntry> tools(2);
    tools[0].id = "godot";
    tools[0].version = "4.3";
    tools[1].id = "blender";
    tools[1].version = "4.1";

    auto copied = sealer.copy_tools(fx.project, tools);
    REQUIRE(copied.ok);
    CHECK(copied.tools_copied == std::vector<std::string>{"godot@4.3", "blender@4.1"});
    CHECK(read_file(fx.project + "/tools/godot_4.3/godot") == "binary of godot");
    CHECK(read_file(fx.project + "/tools/blender_4.1/share/data/readme.txt") == "docs");
    CHECK(is_executable_file(fx.project + "/tools/godot_4.3/godot"));
    CHECK_FALSE(fs::exists(fx.project + "/tools/godot_4.3.partial"));
}

TEST_CASE("one failed copy does not stop the others") {
    SealFixture fx;
    fx.install("godot", "4.3");

    ProjectSealer sealer(fx.library());
    std::vector<ProjectToolEntry> tools(2);
    tools[0].id = "krita";
    tools[0].version = "5.2";
    tools[1].id = "godot";
    tools[1].version = "4.3";

    auto copied = sealer.copy_tools(fx.project, tools);
    CHECK_FALSE(copied.ok);
    REQUIRE(copied.errors.size() == 1);
    CHECK(copied.errors[0].find("krita@5.2") != std::string::npos);
    CHECK(copied.tools_copied == std::vector<std::string>{"godot@4.3"});
    CHECK_FALSE(fs::exists(fx.project + "/tools/krita_5.2"));
    CHECK_FALSE(fs::exists(fx.project + "/tools/krita_5.2.partial"));
}

TEST_CASE("copy_directory_tree copies deep trees") {
    TempDir temp;
    std::string deep = temp / "src";
    for (int i = 0; i < 40; ++i) {
        deep += "/d" + std::to_string(i);
    }
    write_file(deep + "/leaf.txt", "leaf");
    write_file(temp / "src/top.txt", "top");

    std::string error;
    REQUIRE(copy_directory_tree(temp / "src", temp / "dst", error));
    CHECK(error.empty());
    CHECK(read_file(temp / "dst/top.txt") == "top");

    std::string copied_leaf = deep.replace(deep.find("/src/"), 5, "/dst/") + "/leaf.txt";
    CHECK(read_file(copied_leaf) == "leaf");
}

TEST_CASE("copy_directory_tree reports a missing source") {
    TempDir temp;
    std::string error;
    CHECK_FALSE(copy_directory_tree(temp / "missing", temp / "dst", error));
    CHECK(error.find("missing") != std::string::npos);
}

// ============================================================================
// Archive
// ============================================================================

TEST_CASE("enumerate_project_files is sorted and relative") {
    SealFixture fx;
    fx.manifest("[]");
    write_file(fx.project + "/assets/b.png", "b");
    write_file(fx.project + "/assets/a.png", "a");

    auto files = enumerate_project_files(fx.project);
    std::vector<std::string> expected{"assets/a.png", "assets/b.png", "project.godot",
                                      "scenes/main.tscn", "toolshed.json"};
    CHECK(files == expected);

    auto without = enumerate_project_files(fx.project, {fx.project + "/project.godot"});
    CHECK(std::find(without.begin(), without.end(), "project.godot") == without.end());
}

TEST_CASE("archive_project replaces an existing archive") {
    SealFixture fx;
    fx.manifest("[]");
    std::string out = fx.temp / "out.zip";
    write_file(out, "old content");

    auto archived = archive_project(fx.project, out);
    REQUIRE(archived.ok);
    CHECK(archived.size_bytes == fs::file_size(out));

    auto extracted = extract_zip(out, fx.temp / "check");
    REQUIRE(extracted.ok);
    CHECK(read_file(fx.temp / "check/scenes/main.tscn") == "[gd_scene]");
}

TEST_CASE("sealed_archive_path never returns an existing file") {
    SealFixture fx;
    std::string first = sealed_archive_path(fx.project, fx.temp / "workspace");
    CHECK(get_filename(first).rfind("space-game_Sealed_", 0) == 0);
    CHECK(first.size() > 4);
    CHECK(first.substr(first.size() - 4) == ".zip");

    write_file(first, "taken");
    std::string second = sealed_archive_path(fx.project, fx.temp / "workspace");
    CHECK(second != first);
    CHECK_FALSE(fs::exists(second));
}

// ============================================================================
// Seal
// ============================================================================

TEST_CASE("sealing with a tool missing from the library changes nothing") {
    SealFixture fx;
    fx.manifest(R"([{"id": "godot", "version": "4.3"}])");

    ProjectSealer sealer(fx.library());
    auto result = sealer.seal(fx.project);

    CHECK_FALSE(result.success);
    REQUIRE_FALSE(result.errors.empty());
    CHECK(result.errors[0].find("godot@4.3") != std::string::npos);
    CHECK(result.sealed_archive_path.empty());
    CHECK_FALSE(fs::exists(fx.project + "/tools"));
    CHECK_FALSE(fs::exists(project_config_path(fx.project)));
    CHECK(fs::is_empty(fx.temp / "workspace") == false);
    for (const auto& name : list_directory(fx.temp / "workspace")) {
        CHECK(name.find("_Sealed_") == std::string::npos);
    }
}

TEST_CASE("sealing a valid project produces an archive with tools and config") {
    SealFixture fx;
    fx.install("godot", "4.3");
    fx.manifest(R"([{"id": "godot", "version": "4.3"}])");

    ProjectSealer sealer(fx.library());
    auto result = sealer.seal(fx.project);

    REQUIRE(result.success);
    CHECK(result.errors.empty());
    CHECK(result.tools_copied == std::vector<std::string>{"godot@4.3"});
    CHECK(get_parent_directory(result.sealed_archive_path) == fx.temp / "workspace");
    CHECK(result.size_mb > 0.0);

    auto extracted = extract_zip(result.sealed_archive_path, fx.temp / "unpacked");
    REQUIRE(extracted.ok);
    CHECK(read_file(fx.temp / "unpacked/tools/godot_4.3/godot") == "binary of godot");
    CHECK(fs::exists(fx.temp / "unpacked/.toolshed/config.json"));
    CHECK(fs::exists(fx.temp / "unpacked/toolshed.json"));
}

TEST_CASE("sealing honours an output directory") {
    SealFixture fx;
    fx.manifest("[]");

    SealOptions options;
    options.output_dir = fx.temp / "deliveries";

    ProjectSealer sealer(fx.library());
    auto result = sealer.seal(fx.project, options);
    REQUIRE(result.success);
    CHECK(get_parent_directory(result.sealed_archive_path) == fx.temp / "deliveries");
    CHECK(fs::exists(result.sealed_archive_path));
}

TEST_CASE("sealing the same project twice yields two distinct archives") {
    SealFixture fx;
    fx.install("godot", "4.3");
    fx.manifest(R"([{"id": "godot", "version": "4.3"}])");

    ProjectSealer sealer(fx.library());
    auto first = sealer.seal(fx.project);
    REQUIRE(first.success);
    std::string config_after_first = read_file(project_config_path(fx.project));

    auto second = sealer.seal(fx.project);
    REQUIRE(second.success);
    std::string config_after_second = read_file(project_config_path(fx.project));

    CHECK(first.sealed_archive_path != second.sealed_archive_path);
    CHECK(fs::exists(first.sealed_archive_path));
    CHECK(fs::exists(second.sealed_archive_path));
    CHECK_FALSE(config_after_first.empty());
    CHECK(config_after_first == config_after_second);
    CHECK(second.tools_copied == std::vector<std::string>{"godot@4.3"});

    auto extracted = extract_zip(second.sealed_archive_path, fx.temp / "unpacked");
    REQUIRE(extracted.ok);
    CHECK(read_file(fx.temp / "unpacked/tools/godot_4.3/godot") == "binary of godot");
    CHECK_FALSE(fs::exists(fx.temp / "unpacked/tools/godot_4.3.partial"));
}
