#include <doctest/doctest.h>
#include <toolshed/library.hpp>

#include "test_helpers.hpp"

using namespace toolshed;
using toolshed::testing::LibraryRootGuard;
using toolshed::testing::TempDir;
using toolshed::testing::write_file;

namespace {

void install_fake_tool(const std::string& root, const std::string& id, const std::string& version) {
    write_file(root + "/" + id + "/" + version + "/bin/" + id, "#!/bin/sh\n");
}

} // namespace

// ============================================================================
// Library Root
// ============================================================================

TEST_CASE("library_root honours the testing override") {
    TempDir temp;
    {
        LibraryRootGuard guard(temp.path());
        CHECK(library_root() == temp.path());
        CHECK(LibraryManager::with_default_root().root() == temp.path());
    }
    CHECK(library_root() != temp.path());
}

TEST_CASE("library_root without override ends in toolshed/library") {
    clear_library_root_override_for_testing();
    std::string root = library_root();
    if (!root.empty()) {
        CHECK(root.find("toolshed/library") != std::string::npos);
    }
}

// ============================================================================
// Paths and Queries
// ============================================================================

TEST_CASE("tool_path is root/id/version") {
    LibraryManager lib("/lib");
    CHECK(lib.tool_path("godot", "4.3") == "/lib/godot/4.3");
}

TEST_CASE("tool_path refuses ids and versions that are not one directory level") {
    LibraryManager lib("/lib");
    CHECK(lib.tool_path("../etc", "1").empty());
    CHECK(lib.tool_path("godot", "..").empty());
    CHECK(lib.tool_path("a/b", "1").empty());
    CHECK(lib.tool_path("godot", "4\\3").empty());
    CHECK(lib.tool_path("", "1").empty());
}

TEST_CASE("tool_path refuses hidden ids and versions") {
    TempDir temp;
    LibraryManager lib(temp.path());
    CHECK(lib.tool_path(".staging", "0b7c9d4e").empty());
    CHECK(lib.tool_path(".registry", "godot").empty());
    CHECK(lib.tool_path("godot", ".4.3").empty());

    write_file(temp / ".staging/0b7c9d4e/payload", "x");
    CHECK_FALSE(lib.tool_exists(".staging", "0b7c9d4e"));
    CHECK(lib.remove_tool({".staging", "0b7c9d4e"}).isErr());
    CHECK(fs::exists(temp / ".staging/0b7c9d4e/payload"));
}

TEST_CASE("unresolved root yields empty results instead of failing") {
    LibraryManager lib("");
    CHECK_FALSE(lib.resolved());
    CHECK(lib.tool_path("godot", "4.3").empty());
    CHECK_FALSE(lib.tool_exists("godot", "4.3"));
    CHECK(lib.list_tools().empty());
    CHECK(lib.list_versions("godot").empty());
    CHECK_FALSE(lib.tool_metadata("godot", "4.3").exists);
    CHECK(lib.remove_tool({"godot", "4.3"}).isErr());
}

TEST_CASE("enumeration over a missing root is empty") {
    TempDir temp;
    LibraryManager lib(temp / "does-not-exist");
    CHECK(lib.list_tools().empty());
    CHECK(lib.list_versions("godot").empty());
}

TEST_CASE("tool_exists requires a non-empty directory") {
    TempDir temp;
    LibraryManager lib(temp.path());

    fs::create_directories(temp / "godot/4.3");
    CHECK_FALSE(lib.tool_exists("godot", "4.3"));

    install_fake_tool(temp.path(), "godot", "4.3");
    CHECK(lib.tool_exists("godot", "4.3"));
    CHECK(lib.tool_exists(ToolReference{"godot", "4.3"}));
}

TEST_CASE("list_tools skips hidden entries and files") {
    TempDir temp;
    LibraryManager lib(temp.path());

    install_fake_tool(temp.path(), "godot", "4.3");
    install_fake_tool(temp.path(), "blender", "4.1");
    fs::create_directories(temp / ".staging/abc");
    fs::create_directories(temp / ".registry");
    write_file(temp / "README.txt", "not a tool");

    auto tools = lib.list_tools();
    REQUIRE(tools.size() == 2);
    CHECK(tools[0] == "blender");
    CHECK(tools[1] == "godot");
}

TEST_CASE("list_versions orders numerically") {
    TempDir temp;
    LibraryManager lib(temp.path());

    install_fake_tool(temp.path(), "godot", "4.10");
    install_fake_tool(temp.path(), "godot", "4.2");
    install_fake_tool(temp.path(), "godot", "3.5.3");
    fs::create_directories(temp / "godot/.partial");

    auto versions = lib.list_versions("godot");
    REQUIRE(versions.size() == 3);
    CHECK(versions[0] == "3.5.3");
    CHECK(versions[1] == "4.2");
    CHECK(versions[2] == "4.10");
}

TEST_CASE("version_less compares digit runs by value") {
    CHECK(version_less("1.9", "1.10"));
    CHECK_FALSE(version_less("1.10", "1.9"));
    CHECK(version_less("4.3", "4.3.1"));
    CHECK(version_less("4.3-beta", "4.3-rc"));
    CHECK_FALSE(version_less("4.3", "4.3"));
    CHECK(version_less("01", "2"));
}

TEST_CASE("tool_metadata reports size and modification time") {
    TempDir temp;
    LibraryManager lib(temp.path());
    write_file(temp / "krita/5.2/krita", std::string(1000, 'k'));
    write_file(temp / "krita/5.2/share/icon.png", std::string(24, 'i'));

    auto meta = lib.tool_metadata("krita", "5.2");
    CHECK(meta.exists);
    CHECK(meta.path == lib.tool_path("krita", "5.2"));
    CHECK(meta.size_bytes == 1024);
    CHECK_FALSE(meta.last_modified.empty());

    auto missing = lib.tool_metadata("krita", "9.9");
    CHECK_FALSE(missing.exists);
    CHECK(missing.size_bytes == 0);
}

// ============================================================================
// Removal and Install Records
// ============================================================================

TEST_CASE("remove_tool deletes the entry and its install record") {
    TempDir temp;
    LibraryManager lib(temp.path());
    install_fake_tool(temp.path(), "gimp", "2.10");

    InstallRecord record;
    record.tool = {"gimp", "2.10"};
    record.provenance.source = "/mirror/gimp.zip";
    REQUIRE(lib.write_install_record(record).isOk());

    auto removed = lib.remove_tool({"gimp", "2.10"});
    CHECK(removed.isOk());
    CHECK_FALSE(lib.tool_exists("gimp", "2.10"));
    CHECK_FALSE(fs::exists(temp / "gimp"));
    CHECK(lib.read_install_record({"gimp", "2.10"}).isErr());
}

TEST_CASE("remove_tool of a missing entry reports tool_not_installed") {
    TempDir temp;
    LibraryManager lib(temp.path());
    auto removed = lib.remove_tool({"gimp", "2.10"});
    REQUIRE(removed.isErr());
    CHECK(removed.error().code() == ErrorCode::TOOL_NOT_INSTALLED);
}

TEST_CASE("install records survive a write/read cycle") {
    TempDir temp;
    LibraryManager lib(temp.path());

    InstallRecord record;
    record.tool = {"godot", "4.3"};
    record.provenance.source = "https://mirror.example/godot.zip";
    record.provenance.sha256 = std::string(64, 'a');
    record.provenance.installed_at = "2026-01-01T00:00:00Z";
    record.provenance.mirror_name = "studio";
    REQUIRE(lib.write_install_record(record).isOk());

    CHECK(fs::exists(temp / ".registry/godot@4.3.json"));

    auto read = lib.read_install_record({"godot", "4.3"});
    REQUIRE(read.isOk());
    CHECK(read.value().tool == record.tool);
    CHECK(read.value().provenance.source == record.provenance.source);
    CHECK(read.value().provenance.sha256 == record.provenance.sha256);
    CHECK(read.value().provenance.mirror_name == "studio");
}

TEST_CASE("install records with a foreign schema are rejected") {
    TempDir temp;
    LibraryManager lib(temp.path());
    write_file(temp / ".registry/godot@4.3.json", R"({"$schema": "something.else"})");

    auto read = lib.read_install_record({"godot", "4.3"});
    REQUIRE(read.isErr());
    CHECK(read.error().code() == ErrorCode::PARSE_ERROR);
}

TEST_CASE("parse_tool_reference splits id@version") {
    auto ref = parse_tool_reference("godot@4.3");
    REQUIRE(ref.has_value());
    CHECK(ref->id == "godot");
    CHECK(ref->version == "4.3");
    CHECK(ref->to_string() == "godot@4.3");

    CHECK_FALSE(parse_tool_reference("godot").has_value());
    CHECK_FALSE(parse_tool_reference("@4.3").has_value());
    CHECK_FALSE(parse_tool_reference("godot@").has_value());
}
