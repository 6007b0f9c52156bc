// tests/ModpackTests.cpp
#include <catch2/catch_test_macros.hpp>
#include <Quarry/CurseForgeZip.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/ModpacksClient.hpp>

#include "Fixtures.hpp"

using namespace Quarry;
using namespace QuarryTests;

namespace {

    const char* kPackVersion = R"({
        "id": 6397, "parent": 91, "name": "1.9.1", "type": "Release",
        "targets": [
            {"id": 1, "version": "1.20.1", "name": "minecraft", "type": "game", "updated": 1690000000},
            {"id": 2, "version": "47.2.0", "name": "forge", "type": "modloader", "updated": 1690000000},
            {"id": 3, "version": "17.0.1", "name": "java", "type": "runtime", "updated": 1690000000}
        ],
        "files": [
            {"id": 1, "name": "jei.jar", "type": "mod", "path": "./mods/", "url": "", "sha1": "aa", "size": 100,
             "clientonly": false, "serveronly": false, "optional": false, "updated": 1,
             "curseforge": {"project": 238222, "file": 4712866}},
            {"id": 2, "name": "options.txt", "type": "config", "path": "./", "url": "https://dist.modpacks.ch/options.txt",
             "sha1": "bb", "size": -1, "clientonly": true, "serveronly": false, "optional": false, "updated": 1}
        ]
    })";

} // namespace

TEST_CASE("Pack versions parse files and targets", "[modpack]") {
    const auto pack = ModpackVersionManifest::from_json(json::parse(kPackVersion));
    REQUIRE(pack.files.size() == 2);

    CHECK_FALSE(pack.files[0].url);
    REQUIRE(pack.files[0].curseforge);
    CHECK(pack.files[0].curseforge->projectId == 238222);
    CHECK(pack.files[0].curseforge->fileId == 4712866);

    CHECK(pack.files[1].url == std::optional<std::string>("https://dist.modpacks.ch/options.txt"));
    CHECK(pack.files[1].size == -1);
    CHECK(pack.files[1].clientonly);

    CHECK(pack.getMinecraftVersion() == "1.20.1");
    const auto loader = pack.getModLoader();
    REQUIRE(loader);
    CHECK(loader->id() == "forge-47.2.0");
}

TEST_CASE("Pack versions without a game target are rejected", "[modpack]") {
    auto j = json::parse(kPackVersion);
    j["targets"] = json::array({{{"id", 3}, {"version", "17.0.1"}, {"name", "java"}, {"type", "runtime"}}});
    const auto pack = ModpackVersionManifest::from_json(j);

    CHECK_THROWS_AS(pack.getMinecraftVersion(), MinecraftTargetNotFoundError);
    CHECK_FALSE(pack.getModLoader());
}

TEST_CASE("Pack catalog URLs", "[modpack]") {
    CHECK(ModpacksClient::urlFor("ftb:91/6397") == "https://api.feed-the-beast.com/v1/modpacks/modpack/91/6397");
    CHECK(ModpacksClient::urlFor("curseforge/285109") == "https://api.modpacks.ch/public/curseforge/285109");

    FakeHttpClient http;
    http.respond("https://api.feed-the-beast.com/v1/modpacks/modpack/91/6397", kPackVersion);
    http.respond("https://api.modpacks.ch/public/modpack/search/5?term=all%20the%20mods",
                 R"({"packs": [91, 92], "curseforge": [285109], "total": 3, "limit": 5})");

    ModpacksClient client(http);
    CHECK(client.getModpackVersion(91, 6397).name == "1.9.1");

    const auto search = client.searchModpacks("all the mods", 5);
    CHECK(search.packIds == std::vector<std::int64_t>{91, 92});
    CHECK(search.curseforgeIds == std::vector<std::int64_t>{285109});
    CHECK(search.total == 3);
}

TEST_CASE("CurseForge archive manifests", "[modpack][zip]") {
    const auto manifest = CursePackManifest::from_json(json::parse(R"({
        "minecraft": {"version": "1.20.1", "modLoaders": [
            {"id": "forge-47.1.0", "primary": false},
            {"id": "forge-47.2.0", "primary": true}
        ]},
        "manifestType": "minecraftModpack", "manifestVersion": 1,
        "name": "Pack", "version": "2.0", "author": "someone",
        "files": [{"projectID": 238222, "fileID": 4712866, "required": true}],
        "overrides": "overrides"
    })"));
    REQUIRE(manifest.getModLoader());
    CHECK(manifest.getModLoader()->version == "47.2.0");

    CursePackManifest vanilla = manifest;
    vanilla.modLoaders.clear();
    CHECK_FALSE(vanilla.getModLoader());

    vanilla.modLoaders = {{"neoforge-20.4.80-beta", false}};
    CHECK(vanilla.getModLoader()->name == ModLoaderName::NEOFORGE);
}

TEST_CASE("CurseForge archives unpack overrides", "[modpack][zip]") {
    Utils::TempDir dir;
    const auto archive = dir.path() / "pack.zip";
    makeZip(archive, {
        {"manifest.json", R"({"minecraft": {"version": "1.20.1", "modLoaders": []}, "name": "Pack",
                              "files": [{"projectID": 1, "fileID": 10}, {"projectID": 2, "fileID": 20}],
                              "overrides": "extra"})"},
        {"extra/config/a.toml", "a"},
        {"extra/kubejs/startup.js", "b"},
    });

    const CurseForgeZip pack = CurseForgeZip::load(archive);
    CHECK(pack.manifest().name == "Pack");
    CHECK(pack.fileIds() == std::vector<std::int64_t>{10, 20});
    CHECK(pack.projectIds() == std::vector<std::int64_t>{1, 2});

    const auto overrides = pack.listOverrides();
    REQUIRE(overrides.size() == 2);
    CHECK(overrides[0].generic_string() == "config/a.toml");
    CHECK(overrides[1].generic_string() == "kubejs/startup.js");

    pack.copyGameData(dir.path() / "game");
    CHECK(readFile(dir.path() / "game" / "kubejs" / "startup.js") == "b");
}

TEST_CASE("Archives without a manifest are rejected", "[modpack][zip]") {
    Utils::TempDir dir;
    const auto archive = dir.path() / "broken.zip";
    makeZip(archive, {{"overrides/a.txt", "a"}});
    CHECK_THROWS_AS(CurseForgeZip::load(archive), std::filesystem::filesystem_error);
    CHECK_THROWS_AS(CurseForgeZip::load(dir.path() / "absent.zip"), ZipError);
}
