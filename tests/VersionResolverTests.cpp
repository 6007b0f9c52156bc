// tests/VersionResolverTests.cpp
#include <catch2/catch_test_macros.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/VersionResolver.hpp>

#include "Fixtures.hpp"

using namespace Quarry;
using namespace QuarryTests;

namespace {

    json forgeIndexJson() {
        return {{"uid", "net.minecraftforge"},
                {"name", "Forge"},
                {"versions", json::array({
                    {{"version", "47.1.0"}, {"requires", json::array({{{"uid", "net.minecraft"}, {"equals", "1.20.1"}}})}},
                    {{"version", "47.2.0"}, {"requires", json::array({{{"uid", "net.minecraft"}, {"equals", "1.20.1"}}})}},
                    {{"version", "46.0.14"}, {"requires", json::array({{{"uid", "net.minecraft"}, {"equals", "1.20"}}})}},
                    {{"version", "7.8.1.738"}, {"requires", json::array({{{"uid", "net.minecraft"}, {"equals", "1.5.2"}}})}},
                    {{"version", "14.23.5.2847"}, {"requires", json::array({{{"uid", "net.minecraft"}, {"equals", "1.12.2"}}})}},
                    {{"version", "14.23.5.2860"}, {"requires", json::array({{{"uid", "net.minecraft"}, {"equals", "1.12.2"}}})}},
                    {{"version", "14.23.5.2855"}, {"requires", json::array({{{"uid", "net.minecraft"}, {"equals", "1.12.2"}}})}},
                })}};
    }

    json forgeManifestJson(const std::string& version, const std::string& mcVersion) {
        return {{"formatVersion", 1},
                {"name", "Forge"},
                {"uid", "net.minecraftforge"},
                {"version", version},
                {"mainClass", "cpw.mods.bootstraplauncher.BootstrapLauncher"},
                {"libraries", json::array({{{"name", "cpw.mods:bootstraplauncher:1.1.2"},
                                            {"url", "https://maven.minecraftforge.net/"}}})},
                {"requires", json::array({{{"uid", "net.minecraft"}, {"equals", mcVersion}}})}};
    }

    const std::string kForgeManifestBase = "https://meta.prismlauncher.org/v1/net.minecraftforge/";

} // namespace

TEST_CASE("Game manifests are cached after the first fetch", "[resolver]") {
    TestEnv env;
    env.serveVersions({{"1.20.1", gameManifestJson("1.20.1")}});
    VersionResolver resolver(env.config, env.http);

    const auto first = resolver.resolve("1.20.1");
    const auto second = resolver.resolve("1.20.1");

    CHECK(first.id == "1.20.1");
    CHECK(second.mainClass == first.mainClass);
    CHECK(env.http.count("GET", gameManifestUrl("1.20.1")) == 1);
    CHECK(std::filesystem::exists(resolver.gameManifestPath("1.20.1")));
    CHECK_FALSE(std::filesystem::exists(env.config.versionsDir / "1.20.1.json.part"));

    SECTION("a fresh resolver reads the cache without network") {
        env.http.clearRequests();
        VersionResolver offline(env.config, env.http);
        CHECK(offline.resolve("1.20.1").id == "1.20.1");
        CHECK(env.http.requests().empty());
    }
}

TEST_CASE("Unknown versions are reported", "[resolver]") {
    TestEnv env;
    env.serveVersions({{"1.20.1", gameManifestJson("1.20.1")}});
    VersionResolver resolver(env.config, env.http);

    CHECK_THROWS_AS(resolver.resolve("1.99"), VersionNotFoundError);
    CHECK_FALSE(std::filesystem::exists(resolver.gameManifestPath("1.99")));
}

TEST_CASE("Vulnerable log4j is replaced with 2.17.1", "[resolver][log4j]") {
    TestEnv env;
    const json libs = json::array({
        libraryJson("org.apache.logging.log4j:log4j-core:2.14.1",
                    "org/apache/logging/log4j/log4j-core/2.14.1/log4j-core-2.14.1.jar"),
        libraryJson("org.apache.logging.log4j:log4j-api:2.8.1",
                    "org/apache/logging/log4j/log4j-api/2.8.1/log4j-api-2.8.1.jar"),
        libraryJson("org.apache.logging.log4j:log4j-slf4j18-impl:2.14.1",
                    "org/apache/logging/log4j/log4j-slf4j18-impl/2.14.1/log4j-slf4j18-impl-2.14.1.jar"),
        libraryJson("org.apache.logging.log4j:log4j-core:2.18.0",
                    "org/apache/logging/log4j/log4j-core/2.18.0/log4j-core-2.18.0.jar"),
    });
    env.serveVersions({{"1.18", gameManifestJson("1.18", libs)}});
    VersionResolver resolver(env.config, env.http);

    const auto game = resolver.resolve("1.18");
    REQUIRE(game.libraries.size() == 4);
    CHECK(game.libraries[0].name == "org.apache.logging.log4j:log4j-core:2.17.1");
    REQUIRE(game.libraries[0].downloads.artifact);
    CHECK(game.libraries[0].downloads.artifact->url ==
          "https://repo1.maven.org/maven2/org/apache/logging/log4j/log4j-core/2.17.1/log4j-core-2.17.1.jar");
    CHECK(game.libraries[1].name == "org.apache.logging.log4j:log4j-api:2.17.1");
    CHECK(game.libraries[2].name == "org.apache.logging.log4j:log4j-slf4j18-impl:2.14.1");
    CHECK(game.libraries[3].name == "org.apache.logging.log4j:log4j-core:2.18.0");

    SECTION("the cached text keeps the upstream names") {
        CHECK(readFile(resolver.gameManifestPath("1.18")).find("log4j-core:2.14.1") != std::string::npos);
    }
}

TEST_CASE("Manifests without launch arguments are rejected", "[resolver]") {
    json game = gameManifestJson("1.20.1");
    game.erase("arguments");
    CHECK_THROWS_AS(GameManifest::from_json(game), MalformedManifestError);

    game["minecraftArguments"] = "--username ${auth_player_name}";
    const auto legacy = GameManifest::from_json(game);
    CHECK(legacy.minecraftArguments);
    CHECK_FALSE(legacy.arguments);
    REQUIRE(legacy.javaVersion);
    CHECK(legacy.javaVersion->majorVersion == 17);
}

TEST_CASE("Loader manifests resolve through the index", "[resolver][loader]") {
    TestEnv env;
    env.http.respond(AssetClient::kForgeIndexUrl, forgeIndexJson().dump());
    env.http.respond(kForgeManifestBase + "47.2.0.json", forgeManifestJson("47.2.0", "1.20.1").dump());
    VersionResolver resolver(env.config, env.http);

    const auto loader = resolver.resolveLoader("forge-47.2.0");
    REQUIRE(loader.current());
    CHECK(loader.current()->mainClass == "cpw.mods.bootstraplauncher.BootstrapLauncher");
    CHECK(std::filesystem::exists(env.config.versionsDir / "forge_47.2.0.json"));

    resolver.resolveLoader(ModLoader::parse("forge-47.2.0"));
    CHECK(env.http.count("GET", kForgeManifestBase + "47.2.0.json") == 1);

    CHECK_THROWS_AS(resolver.resolveLoader("forge-1.0.0"), LoaderVersionNotFoundError);
    CHECK(env.http.count("GET", kForgeManifestBase + "1.0.0.json") == 0);
}

TEST_CASE("Legacy loaders get FML libraries", "[resolver][loader]") {
    TestEnv env;
    env.http.respond(AssetClient::kForgeIndexUrl, forgeIndexJson().dump());
    env.http.respond(kForgeManifestBase + "7.8.1.738.json", json({
        {"name", "Forge"}, {"uid", "net.minecraftforge"}, {"version", "7.8.1.738"},
        {"jarMods", json::array({{{"name", "net.minecraftforge:forge:1.5.2-7.8.1.738:universal"},
                                  {"url", "https://maven.minecraftforge.net/"}}})},
        {"requires", json::array({{{"uid", "net.minecraft"}, {"equals", "1.5.2"}}})}}).dump());
    VersionResolver resolver(env.config, env.http);

    const auto loader = resolver.resolveLoader("forge-7.8.1.738");
    REQUIRE(loader.legacy());
    CHECK(loader.legacy()->fmlLibs.size() == 6);

    LoaderManifest orphan = loader;
    orphan.requirements.clear();
    CHECK_THROWS_AS(applyFmlLibraries(orphan), LoaderRequiresNotFoundError);
}

TEST_CASE("Loader versions are listed newest first", "[resolver][loader]") {
    TestEnv env;
    env.http.respond(AssetClient::kForgeIndexUrl, forgeIndexJson().dump());
    VersionResolver resolver(env.config, env.http);

    const auto versions = resolver.getLoaderVersions("1.20.1", ModLoaderName::FORGE);
    REQUIRE(versions.size() == 2);
    CHECK(versions[0].version == "47.2.0");
    CHECK(versions[1].version == "47.1.0");

    CHECK(resolver.getLoaderVersions("1.7.10", ModLoaderName::FORGE).empty());

    SECTION("fourth component decides between builds of one release") {
        const auto builds = resolver.getLoaderVersions("1.12.2", ModLoaderName::FORGE);
        REQUIRE(builds.size() == 3);
        CHECK(builds[0].version == "14.23.5.2860");
        CHECK(builds[1].version == "14.23.5.2855");
        CHECK(builds[2].version == "14.23.5.2847");
    }
}

TEST_CASE("Asset indexes are cached under the assets root", "[resolver][assets]") {
    TestEnv env;
    env.serveVersions({{"1.20.1", gameManifestJson("1.20.1")}});
    env.http.respond("https://piston-meta.mojang.com/v1/packages/index/5.json",
                     R"({"objects": {"icons/icon_16x16.png": {"hash": "bdf48ef6b5d0d23bbb02e17d04865216179f510a", "size": 3665}}})");
    VersionResolver resolver(env.config, env.http);

    const auto game = resolver.resolve("1.20.1");
    const auto assets = resolver.getAssetManifest(game);
    CHECK(assets.objects.size() == 1);
    CHECK(std::filesystem::exists(env.config.assetsDir / "indexes" / "5.json"));
}
