// tests/ServerInstanceTests.cpp
#include <catch2/catch_test_macros.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/ServerInstance.hpp>
#include <Quarry/Utils/OS.hpp>

#include "Fixtures.hpp"

using namespace Quarry;
using namespace QuarryTests;

namespace {

    const char* kServerJarUrl = "https://piston-data.mojang.com/v1/objects/1.20.1/server.jar";

    json serverGameJson(const std::string& id) {
        json game = gameManifestJson(id);
        game["downloads"]["server"] = {{"sha1", ""}, {"size", 1}, {"url", kServerJarUrl}};
        return game;
    }

    json currentLoaderJson(const std::string& name, const std::string& uid, const std::string& version,
                           const std::string& mcVersion, const json& mavenFiles) {
        return {{"formatVersion", 1}, {"name", name}, {"uid", uid}, {"version", version},
                {"mainClass", "cpw.mods.bootstraplauncher.BootstrapLauncher"},
                {"libraries", json::array()},
                {"mavenFiles", mavenFiles},
                {"requires", json::array({{{"uid", "net.minecraft"}, {"equals", mcVersion}}})}};
    }

    bool onWindows() {
        return Utils::getCurrentOS() == Utils::OperatingSystem::WINDOWS;
    }

}

TEST_CASE("A vanilla server gets server.jar and starts from it", "[server]") {
    TestEnv env;
    env.serveVersions({{"1.20.1", serverGameJson("1.20.1")}});
    env.http.respond(kServerJarUrl, "server bytes");

    VersionResolver resolver(env.config, env.http);
    AssetManager assets(env.config, env.http);
    NullProgress progress;

    ServerInstance server = ServerInstance::create(env.dir.path() / "srv", "1.20.1", std::nullopt,
                                                   resolver, assets, progress);

    CHECK(ServerInstance::exists(env.dir.path() / "srv"));
    CHECK(readFile(server.serverDir() / "server.jar") == "server bytes");
    CHECK(server.serverDir() == server.dir() / "server");
    CHECK_FALSE(server.installCommand(resolver, assets).has_value());

    const LaunchCommand cmd = server.prepareLaunch();
    CHECK(readFile(server.serverDir() / "eula.txt") == "eula=true");
    CHECK(cmd.program() == "java");
    CHECK(cmd.workingDir() == server.serverDir());
    CHECK(cmd.arguments() == std::vector<std::string>{"-jar", "server.jar", "nogui"});
    CHECK(cmd.environment().empty());

    // The client jar is never fetched for a server
    CHECK(env.http.count("DOWNLOAD", clientJarUrl("1.20.1")) == 0);
}

TEST_CASE("Server settings are carried into the command", "[server]") {
    TestEnv env;
    env.serveVersions({{"1.20.1", serverGameJson("1.20.1")}});
    env.http.respond(kServerJarUrl, "server bytes");

    VersionResolver resolver(env.config, env.http);
    AssetManager assets(env.config, env.http);
    NullProgress progress;
    ServerInstance::create(env.dir.path() / "srv", "1.20.1", std::nullopt, resolver, assets, progress);

    ServerInstance server = ServerInstance::load(env.dir.path() / "srv");
    server.manifest().javaPath = "/opt/jdk17/bin/java";
    server.manifest().javaArgs = std::vector<std::string>{"-Xmx2G"};
    server.manifest().javaEnv = std::map<std::string, std::string>{{"TZ", "UTC"}};
    server.save();

    writeFile(server.serverDir() / "user_jvm_args.txt", "-Xms1G");
    writeFile(server.serverDir() / "eula.txt", "eula=false");

    const ServerInstance reloaded = ServerInstance::load(env.dir.path() / "srv");
    REQUIRE(reloaded.manifest().javaEnv);
    CHECK(reloaded.manifest().javaEnv->at("TZ") == "UTC");

    const LaunchCommand cmd = server.prepareLaunch();
    CHECK(cmd.program() == "/opt/jdk17/bin/java");
    CHECK(cmd.arguments() == std::vector<std::string>{"-Xmx2G", "@user_jvm_args.txt", "-jar", "server.jar", "nogui"});
    CHECK(cmd.environment() == std::map<std::string, std::string>{{"TZ", "UTC"}});

    // An answered EULA is left alone
    CHECK(readFile(server.serverDir() / "eula.txt") == "eula=false");
}

TEST_CASE("A Forge server is laid out by the Forge installer", "[server][forge]") {
    TestEnv env;
    env.serveVersions({{"1.20.1", gameManifestJson("1.20.1")}});

    const ModLoader forge = ModLoader::parse("forge-47.2.0");
    const json installerJson = {{"name", "net.minecraftforge:forge:1.20.1-47.2.0:installer"},
                                {"url", "https://maven.minecraftforge.net/"}};
    const LoaderLibrary installer = LoaderLibrary::from_json(installerJson);
    env.http.respond(installer.downloadUrl(), "installer");
    env.http.respond(AssetClient::loaderManifestUrl(forge),
                     currentLoaderJson("Forge", "net.minecraftforge", "47.2.0", "1.20.1",
                                       json::array({installerJson})).dump());

    VersionResolver resolver(env.config, env.http);
    AssetManager assets(env.config, env.http);
    NullProgress progress;

    ServerInstance server = ServerInstance::create(env.dir.path() / "forge", "1.20.1", forge,
                                                   resolver, assets, progress);

    const auto installerPath = env.config.librariesDir / "net/minecraftforge/forge/1.20.1-47.2.0/forge-1.20.1-47.2.0-installer.jar";
    CHECK(installer.assetPath() == "net/minecraftforge/forge/1.20.1-47.2.0/forge-1.20.1-47.2.0-installer.jar");
    CHECK(readFile(installerPath) == "installer");
    CHECK_FALSE(std::filesystem::exists(server.serverDir() / "server.jar"));

    const auto install = server.installCommand(resolver, assets);
    REQUIRE(install);
    CHECK(install->workingDir() == server.serverDir());
    CHECK(install->arguments() == std::vector<std::string>{"-jar", installerPath.string(), "--installServer"});

    const LaunchCommand cmd = server.prepareLaunch();
    const std::string argsFile = ServerInstance::loaderArgsFile(forge, "1.20.1", onWindows());
    CHECK(cmd.arguments() == std::vector<std::string>{"@" + argsFile, "nogui"});
    CHECK(readFile(server.serverDir() / "eula.txt") == "eula=true");
}

TEST_CASE("A NeoForge server uses its own installer flag", "[server][neoforge]") {
    TestEnv env;
    env.serveVersions({{"1.20.4", gameManifestJson("1.20.4")}});

    const ModLoader neoforge = ModLoader::parse("neoforge-20.4.80-beta");
    const json installerJson = {{"name", "net.neoforged:neoforge:20.4.80-beta:installer"},
                                {"url", "https://maven.neoforged.net/releases/"}};
    const LoaderLibrary installer = LoaderLibrary::from_json(installerJson);
    env.http.respond(installer.downloadUrl(), "installer");
    env.http.respond(AssetClient::loaderManifestUrl(neoforge),
                     currentLoaderJson("NeoForge", "net.neoforged", "20.4.80-beta", "1.20.4",
                                       json::array({installerJson})).dump());

    VersionResolver resolver(env.config, env.http);
    AssetManager assets(env.config, env.http);
    NullProgress progress;

    ServerInstance server = ServerInstance::create(env.dir.path() / "neo", "1.20.4", neoforge,
                                                   resolver, assets, progress);

    const auto install = server.installCommand(resolver, assets);
    REQUIRE(install);
    CHECK(install->arguments() == std::vector<std::string>{
        "-jar", (env.config.librariesDir / installer.assetPath()).string(), "--install-server"});

    const LaunchCommand cmd = server.prepareLaunch();
    CHECK(cmd.arguments().front() == "@" + ServerInstance::loaderArgsFile(neoforge, "1.20.4", onWindows()));
    CHECK(cmd.arguments().back() == "nogui");
}

TEST_CASE("Loader argument files follow the installer's library layout", "[server]") {
    CHECK(ServerInstance::loaderArgsFile(ModLoader::parse("forge-47.2.0"), "1.20.1", false) ==
          "libraries/net/minecraftforge/forge/1.20.1-47.2.0/unix_args.txt");
    CHECK(ServerInstance::loaderArgsFile(ModLoader::parse("neoforge-20.4.80-beta"), "1.20.4", false) ==
          "libraries/net/neoforged/neoforge/20.4.80-beta/unix_args.txt");
    CHECK(ServerInstance::loaderArgsFile(ModLoader::parse("forge-47.2.0"), "1.20.1", true) ==
          "libraries/net/minecraftforge/forge/1.20.1-47.2.0/win_args.txt");
}

TEST_CASE("Server creation writes nothing it cannot finish", "[server]") {
    TestEnv env;

    SECTION("a loader without an installer jar") {
        env.serveVersions({{"1.20.1", gameManifestJson("1.20.1")}});
        const ModLoader forge = ModLoader::parse("forge-47.2.0");
        env.http.respond(AssetClient::loaderManifestUrl(forge),
                         currentLoaderJson("Forge", "net.minecraftforge", "47.2.0", "1.20.1", json::array()).dump());

        VersionResolver resolver(env.config, env.http);
        AssetManager assets(env.config, env.http);
        NullProgress progress;
        CHECK_THROWS_AS(ServerInstance::create(env.dir.path() / "srv", "1.20.1", forge, resolver, assets, progress),
                        LoaderInstallerNotFoundError);
    }

    SECTION("a release without a server jar") {
        env.serveVersions({{"1.20.1", gameManifestJson("1.20.1")}});

        VersionResolver resolver(env.config, env.http);
        AssetManager assets(env.config, env.http);
        NullProgress progress;
        CHECK_THROWS_AS(ServerInstance::create(env.dir.path() / "srv", "1.20.1", std::nullopt, resolver, assets, progress),
                        MalformedManifestError);
    }

    CHECK_FALSE(std::filesystem::exists(env.dir.path() / "srv"));
}

TEST_CASE("Loading a directory without a server manifest fails", "[server]") {
    TestEnv env;
    CHECK_FALSE(ServerInstance::exists(env.dir.path()));
    CHECK_THROWS_AS(ServerInstance::load(env.dir.path() / "missing"), InstanceNotFoundError);
}
