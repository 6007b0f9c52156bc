// tests/InstanceTests.cpp
#include <catch2/catch_test_macros.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/FmlLibraries.hpp>
#include <Quarry/Instance.hpp>
#include <Quarry/Utils/OS.hpp>
#include <Quarry/Utils/ZipFile.hpp>

#include "Fixtures.hpp"

#include <algorithm>

using namespace Quarry;
using namespace QuarryTests;

namespace {

    const char* kAssetIndexUrl = "https://piston-meta.mojang.com/v1/packages/index/5.json";

    RulesContext linuxHost() {
        RulesContext ctx;
        ctx.osName = "linux";
        ctx.osArch = "x86_64";
        return ctx;
    }

    json forgeIndexJson() {
        return {{"uid", "net.minecraftforge"},
                {"name", "Forge"},
                {"versions", json::array({
                    {{"version", "7.8.1.738"}, {"requires", json::array({{{"uid", "net.minecraft"}, {"equals", "1.5.2"}}})}},
                    {{"version", "14.23.5.2860"}, {"requires", json::array({{{"uid", "net.minecraft"}, {"equals", "1.12.2"}}})}},
                })}};
    }

    // A pre-1.13 game manifest: one string of game arguments, no JVM arguments
    json legacyGameJson(const std::string& id, const std::string& mainClass, const std::string& arguments,
                        const json& libraries) {
        json game = gameManifestJson(id, libraries);
        game.erase("arguments");
        game["mainClass"] = mainClass;
        game["minecraftArguments"] = arguments;
        return game;
    }

    std::string classpathOf(const Config& config, const std::vector<std::filesystem::path>& entries) {
        std::string out;
        for (const auto& entry : entries) {
            if (!out.empty()) {
                out += Utils::getClasspathSeparator();
            }
            out += (config.librariesDir / entry).string();
        }
        return out;
    }

} // namespace

TEST_CASE("Loading a directory without a manifest fails", "[instance]") {
    Utils::TempDir dir;
    CHECK_FALSE(Instance::exists(dir.path()));
    CHECK_THROWS_AS(Instance::load(dir.path()), InstanceNotFoundError);
    CHECK_THROWS_AS(Instance::load(dir.path() / "missing"), InstanceNotFoundError);
}

TEST_CASE("Instance manifests keep optional fields optional", "[instance][manifest]") {
    InstanceManifest manifest;
    manifest.mcVersion = "1.20.1";
    const json plain = manifest.to_json();
    CHECK(plain == json{{"mc_version", "1.20.1"}, {"game_dir", "minecraft"}});

    manifest.modLoader = ModLoader::parse("neoforge-20.4.80-beta");
    manifest.javaArgs = std::vector<std::string>{"-Xmx4G"};
    manifest.modpack = InstanceModpack{ModpackId::ftb(91, 6397), {"mods/jei.jar"}};
    const json full = manifest.to_json();
    CHECK(full.at("mod_loader") == json{{"name", "neoforge"}, {"version", "20.4.80-beta"}});
    CHECK(full.at("modpack").at("id") == json{{"type", "ftb"}, {"pack_id", 91}, {"version", 6397}});

    const InstanceManifest parsed = InstanceManifest::from_json(full);
    CHECK(parsed.modLoader == manifest.modLoader);
    CHECK(parsed.javaArgs == manifest.javaArgs);
    REQUIRE(parsed.modpack);
    CHECK(parsed.modpack->id == ModpackId::ftb(91, 6397));
    CHECK(parsed.modpack->files == std::vector<std::string>{"mods/jei.jar"});
    CHECK_FALSE(parsed.javaPath);

    CHECK(ModpackId::from_json(ModpackId::curseZip("pack.zip").to_json()) == ModpackId::curseZip("pack.zip"));
    CHECK_THROWS_AS(ModpackId::from_json(json{{"type", "modrinth"}}), MalformedManifestError);
}

TEST_CASE("Creating an instance validates the version first", "[instance]") {
    TestEnv env;
    env.serveVersions({{"1.20.1", gameManifestJson("1.20.1")}});
    VersionResolver resolver(env.config, env.http);
    const auto dir = env.dir.path() / "instances" / "survival";

    CHECK_THROWS_AS(Instance::create(dir, "1.99", std::nullopt, resolver), VersionNotFoundError);
    CHECK_FALSE(std::filesystem::exists(dir));

    const Instance created = Instance::create(dir, "1.20.1", std::nullopt, resolver);
    CHECK(Instance::exists(dir));

    const Instance loaded = Instance::load(dir);
    CHECK(loaded.manifest().mcVersion == "1.20.1");
    CHECK_FALSE(loaded.manifest().modLoader);
    CHECK(loaded.gameDir() == created.gameDir());
}

TEST_CASE("A modpack install removes only files it no longer ships", "[instance][modpack]") {
    TestEnv env;
    env.serveVersions({{"1.20.1", gameManifestJson("1.20.1")}});
    VersionResolver resolver(env.config, env.http);
    Instance instance = Instance::create(env.dir.path() / "pack", "1.20.1", std::nullopt, resolver);

    for (const char* name : {"mods/a.jar", "mods/b.jar", "config/c.toml", "options.txt"}) {
        writeFile(instance.gameDir() / name, name);
    }

    const auto id = ModpackId::curseforge(238222, 4712866);
    CHECK(instance.applyModpackInstall(id, {"mods/a.jar", "mods/b.jar", "config/c.toml"}).empty());

    const auto removed = instance.applyModpackInstall(id, {"mods/b.jar", "config/c.toml", "mods/d.jar"});
    REQUIRE(removed.size() == 1);
    CHECK_FALSE(std::filesystem::exists(instance.gameDir() / "mods" / "a.jar"));
    CHECK(std::filesystem::exists(instance.gameDir() / "mods" / "b.jar"));
    CHECK(std::filesystem::exists(instance.gameDir() / "options.txt"));

    const Instance reloaded = Instance::load(instance.dir());
    REQUIRE(reloaded.manifest().modpack);
    CHECK(reloaded.manifest().modpack->files ==
          std::vector<std::string>{"mods/b.jar", "config/c.toml", "mods/d.jar"});

    SECTION("files already deleted by the user are tolerated") {
        std::filesystem::remove(instance.gameDir() / "mods" / "b.jar");
        CHECK(instance.applyModpackInstall(id, {"mods/d.jar"}).size() == 1);
        CHECK_FALSE(std::filesystem::exists(instance.gameDir() / "config" / "c.toml"));
    }
}

TEST_CASE("Preparing a vanilla launch builds the java command", "[instance][launch]") {
    TestEnv env;
    env.serveVersions({{"1.20.1", gameManifestJson("1.20.1")}});
    env.http.respond(kAssetIndexUrl,
                     R"({"objects": {"icons/icon_16x16.png": {"hash": "bdf48ef6b5d0d23bbb02e17d04865216179f510a", "size": 4}}})");
    env.http.respond(AssetClient::assetUrl("bdf48ef6b5d0d23bbb02e17d04865216179f510a"), "icon");
    env.http.respond(clientJarUrl("1.20.1"), "client");

    VersionResolver resolver(env.config, env.http);
    AssetManager assets(env.config, env.http, linuxHost());
    Instance instance = Instance::create(env.dir.path() / "vanilla", "1.20.1", std::nullopt, resolver);
    instance.manifest().javaArgs = std::vector<std::string>{"-Xmx2G", "-Dx=${classpath}"};

    LaunchProfile profile{"Steve", "069a79f444e94726a5befca90e38aaf5", "token", "client"};
    NullProgress progress;
    const LaunchCommand cmd = instance.prepareLaunch(resolver, assets, profile, progress);

    CHECK(cmd.program() == "java");
    CHECK(cmd.workingDir() == instance.gameDir());
    CHECK(std::filesystem::is_directory(instance.nativesDir()));

    const auto args = cmd.arguments();
    const std::string classpath = (env.config.librariesDir / "com/mojang/minecraft/1.20.1/minecraft-1.20.1-client.jar").string();
    const std::vector<std::string> expected = {
        "-Xmx2G", "-Dx=${classpath}",
        "-Djava.library.path=" + instance.nativesDir().string(), "-cp", classpath,
        "net.minecraft.client.main.Main",
        "--username", "Steve", "--version", "1.20.1",
    };
    CHECK(args == expected);
    CHECK(cmd.context().at("auth_session") == "token:token:069a79f444e94726a5befca90e38aaf5");
    CHECK(cmd.context().count("game_assets") == 0);
}

TEST_CASE("Legacy asset indexes feed game_assets", "[instance][launch]") {
    TestEnv env;
    json game = gameManifestJson("1.6.4");
    game.erase("arguments");
    game["minecraftArguments"] = "--username ${auth_player_name}  --assetsDir ${game_assets}";
    game["assetIndex"]["id"] = "legacy";
    game["assetIndex"]["url"] = "https://piston-meta.mojang.com/v1/packages/index/legacy.json";
    env.serveVersions({{"1.6.4", game}});
    env.http.respond("https://piston-meta.mojang.com/v1/packages/index/legacy.json",
                     R"({"virtual": true, "objects": {"sound/step/grass1.ogg": {"hash": "227ab99bf7c6cf0b2002e0f7957d0ff7e5cb0c96", "size": 5}}})");
    env.http.respond(AssetClient::assetUrl("227ab99bf7c6cf0b2002e0f7957d0ff7e5cb0c96"), "grass");
    env.http.respond(clientJarUrl("1.6.4"), "client");

    VersionResolver resolver(env.config, env.http);
    AssetManager assets(env.config, env.http, linuxHost());
    Instance instance = Instance::create(env.dir.path() / "old", "1.6.4", std::nullopt, resolver);

    NullProgress progress;
    const LaunchCommand cmd = instance.prepareLaunch(resolver, assets, LaunchProfile{"Alex", "u", "t", "c"}, progress);

    const auto virtualDir = env.config.assetsDir / "virtual" / "legacy";
    CHECK(readFile(virtualDir / "sound/step/grass1.ogg") == "grass");

    const auto args = cmd.arguments();
    REQUIRE(args.size() >= 4);
    CHECK(args[args.size() - 4] == "--username");
    CHECK(args[args.size() - 3] == "Alex");
    CHECK(args[args.size() - 2] == "--assetsDir");
    CHECK(args.back() == virtualDir.string());
}

TEST_CASE("Preparing a legacy Forge launch patches the client jar", "[instance][launch][forge]") {
    TestEnv env;
    const std::string lwjgl = "org/lwjgl/lwjgl/lwjgl/2.9.0/lwjgl-2.9.0.jar";
    env.serveVersions({{"1.5.2", legacyGameJson("1.5.2", "net.minecraft.client.Minecraft",
                                                "${auth_player_name} ${auth_session}",
                                                json::array({libraryJson("org.lwjgl.lwjgl:lwjgl:2.9.0", lwjgl)}))}});
    env.http.respond(kAssetIndexUrl, R"({"objects": {}})");
    env.http.respond("https://libraries.minecraft.net/" + lwjgl, "lwjgl");

    const auto served = env.dir.path() / "served";
    makeZip(served / "client.jar", {{"net/minecraft/client/Minecraft.class", "vanilla"},
                                    {"META-INF/MOJANG_C.SF", "signature"}});
    env.http.respondWithFile(clientJarUrl("1.5.2"), served / "client.jar");

    const json jarModJson = {{"name", "net.minecraftforge:forge:1.5.2-7.8.1.738:universal"},
                             {"url", "https://maven.minecraftforge.net/"}};
    makeZip(served / "forge.jar", {{"net/minecraft/client/Minecraft.class", "forge"},
                                   {"cpw/mods/fml/common/Loader.class", "fml"}});
    env.http.respondWithFile(LoaderLibrary::from_json(jarModJson).downloadUrl(), served / "forge.jar");

    env.http.respond(AssetClient::kForgeIndexUrl, forgeIndexJson().dump());
    env.http.respond("https://meta.prismlauncher.org/v1/net.minecraftforge/7.8.1.738.json", json({
        {"name", "Forge"}, {"uid", "net.minecraftforge"}, {"version", "7.8.1.738"},
        {"jarMods", json::array({jarModJson})},
        {"requires", json::array({{{"uid", "net.minecraft"}, {"equals", "1.5.2"}}})}}).dump());

    // FML libraries are already in the library store
    const auto fmlLibs = fmlLibrariesFor("1.5.2");
    for (const auto& lib : fmlLibs) {
        writeFile(env.config.librariesDir / lib.assetPath(), lib.name);
    }

    VersionResolver resolver(env.config, env.http);
    AssetManager assets(env.config, env.http, linuxHost());
    Instance instance = Instance::create(env.dir.path() / "forge", "1.5.2", ModLoader::parse("forge-7.8.1.738"), resolver);

    NullProgress progress;
    const LaunchCommand cmd = instance.prepareLaunch(resolver, assets, LaunchProfile{"Steve", "uuid", "t", "c"}, progress);

    const auto modded = env.config.cacheDir / "minecraft+forge-7.8.1.738.jar";
    Utils::TempDir unpacked;
    Utils::ZipFile zip(modded);
    REQUIRE(zip.extractAll(unpacked.path()));
    CHECK(readFile(unpacked.path() / "net/minecraft/client/Minecraft.class") == "forge");
    CHECK_FALSE(std::filesystem::exists(unpacked.path() / "META-INF"));

    REQUIRE(fmlLibs.size() == 6);
    for (const auto& lib : fmlLibs) {
        const auto copied = instance.fmlLibsDir() / std::filesystem::path(lib.assetPath()).filename();
        CHECK(readFile(copied) == lib.name);
    }

    const std::vector<std::string> expected = {
        "-Dminecraft.applet.TargetDirectory=" + instance.gameDir().string(),
        "-Djava.library.path=" + instance.nativesDir().string(),
        "-Dfml.ignoreInvalidMinecraftCertificates=true",
        "-Dfml.ignorePatchDiscrepancies=true",
        "-cp", classpathOf(env.config, {modded, lwjgl}),
        "net.minecraft.client.Minecraft",
        "Steve", "token:t:uuid",
    };
    CHECK(cmd.arguments() == expected);
}

TEST_CASE("Preparing a launchwrapper Forge launch uses the loader", "[instance][launch][forge]") {
    TestEnv env;
    env.serveVersions({{"1.12.2", legacyGameJson("1.12.2", "net.minecraft.client.main.Main",
                                                 "--username ${auth_player_name} --version ${version_name}",
                                                 json::array({libraryJson("com.google.guava:guava:17.0",
                                                                          "com/google/guava/guava/17.0/guava-17.0.jar")}))}});
    env.http.respond(kAssetIndexUrl, R"({"objects": {}})");
    env.http.respond("https://libraries.minecraft.net/com/google/guava/guava/17.0/guava-17.0.jar", "guava 17");
    env.http.respond(clientJarUrl("1.12.2"), "client");

    const json loaderLibs = json::array({
        {{"name", "net.minecraft:launchwrapper:1.12"}},
        {{"name", "com.google.guava:guava:21.0"}},
        {{"name", "net.minecraftforge:forge:1.12.2-14.23.5.2860"}, {"url", "https://maven.minecraftforge.net/"}},
    });
    std::vector<std::string> loaderPaths;
    for (const auto& lib : loaderLibs) {
        const LoaderLibrary parsed = LoaderLibrary::from_json(lib);
        env.http.respond(parsed.downloadUrl(), parsed.name);
        loaderPaths.push_back(parsed.assetPath());
    }

    env.http.respond(AssetClient::kForgeIndexUrl, forgeIndexJson().dump());
    env.http.respond("https://meta.prismlauncher.org/v1/net.minecraftforge/14.23.5.2860.json", json({
        {"formatVersion", 1}, {"name", "Forge"}, {"uid", "net.minecraftforge"}, {"version", "14.23.5.2860"},
        {"mainClass", "net.minecraft.launchwrapper.Launch"},
        {"libraries", loaderLibs},
        {"requires", json::array({{{"uid", "net.minecraft"}, {"equals", "1.12.2"}}})},
        {"+tweakers", json::array({"net.minecraftforge.fml.common.launcher.FMLTweaker"})}}).dump());

    VersionResolver resolver(env.config, env.http);
    AssetManager assets(env.config, env.http, linuxHost());
    Instance instance = Instance::create(env.dir.path() / "forge", "1.12.2", ModLoader::parse("forge-14.23.5.2860"), resolver);

    NullProgress progress;
    const LaunchCommand cmd = instance.prepareLaunch(resolver, assets, LaunchProfile{"Steve", "uuid", "t", "c"}, progress);

    for (const auto& path : loaderPaths) {
        CHECK(std::filesystem::exists(env.config.librariesDir / path));
    }

    // guava 21.0 from the loader replaces the game's 17.0 in place
    const std::string classpath = classpathOf(env.config, {
        "com/mojang/minecraft/1.12.2/minecraft-1.12.2-client.jar",
        loaderPaths[1],
        loaderPaths[0],
        loaderPaths[2],
    });
    const std::vector<std::string> expected = {
        "-Djava.library.path=" + instance.nativesDir().string(),
        "-cp", classpath,
        "net.minecraft.launchwrapper.Launch",
        "--username", "Steve", "--version", "1.12.2",
        "--tweakClass", "net.minecraftforge.fml.common.launcher.FMLTweaker",
    };
    CHECK(cmd.arguments() == expected);
    CHECK_FALSE(std::filesystem::exists(instance.fmlLibsDir()));
}
