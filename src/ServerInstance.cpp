// src/ServerInstance.cpp
#include <Quarry/ServerInstance.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/Utils/FileSystem.hpp>
#include <Quarry/Utils/Logger.hpp>
#include <Quarry/Utils/OS.hpp>

#include <fstream>
#include <system_error>
#include <utility>

namespace Quarry {

namespace {

    constexpr const char* kEulaFile = "eula.txt";
    constexpr const char* kUserJvmArgsFile = "user_jvm_args.txt";
    constexpr const char* kServerJar = "server.jar";

    void writeTextFile(const std::filesystem::path& path, const std::string& text) {
        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            throw std::filesystem::filesystem_error("unable to write file", path,
                                                    std::make_error_code(std::errc::io_error));
        }
        out << text;
        Utils::commitFile(out, path);
    }

}

ServerInstance::ServerInstance(std::filesystem::path dir, ServerInstanceManifest manifest)
    : m_dir(std::move(dir)), m_manifest(std::move(manifest)) {
    m_logger = Utils::Logger::GetOrCreateLogger("ServerInstance");
}

bool ServerInstance::exists(const std::filesystem::path& dir) {
    return std::filesystem::is_directory(dir) && std::filesystem::exists(dir / kManifestFile);
}

ServerInstance ServerInstance::create(const std::filesystem::path& dir,
                                      const std::string& mcVersion,
                                      const std::optional<ModLoader>& modLoader,
                                      VersionResolver& resolver,
                                      AssetManager& assetManager,
                                      ProgressSink& progress) {
    const GameManifest game = resolver.resolve(mcVersion);
    std::optional<LoaderManifest> loader;
    if (modLoader) {
        loader = resolver.resolveLoader(*modLoader);
        const auto loaderMc = loader->minecraftVersion();
        if (loaderMc && *loaderMc != mcVersion) {
            QUARRY_LOG_WARN("{} is built for Minecraft {}, not {}", modLoader->id(), *loaderMc, mcVersion);
        }
        // Throws when the loader lists no installer
        assetManager.installerJarPath(*loader);
    } else if (game.downloads.count(MinecraftJARType::SERVER) == 0) {
        throw MalformedManifestError(game.id, "no server download");
    }

    std::filesystem::create_directories(dir);

    ServerInstanceManifest manifest;
    manifest.mcVersion = mcVersion;
    manifest.modLoader = modLoader;

    ServerInstance instance(std::filesystem::canonical(dir), std::move(manifest));
    instance.save();
    std::filesystem::create_directories(instance.serverDir());

    if (loader) {
        assetManager.downloadInstallerJar(*loader, progress);
    } else {
        assetManager.downloadServerJar(game, instance.serverDir() / kServerJar, progress);
    }

    instance.m_logger->info("Created server instance {} for Minecraft {}", instance.m_dir.string(), mcVersion);
    return instance;
}

ServerInstance ServerInstance::load(const std::filesystem::path& dir) {
    if (!exists(dir)) {
        throw InstanceNotFoundError(dir);
    }
    std::ifstream in(dir / kManifestFile);
    if (!in) {
        throw InstanceNotFoundError(dir);
    }
    return ServerInstance(std::filesystem::canonical(dir), ServerInstanceManifest::from_json(json::parse(in)));
}

void ServerInstance::save() const {
    const auto path = manifestPath();
    m_logger->debug("Saving {}", path.string());
    writeTextFile(path, m_manifest.to_json().dump(2));
}

std::optional<LaunchCommand> ServerInstance::installCommand(VersionResolver& resolver,
                                                            AssetManager& assetManager) const {
    if (!m_manifest.modLoader) {
        return std::nullopt;
    }
    const LoaderManifest loader = resolver.resolveLoader(*m_manifest.modLoader);
    const auto installer = assetManager.installerJarPath(loader);

    LaunchCommand cmd(serverDir(), m_manifest.javaPath, std::nullopt);
    cmd.args({"-jar", installer.string()});
    switch (m_manifest.modLoader->name) {
        case ModLoaderName::FORGE:
            cmd.arg("--installServer");
            break;
        case ModLoaderName::NEOFORGE:
            cmd.arg("--install-server");
            break;
    }
    return cmd;
}

std::string ServerInstance::loaderArgsFile(const ModLoader& loader, const std::string& mcVersion, bool windows) {
    const std::string file = windows ? "win_args.txt" : "unix_args.txt";
    switch (loader.name) {
        case ModLoaderName::FORGE:
            // Forge versions its artifacts as <minecraft>-<forge>
            return "libraries/net/minecraftforge/forge/" + mcVersion + "-" + loader.version + "/" + file;
        case ModLoaderName::NEOFORGE:
            return "libraries/net/neoforged/neoforge/" + loader.version + "/" + file;
    }
    return file;
}

LaunchCommand ServerInstance::prepareLaunch() {
    const auto dir = serverDir();
    std::filesystem::create_directories(dir);

    const auto eula = dir / kEulaFile;
    if (!std::filesystem::exists(eula)) {
        m_logger->info("Accepting the Minecraft EULA in {}", eula.string());
        writeTextFile(eula, "eula=true");
    }

    LaunchCommand cmd(dir, m_manifest.javaPath, m_manifest.javaArgs);
    if (m_manifest.javaEnv) {
        for (const auto& [key, value] : *m_manifest.javaEnv) {
            cmd.env(key, value);
        }
    }

    if (std::filesystem::exists(dir / kUserJvmArgsFile)) {
        cmd.arg(std::string("@") + kUserJvmArgsFile);
    }

    if (m_manifest.modLoader) {
        const bool windows = Utils::getCurrentOS() == Utils::OperatingSystem::WINDOWS;
        const std::string argsFile = loaderArgsFile(*m_manifest.modLoader, m_manifest.mcVersion, windows);
        if (!std::filesystem::exists(dir / argsFile)) {
            m_logger->warn("{} is missing; has the installer been run?", argsFile);
        }
        cmd.arg("@" + argsFile);
    } else {
        cmd.args({"-jar", kServerJar});
    }
    cmd.arg("nogui");

    m_logger->info("Server command: {}", cmd.toString());
    return cmd;
}

} // namespace Quarry
