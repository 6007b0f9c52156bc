// src/Instance.cpp
#include <Quarry/Instance.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/LibraryDedup.hpp>
#include <Quarry/Rules.hpp>
#include <Quarry/Utils/FileSystem.hpp>
#include <Quarry/Utils/Logger.hpp>
#include <Quarry/Utils/OS.hpp>

#include <fstream>
#include <system_error>
#include <sstream>
#include <utility>

#ifndef QUARRY_VERSION_STRING
#define QUARRY_VERSION_STRING "0.1.0"
#endif

namespace Quarry {

namespace {

    std::vector<std::string> splitArguments(const std::string& text) {
        std::vector<std::string> out;
        std::istringstream stream(text);
        std::string token;
        while (stream >> token) {
            out.push_back(token);
        }
        return out;
    }

    std::vector<std::string> toGenericStrings(const std::vector<std::filesystem::path>& paths) {
        std::vector<std::string> out;
        out.reserve(paths.size());
        for (const auto& p : paths) {
            out.push_back(p.lexically_normal().generic_string());
        }
        return out;
    }

    std::vector<std::filesystem::path> toPaths(const std::vector<std::string>& strings) {
        return std::vector<std::filesystem::path>(strings.begin(), strings.end());
    }

}

Instance::Instance(std::filesystem::path dir, InstanceManifest manifest)
    : m_dir(std::move(dir)), m_manifest(std::move(manifest)) {
    m_logger = Utils::Logger::GetOrCreateLogger("Instance");
}

bool Instance::exists(const std::filesystem::path& dir) {
    return std::filesystem::is_directory(dir) && std::filesystem::exists(dir / kManifestFile);
}

Instance Instance::create(const std::filesystem::path& dir,
                          const std::string& mcVersion,
                          const std::optional<ModLoader>& modLoader,
                          VersionResolver& resolver) {
    resolver.resolve(mcVersion);
    if (modLoader) {
        const LoaderManifest loader = resolver.resolveLoader(*modLoader);
        const auto loaderMc = loader.minecraftVersion();
        if (loaderMc && *loaderMc != mcVersion) {
            QUARRY_LOG_WARN("{} is built for Minecraft {}, not {}", modLoader->id(), *loaderMc, mcVersion);
        }
    }

    std::filesystem::create_directories(dir);

    InstanceManifest manifest;
    manifest.mcVersion = mcVersion;
    manifest.modLoader = modLoader;

    Instance instance(std::filesystem::canonical(dir), std::move(manifest));
    instance.save();
    instance.m_logger->info("Created instance {} for Minecraft {}", instance.m_dir.string(), mcVersion);
    return instance;
}

Instance Instance::load(const std::filesystem::path& dir) {
    if (!exists(dir)) {
        throw InstanceNotFoundError(dir);
    }
    std::ifstream in(dir / kManifestFile);
    if (!in) {
        throw InstanceNotFoundError(dir);
    }
    return Instance(std::filesystem::canonical(dir), InstanceManifest::from_json(json::parse(in)));
}

void Instance::save() const {
    const auto path = manifestPath();
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        m_logger->error("Unable to write {}", path.string());
        throw std::filesystem::filesystem_error("unable to write instance manifest", path,
                                                std::make_error_code(std::errc::io_error));
    }
    out << m_manifest.to_json().dump(2);
    Utils::commitFile(out, path);
}

std::vector<std::filesystem::path> Instance::applyModpackInstall(const ModpackId& id,
                                                                 const std::vector<std::filesystem::path>& installedFiles) {
    std::vector<std::filesystem::path> previous;
    if (m_manifest.modpack) {
        previous = toPaths(m_manifest.modpack->files);
    }

    auto removed = Utils::removeDiffFiles(gameDir(), previous, installedFiles);
    m_logger->info("Modpack install recorded: {} files, {} stale files removed", installedFiles.size(), removed.size());

    m_manifest.modpack = InstanceModpack{id, toGenericStrings(installedFiles)};
    save();
    return removed;
}

LaunchCommand Instance::prepareLaunch(VersionResolver& resolver, AssetManager& assetManager,
                                      const LaunchProfile& profile, ProgressSink& progress) {
    const GameManifest game = resolver.resolve(m_manifest.mcVersion);
    const AssetManifest assets = resolver.getAssetManifest(game);

    std::optional<LoaderManifest> loader;
    if (m_manifest.modLoader) {
        loader = resolver.resolveLoader(*m_manifest.modLoader);
    }

    assetManager.downloadAssets(assets, progress);
    assetManager.downloadLibraries(game, loader ? &*loader : nullptr, progress);

    std::optional<std::filesystem::path> resources;
    if (assets.isVirtual) {
        resources = assetManager.virtualAssetsDir(game.assetIndex.id);
    } else if (assets.mapToResources) {
        resources = resourcesDir();
    }
    if (resources) {
        assetManager.copyResources(assets, *resources, progress);
    }

    assetManager.extractNatives(game, nativesDir(), progress);
    std::filesystem::create_directories(gameDir());

    LaunchCommand cmd(gameDir(), m_manifest.javaPath, m_manifest.javaArgs);

    std::string mainJar = m_manifest.customJar ? (m_dir / *m_manifest.customJar).string() : game.clientJarPath();

    if (loader) {
        if (const LegacyDistribution* legacy = loader->legacy()) {
            const auto vanillaJar = m_manifest.customJar ? std::filesystem::path(mainJar)
                                                         : assetManager.librariesDir() / mainJar;
            mainJar = assetManager.makeForgeModdedJar(vanillaJar, loader->version, legacy->jarMods).string();

            // forge 1.5 and older try to fetch these at startup and fail unless they already exist
            std::filesystem::create_directories(fmlLibsDir());
            for (const auto& lib : legacy->fmlLibs) {
                const auto src = assetManager.librariesDir() / lib.assetPath();
                std::filesystem::copy_file(src, fmlLibsDir() / src.filename(),
                                           std::filesystem::copy_options::overwrite_existing);
            }

            cmd.arg("-Dminecraft.applet.TargetDirectory=${game_directory}")
               .arg("-Djava.library.path=${natives_directory}")
               .arg("-Dfml.ignoreInvalidMinecraftCertificates=true")
               .arg("-Dfml.ignorePatchDiscrepancies=true")
               .arg("-cp").arg("${classpath}")
               .arg(game.mainClass);
            if (game.minecraftArguments) {
                cmd.args(splitArguments(*game.minecraftArguments));
            }
        } else {
            const CurrentDistribution* current = loader->current();
            cmd.arg("-Djava.library.path=${natives_directory}")
               .arg("-cp").arg("${classpath}")
               .arg(current->mainClass);
            if (current->minecraftArguments) {
                cmd.args(splitArguments(*current->minecraftArguments));
            } else if (game.minecraftArguments) {
                cmd.args(splitArguments(*game.minecraftArguments));
            }
        }

        if (!loader->tweakers.empty()) {
            cmd.arg("--tweakClass").arg(loader->tweakers.front());
        }
    } else if (game.arguments) {
        cmd.args(matchedArguments(game.arguments->jvm, assetManager.rules()));
        cmd.arg(game.mainClass);
        cmd.args(matchedArguments(game.arguments->game, assetManager.rules()));
    } else if (game.minecraftArguments) {
        // these versions carry no JVM arguments of their own
        cmd.arg("-Djava.library.path=${natives_directory}")
           .arg("-cp").arg("${classpath}")
           .arg(game.mainClass);
        cmd.args(splitArguments(*game.minecraftArguments));
    }

    std::vector<std::string> libs = {mainJar};
    const auto gameLibs = assetManager.gameLibraryPaths(game);
    libs.insert(libs.end(), gameLibs.begin(), gameLibs.end());
    if (loader && loader->current()) {
        for (const auto& lib : loader->current()->libraries) {
            libs.push_back(lib.assetPath());
        }
    }

    std::string classpath;
    const char separator = Utils::getClasspathSeparator();
    for (const auto& lib : dedupLibraries(libs)) {
        if (!classpath.empty()) {
            classpath += separator;
        }
        classpath += (assetManager.librariesDir() / lib).string();
    }

    cmd.argContext("version_name", m_manifest.mcVersion)
       .argContext("version_type", game.type)
       .argContext("game_directory", gameDir().string())
       .argContext("assets_root", assetManager.assetsDir().string())
       .argContext("assets_index_name", game.assetIndex.id)
       .argContext("classpath", classpath)
       .argContext("natives_directory", nativesDir().string())
       .argContext("user_type", "msa")
       .argContext("clientid", profile.clientId)
       .argContext("auth_access_token", profile.accessToken)
       .argContext("auth_session", "token:" + profile.accessToken + ":" + profile.uuid)
       .argContext("auth_player_name", profile.playerName)
       .argContext("auth_uuid", profile.uuid)
       .argContext("launcher_name", "quarry")
       .argContext("launcher_version", QUARRY_VERSION_STRING)
       // the game refuses to start without it
       .argContext("user_properties", "{}");
    if (resources) {
        cmd.argContext("game_assets", resources->string());
    }

    m_logger->info("Prepared launch of {} ({} classpath entries)", m_manifest.mcVersion, libs.size());
    return cmd;
}

} // namespace Quarry
