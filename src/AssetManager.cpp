// src/AssetManager.cpp
#include <Quarry/AssetManager.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/Utils/Crypto.hpp>
#include <Quarry/Utils/FileSystem.hpp>
#include <Quarry/Utils/Logger.hpp>
#include <Quarry/Utils/OS.hpp>
#include <Quarry/Utils/ZipFile.hpp>

namespace Quarry {

AssetManager::AssetManager(const Config& config, HttpClient& httpClient, RulesContext rules)
    : m_config(config), m_httpClient(httpClient), m_client(httpClient), m_rules(std::move(rules)) {
    m_logger = Utils::Logger::GetOrCreateLogger("AssetManager");
    m_bitness = Utils::getArchBitness(Utils::getCurrentArch());
}

void AssetManager::downloadIfMissing(const PendingDownload& download) {
    if (std::filesystem::exists(download.dest)) {
        m_logger->trace("Already present: {}", download.dest.string());
        return;
    }

    m_httpClient.Download(download.url, download.dest);

    if (m_config.verifyHashes && download.sha1 && !download.sha1->empty()) {
        const std::string actual = Utils::calculateFileSHA1(download.dest);
        if (actual != *download.sha1) {
            m_logger->error("SHA1 mismatch for {}: expected {}, got {}", download.dest.string(), *download.sha1, actual);
            std::filesystem::remove(download.dest);
            throw HttpError(download.url, 200, "SHA1 mismatch, expected " + *download.sha1 + " got " + actual);
        }
    }
}

void AssetManager::downloadBatch(const std::string& label, const std::vector<PendingDownload>& downloads,
                                 ProgressSink& progress) {
    progress.begin(label, downloads.size());
    for (size_t i = 0; i < downloads.size(); ++i) {
        progress.advance(i + 1);
        downloadIfMissing(downloads[i]);
    }
    progress.end();
}

void AssetManager::downloadAssets(const AssetManifest& assets, ProgressSink& progress) {
    m_logger->info("Checking {} asset objects", assets.objects.size());

    std::vector<PendingDownload> downloads;
    downloads.reserve(assets.objects.size());
    for (const auto& [name, object] : assets.objects) {
        downloads.push_back({AssetClient::assetUrl(object.hash), m_config.assetsDir / object.objectPath(), object.hash});
    }
    downloadBatch("Downloading assets", downloads, progress);
}

std::vector<AssetManager::PendingDownload> AssetManager::gameLibraryDownloads(const GameManifest& game) const {
    std::vector<PendingDownload> downloads;

    auto client = game.downloads.find(MinecraftJARType::CLIENT);
    if (client == game.downloads.end()) {
        throw MalformedManifestError(game.id, "no client download");
    }
    downloads.push_back({client->second.url, m_config.librariesDir / game.clientJarPath(), client->second.sha1});

    for (const auto& lib : game.libraries) {
        if (!libraryApplies(lib, m_rules)) {
            m_logger->trace("Skipping {}: rules do not match", lib.name);
            continue;
        }
        for (const auto& artifact : lib.artifactsForDownload(m_rules.osName, m_bitness)) {
            downloads.push_back({artifact.url, m_config.librariesDir / artifact.path, artifact.sha1});
        }
    }
    return downloads;
}

std::vector<AssetManager::PendingDownload> AssetManager::loaderLibraryDownloads(const LoaderManifest& loader) const {
    std::vector<PendingDownload> downloads;
    auto add = [&](const std::vector<LoaderLibrary>& libs) {
        for (const auto& lib : libs) {
            downloads.push_back({lib.downloadUrl(), m_config.librariesDir / lib.assetPath(), lib.sha1()});
        }
    };

    if (const auto* legacy = loader.legacy()) {
        add(legacy->jarMods);
        add(legacy->fmlLibs);
    } else if (const auto* current = loader.current()) {
        add(current->libraries);
        add(current->mavenFiles);
    }
    return downloads;
}

void AssetManager::downloadGameLibraries(const GameManifest& game, ProgressSink& progress) {
    m_logger->info("Checking libraries for {}", game.id);
    downloadBatch("Downloading libraries", gameLibraryDownloads(game), progress);
}

void AssetManager::downloadLoaderLibraries(const LoaderManifest& loader, ProgressSink& progress) {
    m_logger->info("Checking libraries for {} {}", loader.name, loader.version);
    downloadBatch("Downloading loader libraries", loaderLibraryDownloads(loader), progress);
}

void AssetManager::downloadServerJar(const GameManifest& game, const std::filesystem::path& dest,
                                     ProgressSink& progress) {
    auto server = game.downloads.find(MinecraftJARType::SERVER);
    if (server == game.downloads.end()) {
        throw MalformedManifestError(game.id, "no server download");
    }
    m_logger->info("Checking server jar for {}", game.id);

    std::vector<PendingDownload> downloads;
    downloads.push_back({server->second.url, dest, server->second.sha1});
    downloadBatch("Downloading server jar", downloads, progress);
}

std::filesystem::path AssetManager::installerJarPath(const LoaderManifest& loader) const {
    const auto installer = loader.installerLibrary();
    if (!installer) {
        throw LoaderInstallerNotFoundError(loader.name + " " + loader.version);
    }
    return m_config.librariesDir / installer->assetPath();
}

std::filesystem::path AssetManager::downloadInstallerJar(const LoaderManifest& loader, ProgressSink& progress) {
    const auto path = installerJarPath(loader);
    const auto installer = loader.installerLibrary();
    m_logger->info("Checking installer for {} {}", loader.name, loader.version);

    std::vector<PendingDownload> downloads;
    downloads.push_back({installer->downloadUrl(), path, installer->sha1()});
    downloadBatch("Downloading installer", downloads, progress);
    return path;
}

void AssetManager::downloadLibraries(const GameManifest& game, const LoaderManifest* loader, ProgressSink& progress) {
    downloadGameLibraries(game, progress);
    if (loader != nullptr) {
        downloadLoaderLibraries(*loader, progress);
    }
}

std::vector<std::string> AssetManager::gameLibraryPaths(const GameManifest& game) const {
    std::vector<std::string> paths;
    for (const auto& lib : game.libraries) {
        if (libraryApplies(lib, m_rules) && lib.downloads.artifact) {
            paths.push_back(lib.downloads.artifact->path);
        }
    }
    return paths;
}

void AssetManager::extractNatives(const GameManifest& game, const std::filesystem::path& targetDir,
                                  ProgressSink& progress) {
    std::vector<std::pair<const Library*, LibraryArtifact>> nativeJars;
    for (const auto& lib : game.libraries) {
        if (!libraryApplies(lib, m_rules)) {
            continue;
        }
        if (auto native = lib.nativesArtifact(m_rules.osName, m_bitness)) {
            nativeJars.emplace_back(&lib, *native);
        }
    }

    std::filesystem::create_directories(targetDir);
    progress.begin("Extracting natives", nativeJars.size());
    for (size_t i = 0; i < nativeJars.size(); ++i) {
        progress.advance(i + 1);
        const auto& [lib, artifact] = nativeJars[i];
        const auto jarPath = m_config.librariesDir / artifact.path;

        std::vector<std::string> exclude;
        if (lib->extract) {
            exclude = lib->extract->exclude;
        }

        Utils::ZipFile zip(jarPath);
        if (!zip.extractAll(targetDir, exclude)) {
            throw ZipError(jarPath, zip.getLastError());
        }
    }
    progress.end();
}

void AssetManager::copyResources(const AssetManifest& assets, const std::filesystem::path& resourcesDir,
                                 ProgressSink& progress) {
    if (!assets.isVirtual && !assets.mapToResources) {
        return;
    }

    progress.begin("Copying resources", assets.objects.size());
    size_t i = 0;
    for (const auto& [name, object] : assets.objects) {
        progress.advance(++i);
        const auto dest = resourcesDir / name;
        if (std::filesystem::exists(dest)) {
            continue;
        }
        std::filesystem::create_directories(dest.parent_path());
        std::filesystem::copy_file(m_config.assetsDir / object.objectPath(), dest);
    }
    progress.end();
}

std::filesystem::path AssetManager::makeForgeModdedJar(const std::filesystem::path& vanillaJar,
                                                       const std::string& loaderVersion,
                                                       const std::vector<LoaderLibrary>& jarMods) {
    const auto output = m_config.cacheDir / ("minecraft+forge-" + loaderVersion + ".jar");
    if (std::filesystem::exists(output)) {
        m_logger->trace("Modded jar already built: {}", output.string());
        return output;
    }

    m_logger->info("Building modded jar for forge {}", loaderVersion);
    Utils::TempDir scratch("quarry-jar");

    Utils::ZipFile vanilla(vanillaJar);
    if (!vanilla.extractAll(scratch.path())) {
        throw ZipError(vanillaJar, vanilla.getLastError());
    }
    std::filesystem::remove_all(scratch.path() / "META-INF");

    for (const auto& jarMod : jarMods) {
        const auto modPath = m_config.librariesDir / jarMod.assetPath();
        Utils::ZipFile mod(modPath);
        if (!mod.extractAll(scratch.path())) {
            throw ZipError(modPath, mod.getLastError());
        }
    }

    Utils::ZipFile out(output);
    if (!out.createFromDirectory(scratch.path())) {
        throw ZipError(output, out.getLastError());
    }
    return output;
}

} // namespace Quarry
