// src/VersionResolver.cpp
#include <Quarry/VersionResolver.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/FmlLibraries.hpp>
#include <Quarry/Types/MavenCoordinate.hpp>
#include <Quarry/Utils/FileSystem.hpp>
#include <Quarry/Utils/Logger.hpp>
#include <Quarry/Utils/SemVer.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace Quarry {

namespace {

    std::string readFile(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::filesystem::filesystem_error("cannot read cache file", path,
                                                    std::make_error_code(std::errc::io_error));
        }
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    // Write next to the target and rename, so a crash never leaves a truncated cache file
    void writeFile(const std::filesystem::path& path, const std::string& contents) {
        std::filesystem::create_directories(path.parent_path());
        auto tmp = path;
        tmp += ".part";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            out << contents;
            Utils::commitFile(out, tmp);
        }
        std::filesystem::rename(tmp, path);
    }

    Library pinnedLog4j(const std::string& artifact, const std::string& sha1, std::uint64_t size) {
        const std::string path = "org/apache/logging/log4j/" + artifact + "/2.17.1/" + artifact + "-2.17.1.jar";
        Library lib;
        lib.name = "org.apache.logging.log4j:" + artifact + ":2.17.1";
        LibraryArtifact pinned;
        pinned.path = path;
        pinned.sha1 = sha1;
        pinned.size = size;
        pinned.url = "https://repo1.maven.org/maven2/" + path;
        lib.downloads.artifact = pinned;
        return lib;
    }

} // namespace

VersionResolver::VersionResolver(const Config& config, HttpClient& httpClient)
    : m_config(config), m_client(httpClient) {
    m_logger = Utils::Logger::GetOrCreateLogger("VersionResolver");
}

template <typename Fetch>
std::string VersionResolver::readOrFetch(const std::filesystem::path& path, Fetch&& fetch) {
    if (std::filesystem::exists(path)) {
        m_logger->trace("Cache hit: {}", path.string());
        return readFile(path);
    }
    m_logger->trace("Cache miss: {}", path.string());
    std::string text = fetch();
    writeFile(path, text);
    return text;
}

std::filesystem::path VersionResolver::gameManifestPath(const std::string& versionId) const {
    return m_config.versionsDir / (versionId + ".json");
}

std::filesystem::path VersionResolver::loaderManifestPath(const ModLoader& loader) const {
    return m_config.versionsDir / loader.cacheFileName();
}

std::filesystem::path VersionResolver::assetManifestPath(const std::string& assetIndexId) const {
    return m_config.assetsDir / "indexes" / (assetIndexId + ".json");
}

GameManifest VersionResolver::resolve(const std::string& versionId) {
    const std::string text = readOrFetch(gameManifestPath(versionId),
                                         [&] { return m_client.getGameManifestText(versionId); });
    GameManifest manifest = GameManifest::from_json(json::parse(text));
    applyLog4jOverride(manifest);
    return manifest;
}

LoaderManifest VersionResolver::resolveLoader(const ModLoader& loader) {
    const std::string text = readOrFetch(loaderManifestPath(loader),
                                         [&] { return m_client.getLoaderManifestText(loader); });
    LoaderManifest manifest = LoaderManifest::from_json(json::parse(text));
    if (manifest.isLegacy()) {
        applyFmlLibraries(manifest);
    }
    return manifest;
}

LoaderManifest VersionResolver::resolveLoader(const std::string& loaderId) {
    return resolveLoader(ModLoader::parse(loaderId));
}

AssetManifest VersionResolver::getAssetManifest(const GameManifest& game) {
    const std::string text = readOrFetch(assetManifestPath(game.assetIndex.id),
                                         [&] { return m_client.getAssetManifestText(game.assetIndex); });
    return AssetManifest::from_json(json::parse(text));
}

std::vector<LoaderIndexEntry> VersionResolver::getLoaderVersions(const std::string& mcVersion, ModLoaderName name) {
    const LoaderIndex index = m_client.getLoaderIndex(name);

    std::vector<std::pair<Utils::SemVer, LoaderIndexEntry>> matching;
    for (const auto& entry : index.versions) {
        if (!entry.isForMinecraft(mcVersion)) {
            continue;
        }
        auto version = Utils::SemVer::parseLenient(entry.version);
        if (!version) {
            m_logger->warn("Skipping loader version with unparseable version {}", entry.version);
            continue;
        }
        matching.emplace_back(*version, entry);
    }

    std::stable_sort(matching.begin(), matching.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<LoaderIndexEntry> result;
    result.reserve(matching.size());
    for (auto& [version, entry] : matching) {
        result.push_back(std::move(entry));
    }
    return result;
}

VersionManifest VersionResolver::getVersionManifest() {
    return m_client.getVersionManifest();
}

void applyLog4jOverride(GameManifest& manifest) {
    static const auto vulnerable = Utils::VersionRange::parse(">2.0.0 <2.17.1");

    for (auto& lib : manifest.libraries) {
        const MavenCoordinate coord = MavenCoordinate::parse(lib.name);
        if (coord.group != "org.apache.logging.log4j") {
            continue;
        }
        if (coord.artifact != "log4j-api" && coord.artifact != "log4j-core") {
            continue;
        }

        auto version = Utils::SemVer::parseLenient(coord.version);
        if (!version) {
            throw VersionParseError(coord.version);
        }
        if (!vulnerable->matches(*version)) {
            continue;
        }

        QUARRY_LOG_INFO("[VersionResolver] Replacing {} with pinned 2.17.1", lib.name);
        if (coord.artifact == "log4j-api") {
            lib = pinnedLog4j("log4j-api", "d771af8e336e372fb5399c99edabe0919aeaf5b2", 301872);
        } else {
            lib = pinnedLog4j("log4j-core", "779f60f3844dadc3ef597976fcb1e5127b1f343d", 1790452);
        }
    }
}

void applyFmlLibraries(LoaderManifest& manifest) {
    auto* legacy = manifest.legacy();
    if (legacy == nullptr) {
        return;
    }
    auto mcVersion = manifest.minecraftVersion();
    if (!mcVersion) {
        throw LoaderRequiresNotFoundError(manifest.uid + ":" + manifest.version);
    }
    legacy->fmlLibs = fmlLibrariesFor(*mcVersion);
}

} // namespace Quarry
