// include/Quarry/VersionResolver.hpp
#ifndef QUARRY_VERSION_RESOLVER_HPP
#define QUARRY_VERSION_RESOLVER_HPP

#include <Quarry/AssetClient.hpp>
#include <Quarry/Config.hpp>
#include <Quarry/Types/AssetIndex.hpp>
#include <Quarry/Types/GameManifest.hpp>
#include <Quarry/Types/LoaderManifest.hpp>
#include <Quarry/Types/ModLoader.hpp>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace Quarry {

    /**
     * @brief Resolves game, loader and asset manifests with a cache-then-fetch policy.
     *
     * Fetched documents are written verbatim to the cache and never rewritten. A
     * cached document is parsed without any network access; delete the cache file
     * to force a refetch.
     */
    class VersionResolver {
    public:
        VersionResolver(const Config& config, HttpClient& httpClient);

        // <cache>/versions/<id>.json, with the log4j override applied
        GameManifest resolve(const std::string& versionId);

        // <cache>/versions/<name>_<version>.json, with fml_libs injected for legacy loaders
        LoaderManifest resolveLoader(const ModLoader& loader);
        LoaderManifest resolveLoader(const std::string& loaderId);

        // <assets>/indexes/<id>.json
        AssetManifest getAssetManifest(const GameManifest& game);

        // Loader versions built for mcVersion, newest first
        std::vector<LoaderIndexEntry> getLoaderVersions(const std::string& mcVersion, ModLoaderName name);

        VersionManifest getVersionManifest();

        std::filesystem::path gameManifestPath(const std::string& versionId) const;
        std::filesystem::path loaderManifestPath(const ModLoader& loader) const;
        std::filesystem::path assetManifestPath(const std::string& assetIndexId) const;

    private:
        const Config& m_config;
        AssetClient m_client;
        std::shared_ptr<spdlog::logger> m_logger;

        // Reads path if present, else calls fetch and stores its result at path.
        template <typename Fetch>
        std::string readOrFetch(const std::filesystem::path& path, Fetch&& fetch);
    };

    // Replaces log4j-api / log4j-core entries in (2.0.0, 2.17.1) with pinned 2.17.1
    // artifacts. Throws InvalidLibraryNameError for a name with fewer than three
    // parts and VersionParseError for an unparseable log4j version.
    void applyLog4jOverride(GameManifest& manifest);

    // Fills a legacy loader's fml_libs from the static tables. Throws
    // LoaderRequiresNotFoundError when the manifest names no Minecraft version.
    void applyFmlLibraries(LoaderManifest& manifest);

} // namespace Quarry

#endif // QUARRY_VERSION_RESOLVER_HPP
