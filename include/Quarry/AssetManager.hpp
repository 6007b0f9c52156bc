// include/Quarry/AssetManager.hpp
#ifndef QUARRY_ASSET_MANAGER_HPP
#define QUARRY_ASSET_MANAGER_HPP

#include <Quarry/AssetClient.hpp>
#include <Quarry/Config.hpp>
#include <Quarry/HttpClient.hpp>
#include <Quarry/Progress.hpp>
#include <Quarry/Rules.hpp>
#include <Quarry/Types/AssetIndex.hpp>
#include <Quarry/Types/GameManifest.hpp>
#include <Quarry/Types/LoaderManifest.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace Quarry {

    /**
     * @brief Downloads assets and libraries into the shared, content-addressed stores.
     *
     * A file that already exists at its destination is never downloaded again and,
     * unless Config::verifyHashes is set, never checked. Downloads run one at a time
     * and the first failure aborts the batch.
     */
    class AssetManager {
    public:
        AssetManager(const Config& config, HttpClient& httpClient, RulesContext rules = RulesContext::host());

        // <assets>/objects/<hh>/<hash> for every object
        void downloadAssets(const AssetManifest& assets, ProgressSink& progress);

        // Client jar, rule-matched game libraries (with host natives), then loader libraries
        void downloadLibraries(const GameManifest& game, const LoaderManifest* loader, ProgressSink& progress);
        void downloadGameLibraries(const GameManifest& game, ProgressSink& progress);
        void downloadLoaderLibraries(const LoaderManifest& loader, ProgressSink& progress);

        // Dedicated server jar of a vanilla release. Throws MalformedManifestError
        // when the game manifest has no server download.
        void downloadServerJar(const GameManifest& game, const std::filesystem::path& dest, ProgressSink& progress);

        // Installer jar named in the loader's maven files, kept in the library store.
        // Both throw LoaderInstallerNotFoundError when the loader lists none.
        std::filesystem::path installerJarPath(const LoaderManifest& loader) const;
        std::filesystem::path downloadInstallerJar(const LoaderManifest& loader, ProgressSink& progress);

        // Unpacks every host natives jar into targetDir. The directory is never cleared.
        void extractNatives(const GameManifest& game, const std::filesystem::path& targetDir, ProgressSink& progress);

        // Legacy asset layout: copies objects to resourcesDir/<name> for virtual or
        // map_to_resources indexes. No-op for modern indexes.
        void copyResources(const AssetManifest& assets, const std::filesystem::path& resourcesDir, ProgressSink& progress);

        /**
         * @brief Builds <cache>/minecraft+forge-<loaderVersion>.jar for jar-mod loaders.
         *
         * The vanilla jar is unpacked, its META-INF removed, each jar mod unpacked on
         * top in order, and the result zipped. An existing output jar is reused.
         * @return Path of the composite jar.
         */
        std::filesystem::path makeForgeModdedJar(const std::filesystem::path& vanillaJar,
                                                 const std::string& loaderVersion,
                                                 const std::vector<LoaderLibrary>& jarMods);

        // Library artifacts of the game for this host, relative to the library root
        std::vector<std::string> gameLibraryPaths(const GameManifest& game) const;

        const std::filesystem::path& librariesDir() const { return m_config.librariesDir; }
        const std::filesystem::path& assetsDir() const { return m_config.assetsDir; }
        std::filesystem::path virtualAssetsDir(const std::string& assetIndexId) const {
            return m_config.assetsDir / "virtual" / assetIndexId;
        }
        const std::filesystem::path& cacheDir() const { return m_config.cacheDir; }
        const RulesContext& rules() const { return m_rules; }

    private:
        const Config& m_config;
        HttpClient& m_httpClient;
        AssetClient m_client;
        RulesContext m_rules;
        std::string m_bitness;
        std::shared_ptr<spdlog::logger> m_logger;

        struct PendingDownload {
            std::string url;
            std::filesystem::path dest;
            std::optional<std::string> sha1;
        };

        void downloadBatch(const std::string& label, const std::vector<PendingDownload>& downloads, ProgressSink& progress);
        void downloadIfMissing(const PendingDownload& download);
        std::vector<PendingDownload> gameLibraryDownloads(const GameManifest& game) const;
        std::vector<PendingDownload> loaderLibraryDownloads(const LoaderManifest& loader) const;
    };

} // namespace Quarry

#endif // QUARRY_ASSET_MANAGER_HPP
