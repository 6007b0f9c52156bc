// include/Quarry/AssetClient.hpp
#ifndef QUARRY_ASSET_CLIENT_HPP
#define QUARRY_ASSET_CLIENT_HPP

#include <Quarry/HttpClient.hpp>
#include <Quarry/Types/AssetIndex.hpp>
#include <Quarry/Types/LoaderManifest.hpp>
#include <Quarry/Types/ModLoader.hpp>
#include <Quarry/Types/VersionManifest.hpp>
#include <filesystem>
#include <string>
#include <spdlog/logger.h>

namespace Quarry {

    // Remote endpoints for game, loader and asset metadata.
    class AssetClient {
    public:
        static constexpr const char* kVersionManifestUrl = "https://piston-meta.mojang.com/mc/game/version_manifest_v2.json";
        static constexpr const char* kResourcesUrl = "https://resources.download.minecraft.net/";
        static constexpr const char* kForgeIndexUrl = "https://meta.prismlauncher.org/v1/net.minecraftforge/index.json";
        static constexpr const char* kNeoForgeIndexUrl = "https://meta.prismlauncher.org/v1/net.neoforged/index.json";

        explicit AssetClient(HttpClient& httpClient);

        VersionManifest getVersionManifest();

        // Raw JSON of the per-version game manifest. Throws VersionNotFoundError
        // when the id is not in the version manifest.
        std::string getGameManifestText(const std::string& versionId);

        LoaderIndex getLoaderIndex(ModLoaderName name);

        // Raw JSON of a loader version. Throws LoaderVersionNotFoundError when the
        // version is not in the loader's index.
        std::string getLoaderManifestText(const ModLoader& loader);

        std::string getAssetManifestText(const AssetIndex& assetIndex);

        void downloadAsset(const AssetObject& object, const std::filesystem::path& dest);

        static std::string loaderIndexUrl(ModLoaderName name);
        static std::string loaderManifestUrl(const ModLoader& loader);
        static std::string assetUrl(const std::string& hash);

    private:
        HttpClient& m_httpClient;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Quarry

#endif // QUARRY_ASSET_CLIENT_HPP
