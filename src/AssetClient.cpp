// src/AssetClient.cpp
#include <Quarry/AssetClient.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/Utils/Logger.hpp>

namespace Quarry {

AssetClient::AssetClient(HttpClient& httpClient) : m_httpClient(httpClient) {
    m_logger = Utils::Logger::GetOrCreateLogger("AssetClient");
}

VersionManifest AssetClient::getVersionManifest() {
    m_logger->info("Fetching version manifest from {}", kVersionManifestUrl);
    return VersionManifest::from_json(json::parse(m_httpClient.Get(kVersionManifestUrl)));
}

std::string AssetClient::getGameManifestText(const std::string& versionId) {
    auto meta = getVersionManifest().find(versionId);
    if (!meta) {
        m_logger->error("Version {} is not in the version manifest", versionId);
        throw VersionNotFoundError(versionId);
    }
    m_logger->info("Fetching game manifest for {} from {}", versionId, meta->url);
    return m_httpClient.Get(meta->url);
}

LoaderIndex AssetClient::getLoaderIndex(ModLoaderName name) {
    const std::string url = loaderIndexUrl(name);
    m_logger->info("Fetching {} index from {}", mod_loader_name_to_string(name), url);
    return LoaderIndex::from_json(json::parse(m_httpClient.Get(url)));
}

std::string AssetClient::getLoaderManifestText(const ModLoader& loader) {
    const LoaderIndex index = getLoaderIndex(loader.name);
    bool listed = false;
    for (const auto& entry : index.versions) {
        if (entry.version == loader.version) {
            listed = true;
            break;
        }
    }
    if (!listed) {
        m_logger->error("{} is not in the {} index", loader.version, mod_loader_name_to_string(loader.name));
        throw LoaderVersionNotFoundError(loader.id());
    }

    const std::string url = loaderManifestUrl(loader);
    m_logger->info("Fetching loader manifest {} from {}", loader.id(), url);
    return m_httpClient.Get(url);
}

std::string AssetClient::getAssetManifestText(const AssetIndex& assetIndex) {
    m_logger->info("Fetching asset index {} from {}", assetIndex.id, assetIndex.url);
    return m_httpClient.Get(assetIndex.url);
}

void AssetClient::downloadAsset(const AssetObject& object, const std::filesystem::path& dest) {
    m_httpClient.Download(assetUrl(object.hash), dest);
}

std::string AssetClient::loaderIndexUrl(ModLoaderName name) {
    return name == ModLoaderName::NEOFORGE ? kNeoForgeIndexUrl : kForgeIndexUrl;
}

std::string AssetClient::loaderManifestUrl(const ModLoader& loader) {
    std::string url = loaderIndexUrl(loader.name);
    const std::string indexFile = "index.json";
    url.replace(url.size() - indexFile.size(), indexFile.size(), loader.version + ".json");
    return url;
}

std::string AssetClient::assetUrl(const std::string& hash) {
    return std::string(kResourcesUrl) + hash.substr(0, 2) + "/" + hash;
}

} // namespace Quarry
