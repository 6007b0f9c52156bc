// src/ModpacksClient.cpp
#include <Quarry/ModpacksClient.hpp>
#include <Quarry/Utils/Logger.hpp>

#include <cpr/util.h>

namespace Quarry {

namespace {
    constexpr const char* kFtbPrefix = "ftb:";
}

ModpacksClient::ModpacksClient(HttpClient& httpClient) : m_httpClient(httpClient) {
    m_logger = Utils::Logger::GetOrCreateLogger("ModpacksClient");
}

std::string ModpacksClient::urlFor(const std::string& uri) {
    const std::string prefix = kFtbPrefix;
    if (uri.compare(0, prefix.size(), prefix) == 0) {
        return std::string(kFtbPackUrl) + uri.substr(prefix.size());
    }
    return std::string(kModpacksChUrl) + uri;
}

json ModpacksClient::get(const std::string& uri) {
    const std::string url = urlFor(uri);
    m_logger->info("Fetching {}", url);
    return json::parse(m_httpClient.Get(url));
}

ModpackManifest ModpacksClient::getModpack(std::int64_t packId) {
    return ModpackManifest::from_json(get(kFtbPrefix + std::to_string(packId)));
}

ModpackVersionManifest ModpacksClient::getModpackVersion(std::int64_t packId, std::int64_t versionId) {
    return ModpackVersionManifest::from_json(
        get(kFtbPrefix + std::to_string(packId) + "/" + std::to_string(versionId)));
}

ModpackManifest ModpacksClient::getCurseModpack(std::int64_t packId) {
    return ModpackManifest::from_json(get("curseforge/" + std::to_string(packId)));
}

ModpackVersionManifest ModpacksClient::getCurseModpackVersion(std::int64_t packId, std::int64_t versionId) {
    return ModpackVersionManifest::from_json(
        get("curseforge/" + std::to_string(packId) + "/" + std::to_string(versionId)));
}

ModpackSearch ModpacksClient::searchModpacks(const std::string& term, int limit) {
    const auto encoded = cpr::util::urlEncode(term);
    return ModpackSearch::from_json(
        get("modpack/search/" + std::to_string(limit) + "?term=" + std::string(encoded.begin(), encoded.end())));
}

} // namespace Quarry
