// src/CurseClient.cpp
#include <Quarry/CurseClient.hpp>
#include <Quarry/Utils/Logger.hpp>

#include <set>
#include <utility>

namespace Quarry {

CurseClient::CurseClient(HttpClient& httpClient, std::string apiKey)
    : m_httpClient(httpClient), m_apiKey(std::move(apiKey)) {
    m_logger = Utils::Logger::GetOrCreateLogger("CurseClient");
    if (m_apiKey.empty()) {
        m_logger->warn("No CurseForge API key configured, catalog requests will be rejected");
    }
}

json CurseClient::post(const std::string& uri, const json& body) {
    const std::string url = std::string(kApiUrl) + uri;
    const HttpClient::Headers headers = {
        {"x-api-key", m_apiKey},
        {"Content-Type", "application/json"},
        {"Accept", "application/json"},
    };
    m_logger->trace("POST {}", url);
    const json response = json::parse(m_httpClient.Post(url, body.dump(), headers));
    return response.at("data");
}

std::vector<CurseFile> CurseClient::getFiles(const std::vector<std::int64_t>& fileIds) {
    // the catalog answers 400 to an empty id list
    if (fileIds.empty()) {
        return {};
    }

    m_logger->info("Fetching {} file records", fileIds.size());
    const json data = post("mods/files", json{{"fileIds", fileIds}});

    std::vector<CurseFile> files;
    std::set<std::int64_t> seenMods;
    for (const auto& entry : data) {
        CurseFile file = CurseFile::from_json(entry);
        if (!seenMods.insert(file.modId).second) {
            m_logger->trace("Dropping duplicate file {} for mod {}", file.id, file.modId);
            continue;
        }
        files.push_back(std::move(file));
    }
    return files;
}

std::vector<CurseMod> CurseClient::getMods(const std::vector<std::int64_t>& modIds) {
    if (modIds.empty()) {
        return {};
    }

    m_logger->info("Fetching {} mod records", modIds.size());
    const json data = post("mods", json{{"modIds", modIds}});

    std::vector<CurseMod> mods;
    mods.reserve(data.size());
    for (const auto& entry : data) {
        mods.push_back(CurseMod::from_json(entry));
    }
    return mods;
}

FingerprintMatches CurseClient::getFingerprintMatches(const std::vector<std::uint32_t>& fingerprints) {
    m_logger->info("Matching {} fingerprints", fingerprints.size());
    return FingerprintMatches::from_json(
        post("fingerprints/" + std::to_string(kMinecraftGameId), json{{"fingerprints", fingerprints}}));
}

} // namespace Quarry
