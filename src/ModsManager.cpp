// src/ModsManager.cpp
#include <Quarry/ModsManager.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/Utils/Crypto.hpp>
#include <Quarry/Utils/Logger.hpp>

#include <algorithm>
#include <utility>

namespace Quarry {

ModsManager::ModsManager(std::filesystem::path modsDir, std::vector<InstalledMod> mods)
    : m_modsDir(std::move(modsDir)), m_mods(std::move(mods)) {}

ModsManager ModsManager::load(const std::filesystem::path& modsDir, CurseClient& client) {
    std::vector<std::pair<std::string, std::uint32_t>> hashes;
    for (const auto& entry : std::filesystem::directory_iterator(modsDir)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        hashes.emplace_back(entry.path().filename().string(), Utils::calculateFileFingerprint(entry.path()));
    }
    std::sort(hashes.begin(), hashes.end());

    std::vector<std::uint32_t> fingerprints;
    for (const auto& [name, hash] : hashes) {
        fingerprints.push_back(hash);
    }

    const FingerprintMatches matches = client.getFingerprintMatches(fingerprints);

    std::vector<InstalledMod> mods;
    for (const auto& [name, hash] : hashes) {
        const std::uint32_t fingerprint = hash;
        auto match = std::find_if(matches.exactMatches.begin(), matches.exactMatches.end(),
                                  [&](const FingerprintMatch& m) { return m.file.fileFingerprint == fingerprint; });
        if (match == matches.exactMatches.end()) {
            QUARRY_LOG_ERROR("{} (fingerprint {}) is not in the catalog", name, fingerprint);
            throw MissingFingerprintError(name);
        }
        mods.push_back({name, match->file.modId, fingerprint});
    }

    QUARRY_LOG_INFO("Identified {} mods in {}", mods.size(), modsDir.string());
    return ModsManager(modsDir, std::move(mods));
}

std::optional<InstalledMod> ModsManager::find(std::int64_t modId) const {
    auto it = std::find_if(m_mods.begin(), m_mods.end(), [&](const InstalledMod& m) { return m.modId == modId; });
    if (it == m_mods.end()) {
        return std::nullopt;
    }
    return *it;
}

bool ModsManager::removeExisting(std::int64_t modId) {
    auto it = std::find_if(m_mods.begin(), m_mods.end(), [&](const InstalledMod& m) { return m.modId == modId; });
    if (it == m_mods.end()) {
        return false;
    }
    std::filesystem::remove(m_modsDir / it->fileName);
    QUARRY_LOG_INFO("Removed {} (mod {})", it->fileName, modId);
    m_mods.erase(it);
    return true;
}

} // namespace Quarry
