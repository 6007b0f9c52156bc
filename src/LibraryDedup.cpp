// src/LibraryDedup.cpp
#include <Quarry/LibraryDedup.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/Utils/Logger.hpp>

#include <map>

namespace Quarry {

DedupKey DedupKey::fromPath(const std::string& path) {
    // Split from the right into file name, version and everything before
    const size_t fileSep = path.rfind('/');
    if (fileSep == std::string::npos || fileSep == 0) {
        throw InvalidLibraryPathError(path);
    }
    const size_t versionSep = path.rfind('/', fileSep - 1);
    if (versionSep == std::string::npos) {
        throw InvalidLibraryPathError(path);
    }

    DedupKey key;
    key.artifactId = path.substr(0, versionSep);
    const std::string version = path.substr(versionSep + 1, fileSep - versionSep - 1);

    if (auto parsed = Utils::SemVer::parseLenient(version)) {
        key.version = *parsed;
    } else {
        QUARRY_LOG_WARN("[LibraryDedup] Unparseable version '{}' in {}, treating as 9.9.9", version, path);
        key.version = Utils::SemVer(9, 9, 9);
        key.versionDegraded = true;
    }
    return key;
}

std::vector<std::string> dedupLibraries(const std::vector<std::string>& paths) {
    std::vector<std::string> natives;
    std::vector<std::string> order; // artifact ids in first-seen order
    std::map<std::string, std::pair<Utils::SemVer, std::string>> kept;

    for (const auto& path : paths) {
        if (path.find("natives") != std::string::npos) {
            natives.push_back(path);
            continue;
        }

        DedupKey key = DedupKey::fromPath(path);
        auto it = kept.find(key.artifactId);
        if (it == kept.end()) {
            order.push_back(key.artifactId);
            kept.emplace(key.artifactId, std::make_pair(key.version, path));
        } else if (key.version >= it->second.first) {
            QUARRY_LOG_TRACE("[LibraryDedup] {} replaces {}", path, it->second.second);
            it->second = std::make_pair(key.version, path);
        } else {
            QUARRY_LOG_TRACE("[LibraryDedup] Dropping {} in favour of {}", path, it->second.second);
        }
    }

    std::vector<std::string> result;
    result.reserve(order.size() + natives.size());
    for (const auto& artifactId : order) {
        result.push_back(kept.at(artifactId).second);
    }
    result.insert(result.end(), natives.begin(), natives.end());
    return result;
}

} // namespace Quarry
