// src/VersionManifest.cpp
#include <Quarry/Types/VersionManifest.hpp>

namespace Quarry {

VersionMeta VersionMeta::from_json(const json& j) {
    VersionMeta meta;
    meta.id = j.at("id").get<std::string>();
    meta.type = j.at("type").get<std::string>();
    meta.url = j.at("url").get<std::string>();
    meta.time = j.at("time").get<std::string>();
    meta.releaseTime = j.at("releaseTime").get<std::string>();
    meta.sha1 = j.value("sha1", "");
    meta.complianceLevel = j.value("complianceLevel", 0u);
    return meta;
}

VersionManifest VersionManifest::from_json(const json& j) {
    VersionManifest manifest;
    if (j.contains("latest")) {
        manifest.latestRelease = j.at("latest").value("release", "");
        manifest.latestSnapshot = j.at("latest").value("snapshot", "");
    }
    for (const auto& entry : j.at("versions")) {
        manifest.versions.push_back(VersionMeta::from_json(entry));
    }
    return manifest;
}

std::optional<VersionMeta> VersionManifest::find(const std::string& id) const {
    for (const auto& meta : versions) {
        if (meta.id == id) {
            return meta;
        }
    }
    return std::nullopt;
}

}
