// src/Library.cpp
#include <Quarry/Types/Library.hpp>
#include <Quarry/Errors.hpp>

namespace Quarry {

LibraryArtifact LibraryArtifact::from_json(const json& j) {
    LibraryArtifact artifact;
    if (j.contains("path")) artifact.path = j.at("path").get<std::string>();
    if (j.contains("sha1")) artifact.sha1 = j.at("sha1").get<std::string>();
    if (j.contains("size")) artifact.size = j.at("size").get<std::uint64_t>();
    if (j.contains("url")) artifact.url = j.at("url").get<std::string>();
    return artifact;
}

LibraryDownloads LibraryDownloads::from_json(const json& j) {
    LibraryDownloads downloads;
    if (j.contains("artifact")) {
        downloads.artifact = LibraryArtifact::from_json(j.at("artifact"));
    }
    if (j.contains("classifiers")) {
        std::map<std::string, LibraryArtifact> classifiers;
        for (auto& [key, val] : j.at("classifiers").items()) {
            classifiers[key] = LibraryArtifact::from_json(val);
        }
        downloads.classifiers = std::move(classifiers);
    }
    return downloads;
}

LibraryExtractRule LibraryExtractRule::from_json(const json& j) {
    LibraryExtractRule extractRule;
    if (j.contains("exclude") && j.at("exclude").is_array()) {
        for (const auto& item : j.at("exclude")) {
            extractRule.exclude.push_back(item.get<std::string>());
        }
    }
    return extractRule;
}

Library Library::from_json(const json& j) {
    Library lib;
    lib.name = j.at("name").get<std::string>();

    if (j.contains("downloads")) {
        lib.downloads = LibraryDownloads::from_json(j.at("downloads"));
    }

    if (j.contains("rules") && j.at("rules").is_array()) {
        lib.rules = Rule::from_json_array(j.at("rules"));
    }

    if (j.contains("natives") && j.at("natives").is_object()) {
        std::map<std::string, std::string> natives;
        for (auto& [os_key, classifier_val] : j.at("natives").items()) {
            natives[os_key] = classifier_val.get<std::string>();
        }
        lib.natives = std::move(natives);
    }

    if (j.contains("extract") && j.at("extract").is_object()) {
        lib.extract = LibraryExtractRule::from_json(j.at("extract"));
    }

    return lib;
}

std::optional<LibraryArtifact> Library::nativesArtifact(const std::string& osName, const std::string& bitness) const {
    if (!natives) {
        return std::nullopt;
    }

    auto keyIt = natives->find(osName);
    if (keyIt == natives->end()) {
        throw NativesError(name, "no natives entry for OS '" + osName + "'");
    }
    if (!downloads.classifiers) {
        throw NativesError(name, "natives declared but no classifiers to download");
    }

    std::string key = keyIt->second;
    const std::string archToken = "${arch}";
    if (auto pos = key.find(archToken); pos != std::string::npos) {
        key.replace(pos, archToken.size(), bitness);
    }

    auto artifactIt = downloads.classifiers->find(key);
    if (artifactIt == downloads.classifiers->end()) {
        throw NativesError(name, "classifier '" + key + "' not found");
    }
    return artifactIt->second;
}

std::vector<LibraryArtifact> Library::artifactsForDownload(const std::string& osName, const std::string& bitness) const {
    std::vector<LibraryArtifact> artifacts;
    if (downloads.artifact) {
        artifacts.push_back(*downloads.artifact);
    }
    if (auto native = nativesArtifact(osName, bitness)) {
        artifacts.push_back(*native);
    }
    if (artifacts.empty()) {
        throw NativesError(name, "library has neither an artifact nor natives to download");
    }
    return artifacts;
}

}
