// src/GameManifest.cpp
#include <Quarry/Types/GameManifest.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/Utils/Logger.hpp>

namespace Quarry {

GameManifest GameManifest::from_json(const nlohmann::json& j) {
    GameManifest version;
    version.id = j.at("id").get<std::string>();
    QUARRY_LOG_TRACE("[GameManifestParser] Parsing game manifest {}", version.id);

    version.assetIndex = AssetIndex::from_json(j.at("assetIndex"));
    version.assets = j.value("assets", version.assetIndex.id);
    if (j.contains("complianceLevel")) {
        version.complianceLevel = j.at("complianceLevel").get<unsigned int>();
    }

    for (auto& [key, val_json] : j.at("downloads").items()) {
        if (auto type = string_to_minecraft_jar_type(key)) {
            version.downloads[*type] = DownloadDetails::from_json(val_json);
        } else {
            QUARRY_LOG_TRACE("[GameManifestParser] Ignoring download kind '{}'", key);
        }
    }

    if (j.contains("javaVersion")) {
        version.javaVersion = JavaVersion::from_json(j.at("javaVersion"));
    }

    for (const auto& lib_json : j.at("libraries")) {
        version.libraries.push_back(Library::from_json(lib_json));
    }

    version.mainClass = j.at("mainClass").get<std::string>();
    if (j.contains("minimumLauncherVersion")) {
        version.minimumLauncherVersion = j.at("minimumLauncherVersion").get<unsigned int>();
    }

    version.releaseTime = j.at("releaseTime").get<std::string>();
    version.time = j.at("time").get<std::string>();
    version.type = j.at("type").get<std::string>();

    if (j.contains("arguments")) {
        version.arguments = Arguments::from_json(j.at("arguments"));
    }
    if (j.contains("minecraftArguments")) {
        if (version.arguments) {
            QUARRY_LOG_WARN("[GameManifestParser] {} has both argument forms, ignoring minecraftArguments", version.id);
        } else {
            version.minecraftArguments = j.at("minecraftArguments").get<std::string>();
        }
    }
    if (!version.arguments && !version.minecraftArguments) {
        throw MalformedManifestError(version.id, "neither arguments nor minecraftArguments present");
    }

    return version;
}

std::string GameManifest::clientJarPath() const {
    return "com/mojang/minecraft/" + id + "/minecraft-" + id + "-client.jar";
}

} // namespace Quarry
