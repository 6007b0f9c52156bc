// src/InstanceManifest.cpp
#include <Quarry/Types/InstanceManifest.hpp>
#include <Quarry/Errors.hpp>

namespace Quarry {

std::string modpack_source_to_string(ModpackSource source) {
    switch (source) {
        case ModpackSource::CURSEFORGE: return "curseforge";
        case ModpackSource::FTB: return "ftb";
        case ModpackSource::CURSE_ZIP: return "curse_zip";
    }
    return "curseforge";
}

ModpackSource string_to_modpack_source(const std::string& s) {
    if (s == "curseforge") return ModpackSource::CURSEFORGE;
    if (s == "ftb") return ModpackSource::FTB;
    if (s == "curse_zip") return ModpackSource::CURSE_ZIP;
    throw MalformedManifestError("instance manifest", "unknown modpack type '" + s + "'");
}

ModpackId ModpackId::curseforge(std::int64_t packId, std::int64_t version) {
    ModpackId id;
    id.source = ModpackSource::CURSEFORGE;
    id.packId = packId;
    id.version = version;
    return id;
}

ModpackId ModpackId::ftb(std::int64_t packId, std::int64_t version) {
    ModpackId id;
    id.source = ModpackSource::FTB;
    id.packId = packId;
    id.version = version;
    return id;
}

ModpackId ModpackId::curseZip(const std::string& fileName) {
    ModpackId id;
    id.source = ModpackSource::CURSE_ZIP;
    id.fileName = fileName;
    return id;
}

ModpackId ModpackId::from_json(const json& j) {
    ModpackId id;
    id.source = string_to_modpack_source(j.at("type").get<std::string>());
    if (id.source == ModpackSource::CURSE_ZIP) {
        id.fileName = j.at("file_name").get<std::string>();
    } else {
        id.packId = j.at("pack_id").get<std::int64_t>();
        id.version = j.at("version").get<std::int64_t>();
    }
    return id;
}

json ModpackId::to_json() const {
    json j = {{"type", modpack_source_to_string(source)}};
    if (source == ModpackSource::CURSE_ZIP) {
        j["file_name"] = fileName;
    } else {
        j["pack_id"] = packId;
        j["version"] = version;
    }
    return j;
}

bool ModpackId::operator==(const ModpackId& o) const {
    if (source != o.source) return false;
    if (source == ModpackSource::CURSE_ZIP) return fileName == o.fileName;
    return packId == o.packId && version == o.version;
}

InstanceManifest InstanceManifest::from_json(const json& j) {
    InstanceManifest manifest;
    manifest.mcVersion = j.at("mc_version").get<std::string>();
    manifest.gameDir = j.value("game_dir", "minecraft");
    if (j.contains("java_path") && !j.at("java_path").is_null()) {
        manifest.javaPath = j.at("java_path").get<std::string>();
    }
    if (j.contains("java_args") && !j.at("java_args").is_null()) {
        manifest.javaArgs = j.at("java_args").get<std::vector<std::string>>();
    }
    if (j.contains("mod_loader") && !j.at("mod_loader").is_null()) {
        manifest.modLoader = ModLoader::from_json(j.at("mod_loader"));
    }
    if (j.contains("custom_jar") && !j.at("custom_jar").is_null()) {
        manifest.customJar = j.at("custom_jar").get<std::string>();
    }
    if (j.contains("modpack") && !j.at("modpack").is_null()) {
        const auto& mp = j.at("modpack");
        manifest.modpack = InstanceModpack{ModpackId::from_json(mp.at("id")),
                                           mp.value("files", std::vector<std::string>{})};
    }
    return manifest;
}

json InstanceManifest::to_json() const {
    json j = {
        {"mc_version", mcVersion},
        {"game_dir", gameDir},
    };
    if (javaPath) j["java_path"] = *javaPath;
    if (javaArgs) j["java_args"] = *javaArgs;
    if (modLoader) j["mod_loader"] = modLoader->to_json();
    if (customJar) j["custom_jar"] = *customJar;
    if (modpack) {
        j["modpack"] = {
            {"id", modpack->id.to_json()},
            {"files", modpack->files},
        };
    }
    return j;
}

}
