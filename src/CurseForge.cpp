// src/CurseForge.cpp
#include <Quarry/Types/CurseForge.hpp>
#include <Quarry/Errors.hpp>

namespace Quarry {

CurseFile CurseFile::from_json(const json& j) {
    CurseFile file;
    file.id = j.at("id").get<std::int64_t>();
    file.modId = j.at("modId").get<std::int64_t>();
    file.fileName = j.at("fileName").get<std::string>();
    file.fileLength = j.value("fileLength", std::uint64_t{0});
    if (j.contains("downloadUrl") && j.at("downloadUrl").is_string()) {
        file.downloadUrl = j.at("downloadUrl").get<std::string>();
    }
    file.fileFingerprint = j.value("fileFingerprint", std::uint32_t{0});
    return file;
}

CurseMod CurseMod::from_json(const json& j) {
    CurseMod mod;
    mod.id = j.at("id").get<std::int64_t>();
    mod.name = j.value("name", "");
    mod.slug = j.value("slug", "");
    if (j.contains("links") && j.at("links").contains("websiteUrl")) {
        mod.websiteUrl = j.at("links").at("websiteUrl").get<std::string>();
    }
    mod.classId = j.at("classId").get<std::int64_t>();
    return mod;
}

FingerprintMatch FingerprintMatch::from_json(const json& j) {
    FingerprintMatch match;
    match.id = j.at("id").get<std::int64_t>();
    match.file = CurseFile::from_json(j.at("file"));
    return match;
}

FingerprintMatches FingerprintMatches::from_json(const json& j) {
    FingerprintMatches matches;
    for (const auto& m : j.at("exactMatches")) {
        matches.exactMatches.push_back(FingerprintMatch::from_json(m));
    }
    if (j.contains("exactFingerprints")) {
        matches.exactFingerprints = j.at("exactFingerprints").get<std::vector<std::uint32_t>>();
    }
    if (j.contains("unmatchedFingerprints") && j.at("unmatchedFingerprints").is_array()) {
        matches.unmatchedFingerprints = j.at("unmatchedFingerprints").get<std::vector<std::uint32_t>>();
    }
    return matches;
}

FileType class_id_to_file_type(std::int64_t classId) {
    switch (classId) {
        case 6: return FileType::MOD;
        case 12: return FileType::RESOURCE_PACK;
        case 6552: return FileType::SHADER_PACK;
        case 6945: return FileType::DATA_PACK;
        default: throw UnknownCatalogClassError(static_cast<long>(classId));
    }
}

std::string file_type_directory(FileType type) {
    switch (type) {
        case FileType::MOD: return "mods";
        case FileType::RESOURCE_PACK: return "resourcepacks";
        case FileType::SHADER_PACK: return "shaderpacks";
        case FileType::DATA_PACK: return "config/openloader/data";
    }
    return "mods";
}

FileDownload FileDownload::fromCatalog(const CurseFile& file, const CurseMod& mod) {
    FileDownload download;
    download.fileName = file.fileName;
    download.fileSize = file.fileLength;
    download.fileType = class_id_to_file_type(mod.classId);
    download.canAutoDownload = file.downloadUrl.has_value();
    download.url = file.downloadUrl ? *file.downloadUrl
                                    : mod.websiteUrl + "/download/" + std::to_string(file.id);
    return download;
}

std::string FileDownload::relativePath() const {
    return file_type_directory(fileType) + "/" + fileName;
}

CursePackManifest CursePackManifest::from_json(const json& j) {
    CursePackManifest manifest;
    const auto& minecraft = j.at("minecraft");
    manifest.minecraftVersion = minecraft.at("version").get<std::string>();
    if (minecraft.contains("modLoaders")) {
        for (const auto& loader : minecraft.at("modLoaders")) {
            manifest.modLoaders.push_back({loader.at("id").get<std::string>(), loader.value("primary", false)});
        }
    }
    manifest.manifestType = j.value("manifestType", "minecraftModpack");
    manifest.manifestVersion = j.value("manifestVersion", 1);
    manifest.name = j.at("name").get<std::string>();
    manifest.version = j.value("version", "");
    manifest.author = j.value("author", "");
    for (const auto& file : j.at("files")) {
        manifest.files.push_back({file.at("projectID").get<std::int64_t>(),
                                  file.at("fileID").get<std::int64_t>(),
                                  file.value("required", true)});
    }
    manifest.overrides = j.value("overrides", "overrides");
    return manifest;
}

std::optional<ModLoader> CursePackManifest::getModLoader() const {
    if (modLoaders.empty()) {
        return std::nullopt;
    }
    for (const auto& loader : modLoaders) {
        if (loader.primary) {
            return ModLoader::parse(loader.id);
        }
    }
    return ModLoader::parse(modLoaders.front().id);
}

}
