// include/Quarry/Types/CurseForge.hpp
#ifndef QUARRY_TYPES_CURSEFORGE_HPP
#define QUARRY_TYPES_CURSEFORGE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <Quarry/Types/ModLoader.hpp>
#include <nlohmann/json.hpp>

namespace Quarry {
    using json = nlohmann::json;

    // --- Catalog API records ---

    struct CurseFile {
        std::int64_t id = 0;
        std::int64_t modId = 0;
        std::string fileName;
        std::uint64_t fileLength = 0;
        std::optional<std::string> downloadUrl; // null when the author forbids third-party downloads
        std::uint32_t fileFingerprint = 0;

        static CurseFile from_json(const json& j);
    };

    struct CurseMod {
        std::int64_t id = 0;
        std::string name;
        std::string slug;
        std::string websiteUrl;
        std::int64_t classId = 0;

        static CurseMod from_json(const json& j);
    };

    struct FingerprintMatch {
        std::int64_t id = 0; // mod id
        CurseFile file;

        static FingerprintMatch from_json(const json& j);
    };

    struct FingerprintMatches {
        std::vector<FingerprintMatch> exactMatches;
        std::vector<std::uint32_t> exactFingerprints;
        std::vector<std::uint32_t> unmatchedFingerprints;

        static FingerprintMatches from_json(const json& j);
    };

    // --- Joined file + mod ---

    enum class FileType {
        MOD,
        RESOURCE_PACK,
        SHADER_PACK,
        DATA_PACK,
    };

    // 6, 12, 6552, 6945. Throws UnknownCatalogClassError otherwise.
    FileType class_id_to_file_type(std::int64_t classId);
    // Directory under the game dir: mods, resourcepacks, shaderpacks, config/openloader/data
    std::string file_type_directory(FileType type);

    struct FileDownload {
        std::string fileName;
        std::uint64_t fileSize = 0;
        FileType fileType = FileType::MOD;
        bool canAutoDownload = false;
        // Direct download URL, or the mod's web page when canAutoDownload is false
        std::string url;

        // file and mod must describe the same mod id
        static FileDownload fromCatalog(const CurseFile& file, const CurseMod& mod);

        // <category dir>/<fileName>
        std::string relativePath() const;
    };

    // --- CurseForge pack archive manifest.json ---

    struct CursePackFile {
        std::int64_t projectID = 0;
        std::int64_t fileID = 0;
        bool required = true;
    };

    struct CursePackModLoader {
        std::string id; // "forge-47.2.0"
        bool primary = false;
    };

    struct CursePackManifest {
        std::string minecraftVersion;
        std::vector<CursePackModLoader> modLoaders;
        std::string manifestType;
        int manifestVersion = 1;
        std::string name;
        std::string version;
        std::string author;
        std::vector<CursePackFile> files;
        std::string overrides = "overrides";

        static CursePackManifest from_json(const json& j);

        // Primary loader, else the first one listed
        std::optional<ModLoader> getModLoader() const;
    };
}

#endif // QUARRY_TYPES_CURSEFORGE_HPP
