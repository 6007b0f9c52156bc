// include/Quarry/CurseForgeZip.hpp
#ifndef QUARRY_CURSEFORGE_ZIP_HPP
#define QUARRY_CURSEFORGE_ZIP_HPP

#include <Quarry/Types/CurseForge.hpp>
#include <Quarry/Utils/FileSystem.hpp>
#include <filesystem>
#include <vector>

namespace Quarry {

    // A CurseForge pack archive unpacked into a scratch directory that lives as
    // long as this object.
    class CurseForgeZip {
    public:
        // Throws ZipError, nlohmann::json::exception, or filesystem_error when
        // manifest.json is missing.
        static CurseForgeZip load(const std::filesystem::path& zipPath);

        const CursePackManifest& manifest() const { return m_manifest; }
        std::filesystem::path overridesDir() const;

        // Copies the overrides tree into gameDir. A missing overrides directory
        // propagates filesystem_error.
        void copyGameData(const std::filesystem::path& gameDir) const;

        // Override files relative to the overrides root, which is also where
        // copyGameData puts them relative to gameDir.
        std::vector<std::filesystem::path> listOverrides() const;

        std::vector<std::int64_t> fileIds() const;
        std::vector<std::int64_t> projectIds() const;

    private:
        CurseForgeZip(Utils::TempDir dir, CursePackManifest manifest);

        Utils::TempDir m_dir;
        CursePackManifest m_manifest;
    };

} // namespace Quarry

#endif // QUARRY_CURSEFORGE_ZIP_HPP
