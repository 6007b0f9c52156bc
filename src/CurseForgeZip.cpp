// src/CurseForgeZip.cpp
#include <Quarry/CurseForgeZip.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/Utils/Logger.hpp>
#include <Quarry/Utils/ZipFile.hpp>

#include <fstream>
#include <system_error>
#include <utility>

namespace Quarry {

CurseForgeZip::CurseForgeZip(Utils::TempDir dir, CursePackManifest manifest)
    : m_dir(std::move(dir)), m_manifest(std::move(manifest)) {}

CurseForgeZip CurseForgeZip::load(const std::filesystem::path& zipPath) {
    Utils::TempDir dir("quarry-pack");

    Utils::ZipFile zip(zipPath);
    if (!zip.extractAll(dir.path())) {
        throw ZipError(zipPath, zip.getLastError());
    }

    const auto manifestPath = dir.path() / "manifest.json";
    std::ifstream in(manifestPath);
    if (!in) {
        throw std::filesystem::filesystem_error("pack archive has no manifest.json", zipPath,
                                                std::make_error_code(std::errc::no_such_file_or_directory));
    }
    CursePackManifest manifest = CursePackManifest::from_json(json::parse(in));
    QUARRY_LOG_INFO("Loaded pack {} {} ({} files)", manifest.name, manifest.version, manifest.files.size());

    return CurseForgeZip(std::move(dir), std::move(manifest));
}

std::filesystem::path CurseForgeZip::overridesDir() const {
    return m_dir.path() / m_manifest.overrides;
}

void CurseForgeZip::copyGameData(const std::filesystem::path& gameDir) const {
    Utils::copyDirAll(overridesDir(), gameDir);
}

std::vector<std::filesystem::path> CurseForgeZip::listOverrides() const {
    return Utils::listFilesRelative(overridesDir());
}

std::vector<std::int64_t> CurseForgeZip::fileIds() const {
    std::vector<std::int64_t> ids;
    for (const auto& file : m_manifest.files) {
        ids.push_back(file.fileID);
    }
    return ids;
}

std::vector<std::int64_t> CurseForgeZip::projectIds() const {
    std::vector<std::int64_t> ids;
    for (const auto& file : m_manifest.files) {
        ids.push_back(file.projectID);
    }
    return ids;
}

} // namespace Quarry
