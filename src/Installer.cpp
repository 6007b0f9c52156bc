// src/Installer.cpp
#include <Quarry/Installer.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/Utils/FileSystem.hpp>
#include <Quarry/Utils/Logger.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace Quarry {

Installer::Installer(std::filesystem::path destDir, HttpClient& httpClient, CurseClient& curseClient)
    : m_destDir(std::move(destDir)), m_httpClient(httpClient), m_curseClient(curseClient) {
    m_logger = Utils::Logger::GetOrCreateLogger("Installer");
}

std::filesystem::path Installer::filePath(const FileDownload& download) const {
    return m_destDir / download.relativePath();
}

void Installer::installFile(const FileDownload& download, const std::filesystem::path& srcPath) const {
    const auto dest = filePath(download);
    std::filesystem::create_directories(dest.parent_path());
    std::filesystem::copy_file(srcPath, dest, std::filesystem::copy_options::overwrite_existing);
    m_logger->info("Installed {} to {}", srcPath.filename().string(), dest.string());
}

InstallResult Installer::installPackZip(const CurseForgeZip& pack, ProgressSink& progress) {
    m_logger->info("Installing pack archive {} into {}", pack.manifest().name, m_destDir.string());
    pack.copyGameData(m_destDir);
    auto installed = pack.listOverrides();
    return downloadCurseForgeFiles(pack.fileIds(), pack.projectIds(), std::move(installed), progress);
}

InstallResult Installer::installPack(const ModpackVersionManifest& pack, bool isServer, ProgressSink& progress) {
    m_logger->info("Installing {} ({} install) into {}", pack.name, isServer ? "server" : "client",
                   m_destDir.string());

    std::vector<const ModpackFile*> packFiles;
    for (const auto& file : pack.files) {
        if (isServer && file.clientonly) {
            m_logger->trace("Skipping client-only file {}", file.name);
            continue;
        }
        packFiles.push_back(&file);
    }

    std::vector<const ModpackFile*> assets;
    std::copy_if(packFiles.begin(), packFiles.end(), std::back_inserter(assets),
                 [](const ModpackFile* f) { return f->url.has_value(); });

    std::vector<std::filesystem::path> installed;

    progress.begin("Downloading assets...", assets.size());
    for (size_t i = 0; i < assets.size(); ++i) {
        const ModpackFile& file = *assets[i];

        // a single asset holding a whole CurseForge archive; only its overrides are used
        if (file.type == "cf-extract") {
            Utils::TempDir scratch("quarry-cf-extract");
            const auto archivePath = scratch.path() / file.name;
            m_httpClient.Download(*file.url, archivePath);

            const CurseForgeZip nested = CurseForgeZip::load(archivePath);
            nested.copyGameData(m_destDir);
            auto overrides = nested.listOverrides();
            installed.insert(installed.end(), overrides.begin(), overrides.end());
        } else {
            const auto relative = std::filesystem::path(file.path) / file.name;
            const auto dest = m_destDir / relative;
            if (std::filesystem::exists(dest)) {
                m_logger->trace("{} already present, skipping", relative.generic_string());
            } else {
                m_httpClient.Download(*file.url, dest);
            }
            installed.push_back(relative.lexically_normal());
        }

        progress.advance(i + 1);
    }
    progress.end();

    std::vector<std::int64_t> fileIds;
    std::vector<std::int64_t> projectIds;
    for (const ModpackFile* file : packFiles) {
        if (file->curseforge) {
            fileIds.push_back(file->curseforge->fileId);
            projectIds.push_back(file->curseforge->projectId);
        }
    }

    return downloadCurseForgeFiles(fileIds, projectIds, std::move(installed), progress);
}

std::optional<std::vector<FileDownload>> Installer::installCurseForgeFile(std::int64_t modId, std::int64_t fileId,
                                                                          ProgressSink& progress) {
    return downloadCurseForgeFiles({fileId}, {modId}, {}, progress).blocked;
}

InstallResult Installer::downloadCurseForgeFiles(const std::vector<std::int64_t>& fileIds,
                                                 const std::vector<std::int64_t>& projectIds,
                                                 std::vector<std::filesystem::path> installedFiles,
                                                 ProgressSink& progress) {
    auto files = m_curseClient.getFiles(fileIds);
    auto mods = m_curseClient.getMods(projectIds);

    if (files.size() != mods.size()) {
        m_logger->error("Catalog returned {} files for {} mods", files.size(), mods.size());
        throw CurseFileListMismatchError(files.size(), mods.size());
    }

    std::sort(files.begin(), files.end(), [](const CurseFile& a, const CurseFile& b) { return a.modId < b.modId; });
    std::sort(mods.begin(), mods.end(), [](const CurseMod& a, const CurseMod& b) { return a.id < b.id; });

    std::vector<FileDownload> downloads;
    std::vector<FileDownload> blocked;
    for (size_t i = 0; i < files.size(); ++i) {
        FileDownload download = FileDownload::fromCatalog(files[i], mods[i]);
        installedFiles.push_back(std::filesystem::path(download.relativePath()));
        if (download.canAutoDownload) {
            downloads.push_back(std::move(download));
        } else {
            blocked.push_back(std::move(download));
        }
    }

    // mods/ must exist even when every file is blocked
    std::filesystem::create_directories(m_destDir / "mods");

    progress.begin("Downloading mods...", downloads.size());
    for (size_t i = 0; i < downloads.size(); ++i) {
        const auto dest = filePath(downloads[i]);
        if (std::filesystem::exists(dest)) {
            m_logger->trace("{} already present, skipping", downloads[i].fileName);
        } else {
            m_httpClient.Download(downloads[i].url, dest);
        }
        progress.advance(i + 1);
    }
    progress.end();

    m_logger->info("Installed {} catalog files, {} need a manual download", downloads.size(), blocked.size());

    InstallResult result;
    result.installedFiles = std::move(installedFiles);
    if (!blocked.empty()) {
        result.blocked = std::move(blocked);
    }
    return result;
}

} // namespace Quarry
