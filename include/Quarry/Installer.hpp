// include/Quarry/Installer.hpp
#ifndef QUARRY_INSTALLER_HPP
#define QUARRY_INSTALLER_HPP

#include <Quarry/CurseClient.hpp>
#include <Quarry/CurseForgeZip.hpp>
#include <Quarry/HttpClient.hpp>
#include <Quarry/Progress.hpp>
#include <Quarry/Types/CurseForge.hpp>
#include <Quarry/Types/Modpack.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>
#include <spdlog/logger.h>

namespace Quarry {

    struct InstallResult {
        // Every file the install is responsible for, relative to the destination
        // directory. Blocked catalog files are included.
        std::vector<std::filesystem::path> installedFiles;
        // Catalog files the user has to fetch by hand; empty optional when none
        std::optional<std::vector<FileDownload>> blocked;
    };

    /**
     * @brief Installs modpack content into a game directory.
     *
     * Existing destination files are never downloaded again. The first failed
     * download aborts the install. Removing files left over from a previous
     * install is the caller's job (see Instance::applyModpackInstall).
     */
    class Installer {
    public:
        Installer(std::filesystem::path destDir, HttpClient& httpClient, CurseClient& curseClient);

        // modpacks.ch / FTB pack version. Server installs skip clientonly files.
        InstallResult installPack(const ModpackVersionManifest& pack, bool isServer, ProgressSink& progress);

        // Overrides plus every catalog file named by the archive manifest
        InstallResult installPackZip(const CurseForgeZip& pack, ProgressSink& progress);

        std::optional<std::vector<FileDownload>> installCurseForgeFile(std::int64_t modId, std::int64_t fileId,
                                                                       ProgressSink& progress);

        // Copies a manually downloaded blocked file into its category directory
        void installFile(const FileDownload& download, const std::filesystem::path& srcPath) const;

        std::filesystem::path filePath(const FileDownload& download) const;
        const std::filesystem::path& destDir() const { return m_destDir; }

    private:
        std::filesystem::path m_destDir;
        HttpClient& m_httpClient;
        CurseClient& m_curseClient;
        std::shared_ptr<spdlog::logger> m_logger;

        InstallResult downloadCurseForgeFiles(const std::vector<std::int64_t>& fileIds,
                                              const std::vector<std::int64_t>& projectIds,
                                              std::vector<std::filesystem::path> installedFiles,
                                              ProgressSink& progress);
    };

} // namespace Quarry

#endif // QUARRY_INSTALLER_HPP
