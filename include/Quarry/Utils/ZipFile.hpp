// include/Quarry/Utils/ZipFile.hpp
#ifndef QUARRY_ZIP_FILE_HPP
#define QUARRY_ZIP_FILE_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace Quarry::Utils {

    class ZipFile {
    public:
        explicit ZipFile(const std::filesystem::path &archivePath);
        ~ZipFile();

        ZipFile(const ZipFile &) = delete;
        ZipFile &operator=(const ZipFile &) = delete;

        // Attempts to open the archive for reading. Returns true on success.
        bool open();

        // Extracts every entry into outputDirectory. Entries whose name starts with
        // one of excludePrefixes (e.g. "META-INF/") are skipped.
        bool extractAll(const std::filesystem::path &outputDirectory,
                        const std::vector<std::string> &excludePrefixes = {});

        // Writes a new deflate archive at the archive path containing every regular
        // file below sourceDirectory, named by its path relative to it.
        bool createFromDirectory(const std::filesystem::path &sourceDirectory);

        bool isOpen() const;
        const std::filesystem::path &path() const { return m_archivePath; }
        std::string getLastError() const;

    private:
        std::filesystem::path m_archivePath;
        void *m_zipReader; // mz_zip_reader handle
        std::shared_ptr<spdlog::logger> m_logger;
        std::string m_lastErrorMsg;

        bool ensureDirectoryExists(const std::filesystem::path &path);
        void logMzError(int32_t err, const std::string &context);
    };

} // namespace Quarry::Utils

#endif // QUARRY_ZIP_FILE_HPP
