// src/Utils/ZipFile.cpp
#include <Quarry/Utils/Logger.hpp>
#include <Quarry/Utils/ZipFile.hpp>

extern "C" {
    #include "mz.h"
    #include "mz_zip.h"
    #include "mz_zip_rw.h"
}

#include <algorithm>

namespace Quarry::Utils {

    namespace {

        // Rejects absolute names and names that climb out of the extraction root
        bool isSafeEntryName(const std::filesystem::path &entry) {
            if (entry.is_absolute() || entry.has_root_name()) {
                return false;
            }
            for (const auto &part : entry) {
                if (part == "..") return false;
            }
            return true;
        }

        bool hasExcludedPrefix(const std::string &name, const std::vector<std::string> &excludePrefixes) {
            return std::any_of(excludePrefixes.begin(), excludePrefixes.end(), [&](const std::string &prefix) {
                return !prefix.empty() && name.compare(0, prefix.size(), prefix) == 0;
            });
        }

    } // namespace

    ZipFile::ZipFile(const std::filesystem::path &archivePath) : m_archivePath(archivePath), m_zipReader(nullptr) {
        m_logger = Logger::GetOrCreateLogger("ZipFile");
        m_zipReader = mz_zip_reader_create();
        if (!m_zipReader) {
            m_lastErrorMsg = "Failed to create zip reader instance.";
            m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
        }
    }

    ZipFile::~ZipFile() {
        if (m_zipReader) {
            if (isOpen()) {
                mz_zip_reader_close(m_zipReader);
            }
            mz_zip_reader_delete(&m_zipReader);
        }
    }

    void ZipFile::logMzError(int32_t err, const std::string &context) {
        m_lastErrorMsg = context + ": minizip-ng error " + std::to_string(err);
        m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
    }

    bool ZipFile::open() {
        if (!m_zipReader) {
            m_lastErrorMsg = "Zip reader was not created.";
            return false;
        }
        if (isOpen()) {
            return true;
        }

        m_logger->trace("[{}] Opening archive", m_archivePath.filename().string());
        int32_t err = mz_zip_reader_open_file(m_zipReader, m_archivePath.string().c_str());
        if (err != MZ_OK) {
            logMzError(err, "Failed to open zip file");
            return false;
        }
        return true;
    }

    bool ZipFile::isOpen() const {
        if (!m_zipReader)
            return false;
        return mz_zip_reader_is_open(m_zipReader) == MZ_OK;
    }

    std::string ZipFile::getLastError() const { return m_lastErrorMsg; }

    bool ZipFile::ensureDirectoryExists(const std::filesystem::path &path) {
        if (path.empty())
            return true;

        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            m_lastErrorMsg = "Failed to create directory " + path.string() + ": " + ec.message();
            m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
            return false;
        }
        return true;
    }

    bool ZipFile::extractAll(const std::filesystem::path &outputDirectory,
                             const std::vector<std::string> &excludePrefixes) {
        if (!open()) {
            return false;
        }

        m_logger->trace("[{}] Extracting to {}", m_archivePath.filename().string(), outputDirectory.string());
        if (!ensureDirectoryExists(outputDirectory)) {
            return false;
        }

        int32_t err = mz_zip_reader_goto_first_entry(m_zipReader);
        if (err != MZ_OK && err != MZ_END_OF_LIST) {
            logMzError(err, "Failed to go to first entry");
            return false;
        }

        while (err == MZ_OK) {
            mz_zip_file *file_info = nullptr; // owned by the reader
            err = mz_zip_reader_entry_get_info(m_zipReader, &file_info);
            if (err != MZ_OK) {
                logMzError(err, "Failed to get entry info");
                return false;
            }

            const std::string entryName = file_info->filename;
            const std::filesystem::path entryPath(entryName);

            if (!isSafeEntryName(entryPath)) {
                m_lastErrorMsg = "Refusing to extract entry outside target directory: " + entryName;
                m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
                return false;
            }

            if (hasExcludedPrefix(entryName, excludePrefixes)) {
                m_logger->trace("[{}] Skipping excluded entry {}", m_archivePath.filename().string(), entryName);
            } else if (mz_zip_reader_entry_is_dir(m_zipReader) == MZ_OK) {
                if (!ensureDirectoryExists(outputDirectory / entryPath)) {
                    return false;
                }
            } else {
                std::filesystem::path output_path = outputDirectory / entryPath;
                if (!ensureDirectoryExists(output_path.parent_path())) {
                    return false;
                }
                err = mz_zip_reader_entry_save_file(m_zipReader, output_path.string().c_str());
                if (err != MZ_OK) {
                    logMzError(err, "Failed to save entry " + entryName + " to " + output_path.string());
                    return false;
                }
            }

            err = mz_zip_reader_goto_next_entry(m_zipReader);
        }

        if (err != MZ_END_OF_LIST) {
            logMzError(err, "An error occurred during entry traversal");
            return false;
        }
        return true;
    }

    bool ZipFile::createFromDirectory(const std::filesystem::path &sourceDirectory) {
        if (!std::filesystem::is_directory(sourceDirectory)) {
            m_lastErrorMsg = "Source is not a directory: " + sourceDirectory.string();
            m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
            return false;
        }
        if (!ensureDirectoryExists(m_archivePath.parent_path())) {
            return false;
        }

        void *writer = mz_zip_writer_create();
        if (!writer) {
            m_lastErrorMsg = "Failed to create zip writer instance.";
            m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
            return false;
        }

        mz_zip_writer_set_compress_method(writer, MZ_COMPRESS_METHOD_DEFLATE);

        int32_t err = mz_zip_writer_open_file(writer, m_archivePath.string().c_str(), 0, 0);
        if (err != MZ_OK) {
            logMzError(err, "Failed to create zip file");
            mz_zip_writer_delete(&writer);
            return false;
        }

        bool ok = true;
        std::error_code ec;
        for (auto it = std::filesystem::recursive_directory_iterator(sourceDirectory, ec);
             ok && !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (!it->is_regular_file()) {
                continue;
            }
            const std::string nameInZip = std::filesystem::relative(it->path(), sourceDirectory).generic_string();
            err = mz_zip_writer_add_file(writer, it->path().string().c_str(), nameInZip.c_str());
            if (err != MZ_OK) {
                logMzError(err, "Failed to add " + nameInZip);
                ok = false;
            }
        }
        if (ec) {
            m_lastErrorMsg = "Failed to walk " + sourceDirectory.string() + ": " + ec.message();
            m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
            ok = false;
        }

        err = mz_zip_writer_close(writer);
        if (err != MZ_OK && ok) {
            logMzError(err, "Failed to finalize zip file");
            ok = false;
        }
        mz_zip_writer_delete(&writer);

        if (!ok) {
            std::filesystem::remove(m_archivePath, ec);
        }
        return ok;
    }

} // namespace Quarry::Utils
