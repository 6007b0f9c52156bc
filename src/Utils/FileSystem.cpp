// src/Utils/FileSystem.cpp
#include <Quarry/Utils/FileSystem.hpp>
#include <Quarry/Utils/Logger.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>
#include <set>
#include <system_error>

namespace Quarry::Utils {

    TempDir::TempDir(const std::string &prefix) {
        std::random_device rd;
        std::mt19937_64 gen(rd() ^ static_cast<std::uint64_t>(
                std::chrono::steady_clock::now().time_since_epoch().count()));

        const auto base = std::filesystem::temp_directory_path();
        for (int attempt = 0; attempt < 16; ++attempt) {
            auto candidate = base / (prefix + "-" + std::to_string(gen()));
            // create_directory reports false when the name is taken
            if (std::filesystem::create_directory(candidate)) {
                m_path = candidate;
                return;
            }
        }
        throw std::filesystem::filesystem_error("unable to create temporary directory", base,
                                                std::make_error_code(std::errc::file_exists));
    }

    TempDir::~TempDir() {
        if (m_path.empty()) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
        if (ec) {
            QUARRY_LOG_WARN("Failed to remove temporary directory {}: {}", m_path.string(), ec.message());
        }
    }

    TempDir::TempDir(TempDir &&other) noexcept : m_path(std::move(other.m_path)) {
        other.m_path.clear();
    }

    TempDir &TempDir::operator=(TempDir &&other) noexcept {
        if (this != &other) {
            std::error_code ec;
            if (!m_path.empty()) {
                std::filesystem::remove_all(m_path, ec);
            }
            m_path = std::move(other.m_path);
            other.m_path.clear();
        }
        return *this;
    }

    void commitFile(std::ofstream &out, const std::filesystem::path &path) {
        if (out.is_open()) {
            out.close();
        }
        if (!out.fail()) {
            return;
        }

        QUARRY_LOG_ERROR("Write to {} failed, removing the partial file", path.string());
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            QUARRY_LOG_WARN("Failed to remove {}: {}", path.string(), ec.message());
        }
        throw std::filesystem::filesystem_error("write failed", path, std::make_error_code(std::errc::io_error));
    }

    void copyDirAll(const std::filesystem::path &src, const std::filesystem::path &dst) {
        std::filesystem::create_directories(dst);
        std::filesystem::copy(src, dst,
                              std::filesystem::copy_options::recursive |
                              std::filesystem::copy_options::overwrite_existing);
    }

    std::vector<std::filesystem::path> listFilesRelative(const std::filesystem::path &dir) {
        std::vector<std::filesystem::path> files;
        for (const auto &entry : std::filesystem::recursive_directory_iterator(dir)) {
            if (entry.is_regular_file()) {
                files.push_back(std::filesystem::relative(entry.path(), dir));
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    std::vector<std::filesystem::path> removeDiffFiles(const std::filesystem::path &baseDir,
                                                       const std::vector<std::filesystem::path> &oldFiles,
                                                       const std::vector<std::filesystem::path> &newFiles) {
        std::set<std::string> keep;
        for (const auto &file : newFiles) {
            keep.insert(file.lexically_normal().generic_string());
        }

        std::vector<std::filesystem::path> removed;
        for (const auto &file : oldFiles) {
            if (keep.count(file.lexically_normal().generic_string()) > 0) {
                continue;
            }
            const auto target = baseDir / file;
            // remove() reports false rather than throwing when the file is already gone
            if (std::filesystem::remove(target)) {
                QUARRY_LOG_TRACE("Removed stale file {}", target.string());
                removed.push_back(file);
            } else {
                QUARRY_LOG_WARN("Stale file {} was already missing", target.string());
            }
        }
        return removed;
    }

} // namespace Quarry::Utils
