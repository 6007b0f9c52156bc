// include/Quarry/Utils/FileSystem.hpp
#ifndef QUARRY_FILESYSTEM_HPP
#define QUARRY_FILESYSTEM_HPP

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace Quarry::Utils {

    // Scratch directory under the system temp dir, removed with everything in it
    // when the object goes out of scope.
    class TempDir {
    public:
        explicit TempDir(const std::string &prefix = "quarry");
        ~TempDir();

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;
        TempDir(TempDir &&other) noexcept;
        TempDir &operator=(TempDir &&other) noexcept;

        const std::filesystem::path &path() const { return m_path; }

    private:
        std::filesystem::path m_path;
    };

    // Closes out, which was opened on path. If any write failed (disk full, I/O
    // error) the partial file is removed and filesystem_error is thrown.
    void commitFile(std::ofstream &out, const std::filesystem::path &path);

    // Copies every file below src into dst, overwriting existing files.
    void copyDirAll(const std::filesystem::path &src, const std::filesystem::path &dst);

    // Regular files below dir, as paths relative to dir, in a stable order.
    std::vector<std::filesystem::path> listFilesRelative(const std::filesystem::path &dir);

    // Deletes baseDir/f for every f in oldFiles that is not in newFiles. Files that
    // are already gone are skipped. Returns the paths actually removed.
    std::vector<std::filesystem::path> removeDiffFiles(const std::filesystem::path &baseDir,
                                                       const std::vector<std::filesystem::path> &oldFiles,
                                                       const std::vector<std::filesystem::path> &newFiles);

} // namespace Quarry::Utils

#endif // QUARRY_FILESYSTEM_HPP
