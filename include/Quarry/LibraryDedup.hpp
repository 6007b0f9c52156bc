// include/Quarry/LibraryDedup.hpp
#ifndef QUARRY_LIBRARY_DEDUP_HPP
#define QUARRY_LIBRARY_DEDUP_HPP

#include <Quarry/Utils/SemVer.hpp>
#include <string>
#include <vector>

namespace Quarry {

    // Artifact identity and version taken from the last path segments:
    // "<artifactId...>/<version>/<file>"
    struct DedupKey {
        std::string artifactId;
        Utils::SemVer version;
        bool versionDegraded = false; // version segment did not parse, 9.9.9 used

        // Throws InvalidLibraryPathError when the path has fewer than three segments.
        static DedupKey fromPath(const std::string& path);
    };

    /**
     * @brief Collapses library paths to the highest version per artifact.
     *
     * Paths containing "natives" are kept untouched. Among paths sharing an
     * artifact id, a later path replaces the kept one when its version is equal
     * or greater. Output keeps first-seen artifact order, natives last.
     *
     * @throws InvalidLibraryPathError for a path with fewer than three segments.
     */
    std::vector<std::string> dedupLibraries(const std::vector<std::string>& paths);

} // namespace Quarry

#endif // QUARRY_LIBRARY_DEDUP_HPP
