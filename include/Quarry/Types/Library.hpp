// include/Quarry/Types/Library.hpp
#ifndef QUARRY_TYPES_LIBRARY_HPP
#define QUARRY_TYPES_LIBRARY_HPP

#include <string>
#include <Quarry/Types/Rule.hpp>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace Quarry {
    using json = nlohmann::json;

    struct LibraryArtifact {
        std::string path; // relative to the library root
        std::string sha1;
        std::uint64_t size = 0;
        std::string url;

        static LibraryArtifact from_json(const json& j);
    };

    struct LibraryDownloads {
        std::optional<LibraryArtifact> artifact;
        std::optional<std::map<std::string, LibraryArtifact>> classifiers; // Key: e.g., "natives-linux"

        static LibraryDownloads from_json(const json& j);
    };

    struct LibraryExtractRule {
        std::vector<std::string> exclude;

        static LibraryExtractRule from_json(const json& j);
    };

    struct Library {
        std::string name; // group:artifact:version[:classifier]
        LibraryDownloads downloads;
        std::optional<std::vector<Rule>> rules;
        std::optional<std::map<std::string, std::string>> natives; // OS to classifier key e.g. "linux": "natives-linux"
        std::optional<LibraryExtractRule> extract;

        static Library from_json(const json& j);

        // The classifier artifact for the host, or nullopt when the library has no natives.
        // Throws NativesError when natives exist but the host's classifier cannot be found.
        std::optional<LibraryArtifact> nativesArtifact(const std::string& osName, const std::string& bitness) const;

        // Main artifact followed by the host's natives artifact. Throws NativesError
        // when the library provides neither.
        std::vector<LibraryArtifact> artifactsForDownload(const std::string& osName, const std::string& bitness) const;
    };
}

#endif // QUARRY_TYPES_LIBRARY_HPP
