// include/Quarry/Types/VersionManifest.hpp
#ifndef QUARRY_TYPES_VERSION_MANIFEST_HPP
#define QUARRY_TYPES_VERSION_MANIFEST_HPP

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace Quarry {
    using std::string;
    using json = nlohmann::json;

    // One entry of Mojang's version_manifest_v2.json
    struct VersionMeta {
        string id;
        string type;
        string url;
        string time;
        string releaseTime;
        string sha1;
        unsigned int complianceLevel = 0;

        static VersionMeta from_json(const json& j);
    };

    struct VersionManifest {
        string latestRelease;
        string latestSnapshot;
        std::vector<VersionMeta> versions;

        static VersionManifest from_json(const json& j);

        // Exact id match
        std::optional<VersionMeta> find(const string& id) const;
    };
}

#endif // QUARRY_TYPES_VERSION_MANIFEST_HPP
