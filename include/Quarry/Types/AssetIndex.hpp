// include/Quarry/Types/AssetIndex.hpp
#ifndef QUARRY_TYPES_ASSET_INDEX_HPP
#define QUARRY_TYPES_ASSET_INDEX_HPP

#include <string>
#include <map>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace Quarry {
    using json = nlohmann::json;

    // Reference to an asset index, as found in a game manifest
    struct AssetIndex {
        std::string id;
        std::string sha1;
        std::uint64_t size = 0;
        std::uint64_t totalSize = 0;
        std::string url;

        static AssetIndex from_json(const json& j);
    };

    struct AssetObject {
        std::string hash;
        std::uint64_t size = 0;

        // objects/<hash[0:2]>/<hash>, relative to the assets root
        std::string objectPath() const;
    };

    // The asset index document itself: logical name -> content hash
    struct AssetManifest {
        std::map<std::string, AssetObject> objects;
        bool mapToResources = false;
        bool isVirtual = false;

        static AssetManifest from_json(const json& j);
        json to_json() const;
    };
}

#endif // QUARRY_TYPES_ASSET_INDEX_HPP
