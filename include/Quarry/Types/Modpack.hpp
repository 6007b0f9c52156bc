// include/Quarry/Types/Modpack.hpp
#ifndef QUARRY_TYPES_MODPACK_HPP
#define QUARRY_TYPES_MODPACK_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <Quarry/Types/ModLoader.hpp>
#include <nlohmann/json.hpp>

namespace Quarry {
    using json = nlohmann::json;

    // modpack/search/{limit}?term=...
    struct ModpackSearch {
        std::vector<std::int64_t> packIds;
        std::vector<std::int64_t> curseforgeIds;
        std::int64_t total = 0;
        std::int64_t limit = 0;

        static ModpackSearch from_json(const json& j);
    };

    struct ModpackTarget {
        std::int64_t id = 0;
        std::string version;
        std::string name;
        std::string type; // "game", "modloader", "runtime"
        std::uint64_t updated = 0;

        static ModpackTarget from_json(const json& j);
    };

    struct ModpackVersion {
        std::int64_t id = 0;
        std::string name;
        std::string type; // release type
        std::uint64_t updated = 0;
        std::vector<ModpackTarget> targets;

        static ModpackVersion from_json(const json& j);
    };

    // modpack/{id}
    struct ModpackManifest {
        std::int64_t id = 0;
        std::string name;
        std::string synopsis;
        std::vector<ModpackVersion> versions;
        std::string type;
        std::string provider;

        static ModpackManifest from_json(const json& j);
    };

    struct ModpackFileCurseforge {
        std::int64_t projectId = 0;
        std::int64_t fileId = 0;
    };

    struct ModpackFile {
        std::int64_t id = 0;
        std::string name;
        std::string type; // "mod", "config", "cf-extract", ...
        std::string path;
        std::optional<std::string> url; // empty string on the wire means none
        std::string sha1;
        std::int64_t size = 0; // -1 when unknown
        bool clientonly = false;
        bool serveronly = false;
        bool optional = false;
        std::uint64_t updated = 0;
        std::optional<ModpackFileCurseforge> curseforge;

        static ModpackFile from_json(const json& j);
    };

    // modpack/{id}/{version}
    struct ModpackVersionManifest {
        std::int64_t id = 0;
        std::int64_t parent = 0; // pack id
        std::string name;
        std::vector<ModpackFile> files;
        std::vector<ModpackTarget> targets;
        std::string type;

        static ModpackVersionManifest from_json(const json& j);

        // Throws MinecraftTargetNotFoundError
        std::string getMinecraftVersion() const;
        // Throws InvalidModLoaderError for a loader other than forge or neoforge
        std::optional<ModLoader> getModLoader() const;
    };
}

#endif // QUARRY_TYPES_MODPACK_HPP
