// include/Quarry/Types/InstanceManifest.hpp
#ifndef QUARRY_TYPES_INSTANCE_MANIFEST_HPP
#define QUARRY_TYPES_INSTANCE_MANIFEST_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <Quarry/Types/ModLoader.hpp>
#include <nlohmann/json.hpp>

namespace Quarry {
    using json = nlohmann::json;

    enum class ModpackSource {
        CURSEFORGE,
        FTB,
        CURSE_ZIP,
    };

    std::string modpack_source_to_string(ModpackSource source);
    // Throws MalformedManifestError for an unknown type tag
    ModpackSource string_to_modpack_source(const std::string& s);

    // Where an installed modpack came from, serialized with a "type" tag:
    // {"type":"curseforge"|"ftb","pack_id":..,"version":..} or {"type":"curse_zip","file_name":..}
    struct ModpackId {
        ModpackSource source = ModpackSource::CURSEFORGE;
        std::int64_t packId = 0;
        std::int64_t version = 0;
        std::string fileName;

        static ModpackId curseforge(std::int64_t packId, std::int64_t version);
        static ModpackId ftb(std::int64_t packId, std::int64_t version);
        static ModpackId curseZip(const std::string& fileName);

        static ModpackId from_json(const json& j);
        json to_json() const;

        bool operator==(const ModpackId& o) const;
    };

    struct InstanceModpack {
        ModpackId id;
        std::vector<std::string> files; // relative to the game directory, '/' separated
    };

    // <instance>/manifest.json
    struct InstanceManifest {
        std::string mcVersion;
        std::string gameDir = "minecraft"; // relative to the instance directory
        std::optional<std::string> javaPath;
        std::optional<std::vector<std::string>> javaArgs;
        std::optional<ModLoader> modLoader;
        std::optional<std::string> customJar; // alternate client jar, relative to the instance directory
        std::optional<InstanceModpack> modpack;

        static InstanceManifest from_json(const json& j);
        json to_json() const;
    };
}

#endif // QUARRY_TYPES_INSTANCE_MANIFEST_HPP
