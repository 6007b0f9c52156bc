// include/Quarry/Types/ModLoader.hpp
#ifndef QUARRY_TYPES_MOD_LOADER_HPP
#define QUARRY_TYPES_MOD_LOADER_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace Quarry {
    using json = nlohmann::json;

    enum class ModLoaderName {
        FORGE,
        NEOFORGE,
    };

    // Throws InvalidModLoaderError for anything but "forge" / "neoforge"
    ModLoaderName string_to_mod_loader_name(const std::string& s);
    std::string mod_loader_name_to_string(ModLoaderName name);

    struct ModLoader {
        ModLoaderName name = ModLoaderName::FORGE;
        std::string version;

        // "<name>-<version>", e.g. "forge-47.2.0" or "neoforge-20.4.80-beta"
        static ModLoader parse(const std::string& id);

        std::string id() const;
        // Cache file name: "<name>_<version>.json"
        std::string cacheFileName() const;

        static ModLoader from_json(const json& j);
        json to_json() const;

        bool operator==(const ModLoader& o) const { return name == o.name && version == o.version; }
    };
}

#endif // QUARRY_TYPES_MOD_LOADER_HPP
