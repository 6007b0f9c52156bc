// include/Quarry/Types/ServerInstanceManifest.hpp
#ifndef QUARRY_TYPES_SERVER_INSTANCE_MANIFEST_HPP
#define QUARRY_TYPES_SERVER_INSTANCE_MANIFEST_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <Quarry/Types/ModLoader.hpp>
#include <nlohmann/json.hpp>

namespace Quarry {
    using json = nlohmann::json;

    // <server instance>/manifest.json
    struct ServerInstanceManifest {
        std::string mcVersion;
        std::string serverDir = "server"; // relative to the instance directory
        std::optional<std::string> javaPath;
        std::optional<std::vector<std::string>> javaArgs;
        std::optional<std::map<std::string, std::string>> javaEnv;
        std::optional<ModLoader> modLoader;

        static ServerInstanceManifest from_json(const json& j);
        json to_json() const;
    };
}

#endif // QUARRY_TYPES_SERVER_INSTANCE_MANIFEST_HPP
