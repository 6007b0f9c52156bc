// include/Quarry/Types/MinecraftJAR.hpp
#ifndef QUARRY_TYPES_MINECRAFT_JAR_HPP
#define QUARRY_TYPES_MINECRAFT_JAR_HPP

#include <string>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace Quarry {
    using json = nlohmann::json;

    enum class MinecraftJARType {
        CLIENT = 1,
        SERVER = 2,
        CLIENT_MAPPING = 3,
        SERVER_MAPPING = 4,
        WINDOWS_SERVER = 5,
    };

    // nullopt for download kinds the launcher does not know about
    std::optional<MinecraftJARType> string_to_minecraft_jar_type(const std::string& s);
    std::string minecraft_jar_type_to_string(MinecraftJARType type);

    struct DownloadDetails {
        std::string sha1;
        std::uint64_t size = 0;
        std::string url;

        static DownloadDetails from_json(const json& j);
    };
}

#endif // QUARRY_TYPES_MINECRAFT_JAR_HPP
