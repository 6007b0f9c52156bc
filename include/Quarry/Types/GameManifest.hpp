// include/Quarry/Types/GameManifest.hpp
#ifndef QUARRY_TYPES_GAME_MANIFEST_HPP
#define QUARRY_TYPES_GAME_MANIFEST_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <Quarry/Types/AssetIndex.hpp>
#include <Quarry/Types/MinecraftJAR.hpp>
#include <Quarry/Types/JavaVersion.hpp>
#include <Quarry/Types/Library.hpp>
#include <Quarry/Types/VersionArguments.hpp>
#include <nlohmann/json.hpp>

namespace Quarry {
    using std::string;
    using json = nlohmann::json;

    // Per-version game descriptor (the document a version manifest entry points at).
    // Exactly one of `arguments` and `minecraftArguments` is set after parsing.
    struct GameManifest {
        AssetIndex assetIndex;
        string assets;
        std::optional<unsigned int> complianceLevel;
        std::map<MinecraftJARType, DownloadDetails> downloads;
        string id;
        std::optional<JavaVersion> javaVersion;
        std::vector<Library> libraries;
        string mainClass;
        std::optional<string> minecraftArguments; // pre-1.13 flat argument string
        std::optional<unsigned int> minimumLauncherVersion;
        string releaseTime;
        string time;
        string type; // e.g. "snapshot", "release", "old_alpha"

        std::optional<Arguments> arguments; // 1.13+

        static GameManifest from_json(const json& j);

        // Relative library path of the client jar:
        // com/mojang/minecraft/<id>/minecraft-<id>-client.jar
        string clientJarPath() const;
    };
}
#endif // QUARRY_TYPES_GAME_MANIFEST_HPP
