// include/Quarry/Types/LoaderManifest.hpp
#ifndef QUARRY_TYPES_LOADER_MANIFEST_HPP
#define QUARRY_TYPES_LOADER_MANIFEST_HPP

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <Quarry/Types/Library.hpp>
#include <nlohmann/json.hpp>

namespace Quarry {
    using json = nlohmann::json;

    // {"uid": "net.minecraft", "equals": "1.20.1"}
    struct LoaderRequirement {
        std::string uid;
        std::optional<std::string> equals;
        std::optional<std::string> suggests;

        static LoaderRequirement from_json(const json& j);
    };

    // Library with an explicit downloads.artifact block
    struct LoaderLibraryDownloads {
        LibraryArtifact artifact; // path may be empty, then derived from the URL
    };

    // Library located by maven coordinate against an optional repository URL
    struct LoaderLibraryUrl {
        std::optional<std::string> url;
    };

    struct LoaderLibrary {
        std::string name;
        std::variant<LoaderLibraryDownloads, LoaderLibraryUrl> source;

        static LoaderLibrary from_json(const json& j);

        // Path relative to the library root
        std::string assetPath() const;
        std::string downloadUrl() const;
        std::optional<std::string> sha1() const;
    };

    // Manifest with a launchable main class (Forge 1.6 onwards, NeoForge)
    struct CurrentDistribution {
        std::vector<LoaderLibrary> libraries;
        std::string mainClass;
        std::vector<LoaderLibrary> mavenFiles;
        std::optional<std::string> minecraftArguments;
    };

    // Forge up to 1.5.2: jar mods merged into the client jar
    struct LegacyDistribution {
        std::vector<LoaderLibrary> jarMods;
        std::vector<LoaderLibrary> fmlLibs; // filled from the static tables, never present upstream
    };

    struct LoaderManifest {
        std::string name;
        std::string uid;
        std::string version;
        std::string releaseTime;
        std::vector<std::string> traits;
        std::vector<std::string> tweakers;
        std::vector<LoaderRequirement> requirements;
        std::variant<CurrentDistribution, LegacyDistribution> distribution;

        // The distribution variant is chosen by probing: "libraries" + "mainClass"
        // means Current, "jarMods" means Legacy; anything else is malformed.
        static LoaderManifest from_json(const json& j);

        bool isLegacy() const { return std::holds_alternative<LegacyDistribution>(distribution); }
        const CurrentDistribution* current() const { return std::get_if<CurrentDistribution>(&distribution); }
        const LegacyDistribution* legacy() const { return std::get_if<LegacyDistribution>(&distribution); }
        LegacyDistribution* legacy() { return std::get_if<LegacyDistribution>(&distribution); }

        // The "equals" of the net.minecraft requirement
        std::optional<std::string> minecraftVersion() const;

        // The mavenFiles entry with the "installer" classifier
        std::optional<LoaderLibrary> installerLibrary() const;
    };

    // Entry of a loader's index.json
    struct LoaderIndexEntry {
        std::string version;
        bool recommended = false;
        std::string releaseTime;
        std::vector<LoaderRequirement> requirements;
        std::string sha256;

        static LoaderIndexEntry from_json(const json& j);
        bool isForMinecraft(const std::string& mcVersion) const;
    };

    struct LoaderIndex {
        std::string uid;
        std::string name;
        std::vector<LoaderIndexEntry> versions;

        static LoaderIndex from_json(const json& j);
    };
}

#endif // QUARRY_TYPES_LOADER_MANIFEST_HPP
