// include/Quarry/Instance.hpp
#ifndef QUARRY_INSTANCE_HPP
#define QUARRY_INSTANCE_HPP

#include <Quarry/AssetManager.hpp>
#include <Quarry/LaunchCommand.hpp>
#include <Quarry/Progress.hpp>
#include <Quarry/Types/InstanceManifest.hpp>
#include <Quarry/VersionResolver.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace Quarry {

    /**
     * @brief A game instance: a directory holding manifest.json and the game directory.
     *
     * Layout:
     *   <dir>/manifest.json
     *   <dir>/natives/          extracted native libraries
     *   <dir>/<game_dir>/       saves, mods, resource packs, ...
     */
    class Instance {
    public:
        static constexpr const char* kManifestFile = "manifest.json";

        static bool exists(const std::filesystem::path& dir);

        // Resolves mcVersion (and the loader, when given) before anything is
        // written, so an unknown id leaves no directory behind.
        static Instance create(const std::filesystem::path& dir,
                               const std::string& mcVersion,
                               const std::optional<ModLoader>& modLoader,
                               VersionResolver& resolver);

        // Throws InstanceNotFoundError when dir has no manifest.json
        static Instance load(const std::filesystem::path& dir);

        void save() const;

        const InstanceManifest& manifest() const { return m_manifest; }
        InstanceManifest& manifest() { return m_manifest; }

        /**
         * @brief Records a finished modpack install.
         *
         * Files listed by the previous install but absent from installedFiles are
         * deleted from the game directory; files already gone are tolerated. The
         * new list then replaces the old one and the manifest is saved.
         * @return The files that were removed.
         */
        std::vector<std::filesystem::path> applyModpackInstall(const ModpackId& id,
                                                               const std::vector<std::filesystem::path>& installedFiles);

        /**
         * @brief Downloads everything the instance needs and builds its java command.
         *
         * Assets, libraries and loader libraries are fetched, natives extracted,
         * legacy resources copied and, for jar-mod loaders, the modded client jar
         * built. Spawning the process is left to the caller.
         */
        LaunchCommand prepareLaunch(VersionResolver& resolver, AssetManager& assetManager,
                                    const LaunchProfile& profile, ProgressSink& progress);

        const std::filesystem::path& dir() const { return m_dir; }
        std::filesystem::path manifestPath() const { return m_dir / kManifestFile; }
        std::filesystem::path gameDir() const { return m_dir / m_manifest.gameDir; }
        std::filesystem::path nativesDir() const { return m_dir / "natives"; }
        std::filesystem::path fmlLibsDir() const { return gameDir() / "lib"; }
        std::filesystem::path modsDir() const { return gameDir() / "mods"; }
        std::filesystem::path resourcesDir() const { return gameDir() / "resources"; }

    private:
        Instance(std::filesystem::path dir, InstanceManifest manifest);

        std::filesystem::path m_dir;
        InstanceManifest m_manifest;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Quarry

#endif // QUARRY_INSTANCE_HPP
