// include/Quarry/ServerInstance.hpp
#ifndef QUARRY_SERVER_INSTANCE_HPP
#define QUARRY_SERVER_INSTANCE_HPP

#include <Quarry/AssetManager.hpp>
#include <Quarry/LaunchCommand.hpp>
#include <Quarry/Progress.hpp>
#include <Quarry/Types/ServerInstanceManifest.hpp>
#include <Quarry/VersionResolver.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/logger.h>

namespace Quarry {

    /**
     * @brief A dedicated server: a directory holding manifest.json and the server directory.
     *
     * Layout:
     *   <dir>/manifest.json
     *   <dir>/<server_dir>/server.jar                 vanilla
     *   <dir>/<server_dir>/libraries/.../unix_args.txt  written by the Forge/NeoForge installer
     *   <dir>/<server_dir>/eula.txt
     */
    class ServerInstance {
    public:
        static constexpr const char* kManifestFile = "manifest.json";

        static bool exists(const std::filesystem::path& dir);

        /**
         * @brief Creates the instance and fetches what the server needs to start.
         *
         * Vanilla servers get server.jar. With a mod loader the installer jar is
         * fetched into the library store; run installCommand() once to lay out the
         * server. The version, the loader and the download to use are all checked
         * before anything is written.
         */
        static ServerInstance create(const std::filesystem::path& dir,
                                     const std::string& mcVersion,
                                     const std::optional<ModLoader>& modLoader,
                                     VersionResolver& resolver,
                                     AssetManager& assetManager,
                                     ProgressSink& progress);

        // Throws InstanceNotFoundError when dir has no manifest.json
        static ServerInstance load(const std::filesystem::path& dir);

        void save() const;

        const ServerInstanceManifest& manifest() const { return m_manifest; }
        ServerInstanceManifest& manifest() { return m_manifest; }

        // java -jar <installer> --installServer (Forge) or --install-server (NeoForge),
        // run in the server directory. Nothing for vanilla servers.
        std::optional<LaunchCommand> installCommand(VersionResolver& resolver, AssetManager& assetManager) const;

        /**
         * @brief Builds the server's java command.
         *
         * Accepts the EULA when eula.txt is missing and picks up user_jvm_args.txt
         * when the installer left one. Loader servers start from the installer's
         * argument file, vanilla ones from server.jar. java_env goes to the
         * command's environment.
         */
        LaunchCommand prepareLaunch();

        const std::filesystem::path& dir() const { return m_dir; }
        std::filesystem::path manifestPath() const { return m_dir / kManifestFile; }
        std::filesystem::path serverDir() const { return m_dir / m_manifest.serverDir; }

        // libraries/<group>/<artifact>/<version>/<unix|win>_args.txt, relative to the server directory
        static std::string loaderArgsFile(const ModLoader& loader, const std::string& mcVersion, bool windows);

    private:
        ServerInstance(std::filesystem::path dir, ServerInstanceManifest manifest);

        std::filesystem::path m_dir;
        ServerInstanceManifest m_manifest;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Quarry

#endif // QUARRY_SERVER_INSTANCE_HPP
