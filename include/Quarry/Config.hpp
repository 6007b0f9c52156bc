// include/Quarry/Config.hpp
#ifndef QUARRY_CONFIG_HPP
#define QUARRY_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace Quarry {

    struct Config {
        std::filesystem::path baseDataPath;
        std::filesystem::path assetsDir;
        std::filesystem::path librariesDir;
        std::filesystem::path cacheDir;
        std::filesystem::path versionsDir; // cacheDir / "versions"
        std::filesystem::path logsDir;
        std::filesystem::path downloadsDir;

        std::string curseApiKey;
        std::optional<std::filesystem::path> caBundlePath;
        bool verifyHashes = false;

        // Creates the directory layout under `base`.
        explicit Config(const std::filesystem::path& base = "./.quarry_data");

        // QUARRY_DATA_HOME, else $XDG_DATA_HOME/quarry, else ~/.local/share/quarry.
        static Config FromEnvironment();

        static std::filesystem::path defaultDataDir();
        static std::filesystem::path defaultDownloadsDir();
    };

}
#endif // QUARRY_CONFIG_HPP
