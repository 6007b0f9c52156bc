// src/Config.cpp
#include <Quarry/Config.hpp>

#include <cstdlib>

namespace Quarry {

namespace {

    std::optional<std::string> envVar(const char* name) {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    }

    std::filesystem::path homeDir() {
        if (auto home = envVar("HOME")) return *home;
        if (auto profile = envVar("USERPROFILE")) return *profile;
        return std::filesystem::current_path();
    }

} // namespace

Config::Config(const std::filesystem::path& base) : baseDataPath(base) {
    assetsDir = baseDataPath / "assets";
    librariesDir = baseDataPath / "libraries";
    cacheDir = baseDataPath / "cache";
    versionsDir = cacheDir / "versions";
    logsDir = baseDataPath / "logs";
    downloadsDir = defaultDownloadsDir();

    // create_directories throws filesystem_error when the data dir is unusable
    std::filesystem::create_directories(assetsDir / "objects");
    std::filesystem::create_directories(assetsDir / "indexes");
    std::filesystem::create_directories(librariesDir);
    std::filesystem::create_directories(versionsDir);
}

std::filesystem::path Config::defaultDataDir() {
    if (auto dataHome = envVar("QUARRY_DATA_HOME")) {
        return *dataHome;
    }
    if (auto xdg = envVar("XDG_DATA_HOME")) {
        return std::filesystem::path(*xdg) / "quarry";
    }
    return homeDir() / ".local" / "share" / "quarry";
}

std::filesystem::path Config::defaultDownloadsDir() {
    if (auto xdg = envVar("XDG_DOWNLOAD_DIR")) {
        return *xdg;
    }
    return homeDir() / "Downloads";
}

Config Config::FromEnvironment() {
    Config config(defaultDataDir());
    if (auto key = envVar("CURSE_API_KEY")) {
        config.curseApiKey = *key;
    }
    if (auto bundle = envVar("QUARRY_CA_BUNDLE")) {
        config.caBundlePath = std::filesystem::path(*bundle);
    }
    if (auto verify = envVar("QUARRY_VERIFY_HASHES")) {
        config.verifyHashes = (*verify == "1" || *verify == "true");
    }
    return config;
}

} // namespace Quarry
