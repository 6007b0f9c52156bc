// src/main.cpp
#include <Quarry/AssetManager.hpp>
#include <Quarry/Config.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/HttpManager.hpp>
#include <Quarry/Instance.hpp>
#include <Quarry/VersionResolver.hpp>
#include <Quarry/Utils/Logger.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#ifndef QUARRY_VERSION_STRING
#define QUARRY_VERSION_STRING "0.1.0"
#endif

namespace {

    // Logs batch boundaries only
    class LogProgress : public Quarry::ProgressSink {
    public:
        void begin(const std::string& label, std::uint64_t total) override {
            m_label = label;
            m_total = total;
            QUARRY_LOG_INFO("{} ({} items)", label, total);
        }
        void advance(std::uint64_t current) override {
            QUARRY_LOG_TRACE("{} {}/{}", m_label, current, m_total);
        }
        void end() override {
            QUARRY_LOG_INFO("{} done", m_label);
        }

    private:
        std::string m_label;
        std::uint64_t m_total = 0;
    };

    std::string envOr(const char* name, const std::string& fallback) {
        const char* value = std::getenv(name);
        return value && *value ? std::string(value) : fallback;
    }

}

// quarry <instance-dir> [mc-version] [loader-id]
int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <instance-dir> [mc-version] [loader-id]" << std::endl;
        return 2;
    }

    const std::filesystem::path instanceDir = argv[1];
    const std::string mcVersion = argc > 2 ? argv[2] : "1.20.1";

    int exitCode = 0;
    try {
        // Until Init runs, log calls go to the console fallback
        Quarry::Config config = Quarry::Config::FromEnvironment();
        Quarry::Utils::Logger::Init(config.logsDir, "quarry.log", spdlog::level::info, spdlog::level::trace);
        QUARRY_LOG_INFO("Quarry {} starting, data directory {}", QUARRY_VERSION_STRING, config.baseDataPath.string());

        Quarry::HttpManager http(config.caBundlePath);
        Quarry::VersionResolver resolver(config, http);
        Quarry::AssetManager assets(config, http);
        LogProgress progress;

        std::optional<Quarry::Instance> instance;
        if (Quarry::Instance::exists(instanceDir)) {
            instance.emplace(Quarry::Instance::load(instanceDir));
        } else {
            std::optional<Quarry::ModLoader> loader;
            if (argc > 3) {
                loader = Quarry::ModLoader::parse(argv[3]);
            }
            instance.emplace(Quarry::Instance::create(instanceDir, mcVersion, loader, resolver));
        }

        Quarry::LaunchProfile profile;
        profile.playerName = envOr("QUARRY_PLAYER_NAME", "Player");
        profile.uuid = envOr("QUARRY_PLAYER_UUID", "00000000000000000000000000000000");
        profile.accessToken = envOr("QUARRY_ACCESS_TOKEN", "0");
        profile.clientId = envOr("QUARRY_CLIENT_ID", "");

        const Quarry::LaunchCommand cmd = instance->prepareLaunch(resolver, assets, profile, progress);
        QUARRY_LOG_INFO("Working directory: {}", cmd.workingDir().string());
        std::cout << cmd.toString() << std::endl;
    } catch (const Quarry::Error& e) {
        QUARRY_LOG_CRITICAL("{}", e.what());
        exitCode = 1;
    } catch (const std::filesystem::filesystem_error& e) {
        QUARRY_LOG_CRITICAL("Filesystem error: {}", e.what());
        exitCode = 1;
    } catch (const std::exception& e) {
        QUARRY_LOG_CRITICAL("Unexpected failure: {}", e.what());
        exitCode = 1;
    }

    spdlog::shutdown();
    return exitCode;
}
