// include/Quarry/ModpacksClient.hpp
#ifndef QUARRY_MODPACKS_CLIENT_HPP
#define QUARRY_MODPACKS_CLIENT_HPP

#include <Quarry/HttpClient.hpp>
#include <Quarry/Types/Modpack.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <spdlog/logger.h>

namespace Quarry {

    // modpacks.ch pack catalog. FTB packs are served from the FTB API instead,
    // whose clientonly flags are the ones that produce a working server.
    class ModpacksClient {
    public:
        static constexpr const char* kModpacksChUrl = "https://api.modpacks.ch/public/";
        static constexpr const char* kFtbPackUrl = "https://api.feed-the-beast.com/v1/modpacks/modpack/";

        explicit ModpacksClient(HttpClient& httpClient);

        ModpackManifest getModpack(std::int64_t packId);
        ModpackVersionManifest getModpackVersion(std::int64_t packId, std::int64_t versionId);
        ModpackManifest getCurseModpack(std::int64_t packId);
        ModpackVersionManifest getCurseModpackVersion(std::int64_t packId, std::int64_t versionId);

        // The service caps limit at 50
        ModpackSearch searchModpacks(const std::string& term, int limit = 20);

        // "ftb:<rest>" maps to the FTB API, anything else to modpacks.ch
        static std::string urlFor(const std::string& uri);

    private:
        HttpClient& m_httpClient;
        std::shared_ptr<spdlog::logger> m_logger;

        json get(const std::string& uri);
    };

} // namespace Quarry

#endif // QUARRY_MODPACKS_CLIENT_HPP
