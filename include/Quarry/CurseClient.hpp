// include/Quarry/CurseClient.hpp
#ifndef QUARRY_CURSE_CLIENT_HPP
#define QUARRY_CURSE_CLIENT_HPP

#include <Quarry/HttpClient.hpp>
#include <Quarry/Types/CurseForge.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace Quarry {

    // CurseForge mod catalog. Every request carries the x-api-key header.
    class CurseClient {
    public:
        static constexpr const char* kApiUrl = "https://api.curseforge.com/v1/";
        static constexpr int kMinecraftGameId = 432;

        CurseClient(HttpClient& httpClient, std::string apiKey);

        // Empty input returns empty without a request. Repeated mod ids in the
        // response are dropped, keeping the first.
        std::vector<CurseFile> getFiles(const std::vector<std::int64_t>& fileIds);
        std::vector<CurseMod> getMods(const std::vector<std::int64_t>& modIds);
        FingerprintMatches getFingerprintMatches(const std::vector<std::uint32_t>& fingerprints);

    private:
        HttpClient& m_httpClient;
        std::string m_apiKey;
        std::shared_ptr<spdlog::logger> m_logger;

        // Returns the "data" member of the response envelope
        json post(const std::string& uri, const json& body);
    };

} // namespace Quarry

#endif // QUARRY_CURSE_CLIENT_HPP
