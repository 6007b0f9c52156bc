// include/Quarry/HttpManager.hpp
#ifndef QUARRY_HTTP_MANAGER_HPP
#define QUARRY_HTTP_MANAGER_HPP

#include <Quarry/HttpClient.hpp>
#include <cpr/cpr.h>
#include <string>
#include <filesystem>
#include <optional>
#include <spdlog/logger.h>

namespace Quarry {

    // cpr-backed HttpClient. A fresh session per request keeps it usable from any thread.
    class HttpManager : public HttpClient {
    public:
        explicit HttpManager(const std::optional<std::filesystem::path>& caBundlePath = std::nullopt);
        ~HttpManager() override;

        std::string Get(const std::string& url, const Headers& headers = {}) override;
        std::string Post(const std::string& url, const std::string& body, const Headers& headers = {}) override;
        void Download(const std::string& url, const std::filesystem::path& filepath,
                      const ByteProgress& progress = {}) override;

    private:
        std::optional<std::filesystem::path> m_caBundlePath;
        std::shared_ptr<spdlog::logger> m_logger;

        cpr::Session CreateSession(const std::string& url, const Headers& headers) const;
        void CheckResponse(const cpr::Response& response, const std::string& url) const;
    };

} // namespace Quarry

#endif // QUARRY_HTTP_MANAGER_HPP
