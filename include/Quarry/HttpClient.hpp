// include/Quarry/HttpClient.hpp
#ifndef QUARRY_HTTP_CLIENT_HPP
#define QUARRY_HTTP_CLIENT_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>

namespace Quarry {

    // Blocking HTTP collaborator. Every method throws HttpError on a transport
    // failure or a non-2xx status.
    class HttpClient {
    public:
        using Headers = std::map<std::string, std::string>;
        // (bytes downloaded so far, total bytes or 0 when unknown)
        using ByteProgress = std::function<void(std::uint64_t, std::uint64_t)>;

        virtual ~HttpClient() = default;

        virtual std::string Get(const std::string& url, const Headers& headers = {}) = 0;
        virtual std::string Post(const std::string& url, const std::string& body, const Headers& headers = {}) = 0;

        // Writes the body to filepath, creating parent directories. A failed
        // download leaves no file behind.
        virtual void Download(const std::string& url, const std::filesystem::path& filepath,
                              const ByteProgress& progress = {}) = 0;
    };

} // namespace Quarry

#endif // QUARRY_HTTP_CLIENT_HPP
