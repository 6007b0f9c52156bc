// src/HttpManager.cpp
#include <Quarry/HttpManager.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/Utils/FileSystem.hpp>
#include <Quarry/Utils/Logger.hpp>
#include <fstream>

#ifndef QUARRY_VERSION_STRING
#define QUARRY_VERSION_STRING "0.1.0"
#endif

namespace Quarry {

HttpManager::HttpManager(const std::optional<std::filesystem::path>& caBundlePath)
    : m_caBundlePath(caBundlePath) {
    m_logger = Utils::Logger::GetOrCreateLogger("HttpManager");
    if (m_caBundlePath) {
        m_logger->info("Using CA bundle {}", m_caBundlePath->string());
    } else {
        m_logger->trace("Using system CA store.");
    }
}

HttpManager::~HttpManager() {
    m_logger->trace("HttpManager shutting down.");
}

cpr::Session HttpManager::CreateSession(const std::string& url, const Headers& headers) const {
    cpr::Session session;
    session.SetUrl(cpr::Url{url});
    session.SetUserAgent(cpr::UserAgent{"quarry/" QUARRY_VERSION_STRING});
    if (m_caBundlePath) {
        session.SetSslOptions(cpr::Ssl(cpr::ssl::CaInfo{m_caBundlePath->string()}));
    }
    if (!headers.empty()) {
        cpr::Header header;
        for (const auto& [key, value] : headers) {
            header[key] = value;
        }
        session.SetHeader(header);
    }
    return session;
}

void HttpManager::CheckResponse(const cpr::Response& response, const std::string& url) const {
    if (response.error.code != cpr::ErrorCode::OK) {
        m_logger->error("Request to {} failed: {} (cpr error code {})",
                        url, response.error.message, static_cast<int>(response.error.code));
        throw HttpError(url, response.status_code, response.error.message);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        m_logger->error("Request to {} returned status {}", url, response.status_code);
        throw HttpError(url, response.status_code, response.status_line);
    }
}

std::string HttpManager::Get(const std::string& url, const Headers& headers) {
    m_logger->trace("GET: {}", url);
    cpr::Session session = CreateSession(url, headers);
    cpr::Response response = session.Get();
    CheckResponse(response, url);
    return response.text;
}

std::string HttpManager::Post(const std::string& url, const std::string& body, const Headers& headers) {
    m_logger->trace("POST: {} ({} bytes)", url, body.size());
    cpr::Session session = CreateSession(url, headers);
    session.SetBody(cpr::Body{body});
    cpr::Response response = session.Post();
    CheckResponse(response, url);
    return response.text;
}

void HttpManager::Download(const std::string& url, const std::filesystem::path& filepath,
                           const ByteProgress& progress) {
    m_logger->trace("DOWNLOAD: {} -> {}", url, filepath.string());
    if (filepath.has_parent_path()) {
        std::filesystem::create_directories(filepath.parent_path());
    }

    std::ofstream file_stream(filepath, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        m_logger->error("Failed to open {} for writing", filepath.string());
        throw HttpError(url, 0, "cannot open " + filepath.string() + " for writing");
    }

    cpr::Session session = CreateSession(url, {});
    if (progress) {
        session.SetProgressCallback(cpr::ProgressCallback{
            [&progress](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow,
                        cpr::cpr_off_t, cpr::cpr_off_t, intptr_t) -> bool {
                progress(static_cast<std::uint64_t>(downloadNow), static_cast<std::uint64_t>(downloadTotal));
                return true;
            }});
    }

    cpr::Response response = session.Download(file_stream);
    try {
        Utils::commitFile(file_stream, filepath);
    } catch (const std::filesystem::filesystem_error& e) {
        // A truncated file would otherwise pass the existence check on the next run
        throw HttpError(url, response.status_code, e.what());
    }

    try {
        CheckResponse(response, url);
    } catch (const HttpError&) {
        std::error_code ec;
        std::filesystem::remove(filepath, ec);
        if (ec) {
            m_logger->warn("Failed to remove partially downloaded file {}: {}", filepath.string(), ec.message());
        }
        throw;
    }
    m_logger->trace("Downloaded {} bytes to {}", response.downloaded_bytes, filepath.string());
}

} // namespace Quarry
