// src/Crypto.cpp
#include <Quarry/Utils/Crypto.hpp>
#include <Quarry/Utils/Logger.hpp>

#include <openssl/evp.h>
#include <fstream>
#include <iterator>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace Quarry::Utils {

    static std::string bytesToHexString(const unsigned char *bytes, size_t len) {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < len; ++i) {
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    static std::string calculateFileDigest(const std::filesystem::path &filePath, const EVP_MD *md, const char *name) {
        QUARRY_LOG_TRACE("[Crypto] Calculating {} for file: {}", name, filePath.string());
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) {
            QUARRY_LOG_ERROR("[Crypto] Could not open file for {} calculation: {}", name, filePath.string());
            return "";
        }

        EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
        if (mdctx == nullptr) {
            QUARRY_LOG_ERROR("[Crypto] EVP_MD_CTX_new failed for {} on file: {}", name, filePath.string());
            return "";
        }

        if (1 != EVP_DigestInit_ex(mdctx, md, nullptr)) {
            QUARRY_LOG_ERROR("[Crypto] EVP_DigestInit_ex for {} failed on file: {}", name, filePath.string());
            EVP_MD_CTX_free(mdctx);
            return "";
        }

        constexpr size_t bufferSize = 8192;
        std::vector<char> buffer(bufferSize);

        while (file.good()) {
            file.read(buffer.data(), bufferSize);
            std::streamsize bytesRead = file.gcount();
            if (bytesRead > 0) {
                if (1 != EVP_DigestUpdate(mdctx, buffer.data(), static_cast<size_t>(bytesRead))) {
                    QUARRY_LOG_ERROR("[Crypto] EVP_DigestUpdate failed for {} on file: {}", name, filePath.string());
                    EVP_MD_CTX_free(mdctx);
                    return "";
                }
            }
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;

        if (1 != EVP_DigestFinal_ex(mdctx, hash, &hashLen)) {
            QUARRY_LOG_ERROR("[Crypto] EVP_DigestFinal_ex failed for {} on file: {}", name, filePath.string());
            EVP_MD_CTX_free(mdctx);
            return "";
        }
        EVP_MD_CTX_free(mdctx);

        return bytesToHexString(hash, hashLen);
    }

    std::string calculateFileSHA1(const std::filesystem::path &filePath) {
        return calculateFileDigest(filePath, EVP_sha1(), "SHA1");
    }

    std::uint32_t curseForgeFingerprint(const std::vector<unsigned char> &bytes) {
        constexpr std::uint32_t multiplex = 1540483477u;
        constexpr std::uint32_t seed = 1u;

        auto isWhitespace = [](unsigned char b) { return b == 9 || b == 10 || b == 13 || b == 32; };

        std::uint32_t normalizedLength = 0;
        for (unsigned char b : bytes) {
            if (!isWhitespace(b)) ++normalizedLength;
        }

        std::uint32_t hash = seed ^ normalizedLength;
        std::uint32_t word = 0;
        unsigned shift = 0;

        for (unsigned char b : bytes) {
            if (isWhitespace(b)) continue;

            word |= static_cast<std::uint32_t>(b) << shift;
            shift += 8;
            if (shift == 32) {
                std::uint32_t k = word * multiplex;
                k = (k ^ (k >> 24)) * multiplex;
                hash = (hash * multiplex) ^ k;
                word = 0;
                shift = 0;
            }
        }

        if (shift > 0) {
            hash = (hash ^ word) * multiplex;
        }

        std::uint32_t result = (hash ^ (hash >> 13)) * multiplex;
        return result ^ (result >> 15);
    }

    std::uint32_t calculateFileFingerprint(const std::filesystem::path &filePath) {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) {
            throw std::filesystem::filesystem_error("cannot open file for fingerprinting", filePath,
                                                    std::make_error_code(std::errc::no_such_file_or_directory));
        }
        std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        return curseForgeFingerprint(bytes);
    }

} // namespace Quarry::Utils
