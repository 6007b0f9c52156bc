// include/Quarry/Utils/Crypto.hpp
#ifndef QUARRY_CRYPTO_HPP
#define QUARRY_CRYPTO_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace Quarry {
    namespace Utils {

        /**
         * @brief Calculates the SHA1 hash of a given file.
         * @param filePath The path to the file.
         * @return A lowercase hex SHA1 digest. Empty string if the file cannot be read or OpenSSL fails.
         */
        std::string calculateFileSHA1(const std::filesystem::path& filePath);

        /**
         * @brief CurseForge fingerprint (MurmurHash2, seed 1) of a byte buffer.
         *
         * Tab, LF, CR and space bytes are dropped before hashing, so files differing
         * only in that whitespace share a fingerprint.
         */
        std::uint32_t curseForgeFingerprint(const std::vector<unsigned char>& bytes);

        /**
         * @brief CurseForge fingerprint of a file's contents.
         * @throws std::filesystem::filesystem_error if the file cannot be read.
         */
        std::uint32_t calculateFileFingerprint(const std::filesystem::path& filePath);

    } // namespace Utils
} // namespace Quarry

#endif // QUARRY_CRYPTO_HPP
