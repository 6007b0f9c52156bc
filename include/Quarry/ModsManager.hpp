// include/Quarry/ModsManager.hpp
#ifndef QUARRY_MODS_MANAGER_HPP
#define QUARRY_MODS_MANAGER_HPP

#include <Quarry/CurseClient.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Quarry {

    struct InstalledMod {
        std::string fileName;
        std::int64_t modId = 0;
        std::uint32_t fingerprint = 0;
    };

    // Catalog view of the jars in a mods directory, identified by fingerprint.
    class ModsManager {
    public:
        // Fingerprints every file in modsDir and matches them in one catalog
        // request. Throws MissingFingerprintError for a file the catalog does not know.
        static ModsManager load(const std::filesystem::path& modsDir, CurseClient& client);

        const std::vector<InstalledMod>& mods() const { return m_mods; }
        std::optional<InstalledMod> find(std::int64_t modId) const;

        // Deletes the installed file of modId, if any, so a replacement can be
        // installed. Returns whether a file was removed.
        bool removeExisting(std::int64_t modId);

    private:
        ModsManager(std::filesystem::path modsDir, std::vector<InstalledMod> mods);

        std::filesystem::path m_modsDir;
        std::vector<InstalledMod> m_mods;
    };

} // namespace Quarry

#endif // QUARRY_MODS_MANAGER_HPP
