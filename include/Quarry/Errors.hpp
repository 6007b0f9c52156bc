// include/Quarry/Errors.hpp
#ifndef QUARRY_ERRORS_HPP
#define QUARRY_ERRORS_HPP

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace Quarry {

    class Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // --- Not found: bad user input, surfaced immediately ---

    class NotFoundError : public Error {
    public:
        using Error::Error;
    };

    class VersionNotFoundError : public NotFoundError {
    public:
        explicit VersionNotFoundError(const std::string& versionId)
            : NotFoundError("Version not found: " + versionId), m_versionId(versionId) {}
        const std::string& versionId() const { return m_versionId; }
    private:
        std::string m_versionId;
    };

    class LoaderVersionNotFoundError : public NotFoundError {
    public:
        explicit LoaderVersionNotFoundError(const std::string& loaderId)
            : NotFoundError("Mod loader version not found: " + loaderId), m_loaderId(loaderId) {}
        const std::string& loaderId() const { return m_loaderId; }
    private:
        std::string m_loaderId;
    };

    class LoaderRequiresNotFoundError : public NotFoundError {
    public:
        explicit LoaderRequiresNotFoundError(const std::string& loaderId)
            : NotFoundError("Mod loader " + loaderId + " does not name a required Minecraft version") {}
    };

    class InstanceNotFoundError : public NotFoundError {
    public:
        explicit InstanceNotFoundError(const std::filesystem::path& dir)
            : NotFoundError("No instance found at " + dir.string()), m_dir(dir) {}
        const std::filesystem::path& dir() const { return m_dir; }
    private:
        std::filesystem::path m_dir;
    };

    class LoaderInstallerNotFoundError : public NotFoundError {
    public:
        explicit LoaderInstallerNotFoundError(const std::string& loaderId)
            : NotFoundError("Mod loader " + loaderId + " lists no installer jar") {}
    };

    class MinecraftTargetNotFoundError : public NotFoundError {
    public:
        explicit MinecraftTargetNotFoundError(const std::string& packId)
            : NotFoundError("Modpack " + packId + " has no minecraft target") {}
    };

    class MissingFingerprintError : public NotFoundError {
    public:
        explicit MissingFingerprintError(const std::string& fileName)
            : NotFoundError("No fingerprint recorded for " + fileName) {}
    };

    // --- Malformed upstream data: API drift, fatal ---

    class MalformedDataError : public Error {
    public:
        using Error::Error;
    };

    class InvalidLibraryNameError : public MalformedDataError {
    public:
        explicit InvalidLibraryNameError(const std::string& name)
            : MalformedDataError("Invalid library name: " + name), m_name(name) {}
        const std::string& name() const { return m_name; }
    private:
        std::string m_name;
    };

    class InvalidLibraryPathError : public MalformedDataError {
    public:
        explicit InvalidLibraryPathError(const std::string& path)
            : MalformedDataError("Invalid library path: " + path), m_path(path) {}
        const std::string& path() const { return m_path; }
    private:
        std::string m_path;
    };

    class VersionParseError : public MalformedDataError {
    public:
        explicit VersionParseError(const std::string& version)
            : MalformedDataError("Unable to parse version: " + version), m_version(version) {}
        const std::string& version() const { return m_version; }
    private:
        std::string m_version;
    };

    class CurseFileListMismatchError : public MalformedDataError {
    public:
        CurseFileListMismatchError(std::size_t fileListLen, std::size_t modListLen)
            : MalformedDataError("CurseForge file list has " + std::to_string(fileListLen) +
                                 " entries but mod list has " + std::to_string(modListLen)),
              m_fileListLen(fileListLen), m_modListLen(modListLen) {}
        std::size_t fileListLen() const { return m_fileListLen; }
        std::size_t modListLen() const { return m_modListLen; }
    private:
        std::size_t m_fileListLen;
        std::size_t m_modListLen;
    };

    class UnknownCatalogClassError : public MalformedDataError {
    public:
        explicit UnknownCatalogClassError(long classId)
            : MalformedDataError("Unknown CurseForge class id: " + std::to_string(classId)), m_classId(classId) {}
        long classId() const { return m_classId; }
    private:
        long m_classId;
    };

    class NativesError : public MalformedDataError {
    public:
        NativesError(const std::string& libraryName, const std::string& reason)
            : MalformedDataError("Library " + libraryName + ": " + reason), m_libraryName(libraryName) {}
        const std::string& libraryName() const { return m_libraryName; }
    private:
        std::string m_libraryName;
    };

    class InvalidModLoaderError : public MalformedDataError {
    public:
        explicit InvalidModLoaderError(const std::string& loaderId)
            : MalformedDataError("Invalid mod loader id: " + loaderId) {}
    };

    class MalformedManifestError : public MalformedDataError {
    public:
        MalformedManifestError(const std::string& documentId, const std::string& reason)
            : MalformedDataError("Malformed manifest " + documentId + ": " + reason) {}
    };

    // --- IO / network ---

    class HttpError : public Error {
    public:
        HttpError(const std::string& url, long statusCode, const std::string& message)
            : Error("HTTP request to " + url + " failed (status " + std::to_string(statusCode) + "): " + message),
              m_url(url), m_statusCode(statusCode) {}
        const std::string& url() const { return m_url; }
        long statusCode() const { return m_statusCode; }
    private:
        std::string m_url;
        long m_statusCode;
    };

    class ZipError : public Error {
    public:
        ZipError(const std::filesystem::path& archive, const std::string& message)
            : Error("Zip error in " + archive.string() + ": " + message), m_archive(archive) {}
        const std::filesystem::path& archive() const { return m_archive; }
    private:
        std::filesystem::path m_archive;
    };

} // namespace Quarry

#endif // QUARRY_ERRORS_HPP
