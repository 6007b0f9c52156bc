// src/LoaderManifest.cpp
#include <Quarry/Types/LoaderManifest.hpp>
#include <Quarry/Types/MavenCoordinate.hpp>
#include <Quarry/Errors.hpp>

namespace Quarry {

namespace {

    constexpr const char* kDefaultLibraryRepo = "https://libraries.minecraft.net";

    // "https://maven.minecraftforge.net/net/x/1.0/x.jar?y" -> "/net/x/1.0/x.jar"
    std::string urlPath(const std::string& url) {
        size_t start = url.find("://");
        start = (start == std::string::npos) ? 0 : url.find('/', start + 3);
        if (start == std::string::npos) {
            return "/";
        }
        const size_t end = url.find_first_of("?#", start);
        return url.substr(start, end == std::string::npos ? std::string::npos : end - start);
    }

    std::vector<LoaderLibrary> parseLibraries(const json& j, const char* key) {
        std::vector<LoaderLibrary> libs;
        if (j.contains(key)) {
            for (const auto& lib : j.at(key)) {
                libs.push_back(LoaderLibrary::from_json(lib));
            }
        }
        return libs;
    }

    std::vector<LoaderRequirement> parseRequirements(const json& j) {
        std::vector<LoaderRequirement> reqs;
        if (j.contains("requires")) {
            for (const auto& req : j.at("requires")) {
                reqs.push_back(LoaderRequirement::from_json(req));
            }
        }
        return reqs;
    }

    std::vector<std::string> stringList(const json& j, const char* key) {
        if (!j.contains(key)) {
            return {};
        }
        return j.at(key).get<std::vector<std::string>>();
    }

} // namespace

LoaderRequirement LoaderRequirement::from_json(const json& j) {
    LoaderRequirement req;
    req.uid = j.at("uid").get<std::string>();
    if (j.contains("equals")) req.equals = j.at("equals").get<std::string>();
    if (j.contains("suggests")) req.suggests = j.at("suggests").get<std::string>();
    return req;
}

LoaderLibrary LoaderLibrary::from_json(const json& j) {
    LoaderLibrary lib;
    lib.name = j.at("name").get<std::string>();
    if (j.contains("downloads") && j.at("downloads").contains("artifact")) {
        lib.source = LoaderLibraryDownloads{LibraryArtifact::from_json(j.at("downloads").at("artifact"))};
    } else {
        LoaderLibraryUrl source;
        if (j.contains("url")) source.url = j.at("url").get<std::string>();
        lib.source = source;
    }
    return lib;
}

std::string LoaderLibrary::assetPath() const {
    if (const auto* downloads = std::get_if<LoaderLibraryDownloads>(&source)) {
        if (!downloads->artifact.path.empty()) {
            return downloads->artifact.path;
        }
        std::string path = urlPath(downloads->artifact.url);
        if (path.rfind("/maven/", 0) == 0) {
            return path.substr(7);
        }
        return path.substr(1);
    }
    return MavenCoordinate::parse(name).toPath();
}

std::string LoaderLibrary::downloadUrl() const {
    if (const auto* downloads = std::get_if<LoaderLibraryDownloads>(&source)) {
        return downloads->artifact.url;
    }
    const auto& repo = std::get<LoaderLibraryUrl>(source).url;
    std::string base = repo.value_or(kDefaultLibraryRepo);
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/" + assetPath();
}

std::optional<std::string> LoaderLibrary::sha1() const {
    if (const auto* downloads = std::get_if<LoaderLibraryDownloads>(&source)) {
        if (!downloads->artifact.sha1.empty()) {
            return downloads->artifact.sha1;
        }
    }
    return std::nullopt;
}

LoaderManifest LoaderManifest::from_json(const json& j) {
    LoaderManifest manifest;
    manifest.name = j.at("name").get<std::string>();
    manifest.uid = j.at("uid").get<std::string>();
    manifest.version = j.at("version").get<std::string>();
    manifest.releaseTime = j.value("releaseTime", "");
    manifest.traits = stringList(j, "+traits");
    manifest.tweakers = stringList(j, "+tweakers");
    manifest.requirements = parseRequirements(j);

    if (j.contains("libraries") && j.contains("mainClass")) {
        CurrentDistribution current;
        current.libraries = parseLibraries(j, "libraries");
        current.mainClass = j.at("mainClass").get<std::string>();
        current.mavenFiles = parseLibraries(j, "mavenFiles");
        if (j.contains("minecraftArguments")) {
            current.minecraftArguments = j.at("minecraftArguments").get<std::string>();
        }
        manifest.distribution = std::move(current);
    } else if (j.contains("jarMods")) {
        LegacyDistribution legacy;
        legacy.jarMods = parseLibraries(j, "jarMods");
        legacy.fmlLibs = parseLibraries(j, "fml_libs");
        manifest.distribution = std::move(legacy);
    } else {
        throw MalformedManifestError(manifest.uid + ":" + manifest.version,
                                     "neither libraries/mainClass nor jarMods present");
    }
    return manifest;
}

std::optional<std::string> LoaderManifest::minecraftVersion() const {
    for (const auto& req : requirements) {
        if (req.uid == "net.minecraft") {
            return req.equals;
        }
    }
    return std::nullopt;
}

std::optional<LoaderLibrary> LoaderManifest::installerLibrary() const {
    const auto* dist = current();
    if (dist == nullptr) {
        return std::nullopt;
    }
    for (const auto& lib : dist->mavenFiles) {
        const auto coord = MavenCoordinate::parse(lib.name);
        if (coord.classifier && *coord.classifier == "installer") {
            return lib;
        }
    }
    return std::nullopt;
}

LoaderIndexEntry LoaderIndexEntry::from_json(const json& j) {
    LoaderIndexEntry entry;
    entry.version = j.at("version").get<std::string>();
    entry.recommended = j.value("recommended", false);
    entry.releaseTime = j.value("releaseTime", "");
    entry.requirements = parseRequirements(j);
    entry.sha256 = j.value("sha256", "");
    return entry;
}

bool LoaderIndexEntry::isForMinecraft(const std::string& mcVersion) const {
    for (const auto& req : requirements) {
        if (req.uid == "net.minecraft" && req.equals && *req.equals == mcVersion) {
            return true;
        }
    }
    return false;
}

LoaderIndex LoaderIndex::from_json(const json& j) {
    LoaderIndex index;
    index.uid = j.value("uid", "");
    index.name = j.value("name", "");
    for (const auto& entry : j.at("versions")) {
        index.versions.push_back(LoaderIndexEntry::from_json(entry));
    }
    return index;
}

}
