// src/FmlLibraries.cpp
#include <Quarry/FmlLibraries.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/Utils/SemVer.hpp>

namespace Quarry {

namespace {

    struct FmlLibEntry {
        const char* name;
        const char* file;
        const char* sha1;
        std::uint64_t size;
    };

    constexpr const char* kFmlLibsBaseUrl = "https://files.prismlauncher.org/fmllibs/";

    const FmlLibEntry kFmlLibs13[] = {
        {"fmllibs:argo:2.25", "argo-2.25.jar", "bb672829fde76cb163004752b86b0484bd0a7f4b", 123642},
        {"fmllibs:guava:12.0.1", "guava-12.0.1.jar", "b8e78b9af7bf45900e14c6f958486b6ca682195f", 1795932},
        {"fmllibs:asm-all:4.0", "asm-all-4.0.jar", "98308890597acb64047f7e896638e0d98753ae82", 212767},
    };

    const FmlLibEntry kFmlLibs14[] = {
        {"fmllibs:argo:2.25", "argo-2.25.jar", "bb672829fde76cb163004752b86b0484bd0a7f4b", 123642},
        {"fmllibs:guava:12.0.1", "guava-12.0.1.jar", "b8e78b9af7bf45900e14c6f958486b6ca682195f", 1795932},
        {"fmllibs:asm-all:4.0", "asm-all-4.0.jar", "98308890597acb64047f7e896638e0d98753ae82", 212767},
        {"fmllibs:bcprov-jdk15on:147", "bcprov-jdk15on-147.jar", "b6f5d9926b0afbde9f4dbe3db88c5247be7794bb", 1997327},
    };

    const FmlLibEntry kFmlLibs15[] = {
        {"fmllibs:argo-small:3.2", "argo-small-3.2.jar", "58912ea2858d168c50781f956fa5b59f0f7c6b51", 91333},
        {"fmllibs:guava:14.0:rc3", "guava-14.0-rc3.jar", "931ae21fa8014c3ce686aaa621eae565fefb1a6a", 2189140},
        {"fmllibs:asm-all:4.1", "asm-all-4.1.jar", "054986e962b88d8660ae4566475658469595ef58", 214592},
        {"fmllibs:bcprov-jdk15on:148", "bcprov-jdk15on-148.jar", "960dea7c9181ba0b17e8bab0c06a43f0a5f04e65", 2318161},
        {"fmllibs:scala-library:1.5", "scala-library.jar", "458d046151ad179c85429ed7420ffb1eaf6ddf85", 7114640},
    };

    const FmlLibEntry kDeobfData15 = {"fmllibs:deobfuscation_data:1.5", "deobfuscation_data_1.5.zip",
                                      "5f7c142d53776f16304c0bbe10542014abad6af8", 200547};
    const FmlLibEntry kDeobfData151 = {"fmllibs:deobfuscation_data:1.5.1", "deobfuscation_data_1.5.1.zip",
                                       "22e221a0d89516c1f721d6cab056a7e37471d0a6", 200886};
    const FmlLibEntry kDeobfData152 = {"fmllibs:deobfuscation_data:1.5.2", "deobfuscation_data_1.5.2.zip",
                                       "446e55cd986582c70fcf12cb27bc00114c5adfd9", 201404};

    LoaderLibrary toLibrary(const FmlLibEntry& entry) {
        LoaderLibrary lib;
        lib.name = entry.name;
        LibraryArtifact artifact;
        artifact.path = std::string("fmllibs/") + entry.file;
        artifact.sha1 = entry.sha1;
        artifact.size = entry.size;
        artifact.url = std::string(kFmlLibsBaseUrl) + entry.file;
        lib.source = LoaderLibraryDownloads{artifact};
        return lib;
    }

    template <size_t N>
    std::vector<LoaderLibrary> toLibraries(const FmlLibEntry (&entries)[N]) {
        std::vector<LoaderLibrary> libs;
        libs.reserve(N);
        for (const auto& entry : entries) {
            libs.push_back(toLibrary(entry));
        }
        return libs;
    }

    bool inRange(const std::string& range, const Utils::SemVer& version) {
        auto parsed = Utils::VersionRange::parse(range);
        return parsed && parsed->matches(version);
    }

} // namespace

std::vector<LoaderLibrary> fmlLibrariesFor(const std::string& mcVersion) {
    if (mcVersion == "1.3.2") {
        return toLibraries(kFmlLibs13);
    }

    auto version = Utils::SemVer::parseLenient(mcVersion);
    if (!version) {
        throw VersionParseError(mcVersion);
    }

    if (inRange(">=1.4.0 <1.5.0", *version)) {
        return toLibraries(kFmlLibs14);
    }

    if (inRange(">=1.5.0 <1.6.0", *version)) {
        auto libs = toLibraries(kFmlLibs15);
        if (mcVersion == "1.5") {
            libs.push_back(toLibrary(kDeobfData15));
        } else if (mcVersion == "1.5.1") {
            libs.push_back(toLibrary(kDeobfData151));
        } else if (mcVersion == "1.5.2") {
            libs.push_back(toLibrary(kDeobfData152));
        } else {
            throw MalformedManifestError("fml_libs " + mcVersion, "no deobfuscation data for this version");
        }
        return libs;
    }

    return {};
}

} // namespace Quarry
