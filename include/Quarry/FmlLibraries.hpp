// include/Quarry/FmlLibraries.hpp
#ifndef QUARRY_FML_LIBRARIES_HPP
#define QUARRY_FML_LIBRARIES_HPP

#include <Quarry/Types/LoaderManifest.hpp>
#include <string>
#include <vector>

namespace Quarry {

    // Auxiliary libraries old FML downloads at runtime from a host that no longer
    // exists. Selected by Minecraft version: exactly 1.3.2, 1.4.x, or 1.5.x.
    // Empty for any other version. Throws MalformedManifestError for a 1.5.x
    // release without known deobfuscation data.
    std::vector<LoaderLibrary> fmlLibrariesFor(const std::string& mcVersion);

} // namespace Quarry

#endif // QUARRY_FML_LIBRARIES_HPP
