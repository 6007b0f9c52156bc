// include/Quarry/Types/MavenCoordinate.hpp
#ifndef QUARRY_TYPES_MAVEN_COORDINATE_HPP
#define QUARRY_TYPES_MAVEN_COORDINATE_HPP

#include <optional>
#include <string>

namespace Quarry {

    // group:artifact:version[:classifier][@extension]
    struct MavenCoordinate {
        std::string group;
        std::string artifact;
        std::string version;
        std::optional<std::string> classifier;
        std::string extension = "jar";

        // Throws InvalidLibraryNameError when fewer than three parts are present.
        static MavenCoordinate parse(const std::string& name);

        // org/example/lib/1.0/lib-1.0[-classifier].jar
        std::string toPath() const;
    };

}

#endif // QUARRY_TYPES_MAVEN_COORDINATE_HPP
