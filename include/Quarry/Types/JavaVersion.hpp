// include/Quarry/Types/JavaVersion.hpp
#ifndef QUARRY_TYPES_JAVA_VERSION_HPP
#define QUARRY_TYPES_JAVA_VERSION_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace Quarry {
    using json = nlohmann::json;

    // Java runtime a game version was built for, e.g. {"java-runtime-gamma", 17}
    struct JavaVersion {
        std::string component;
        unsigned int majorVersion = 8;

        static JavaVersion from_json(const json& j);
    };
}

#endif // QUARRY_TYPES_JAVA_VERSION_HPP
