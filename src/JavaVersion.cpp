// src/JavaVersion.cpp
#include <Quarry/Types/JavaVersion.hpp>

namespace Quarry {

JavaVersion JavaVersion::from_json(const json& j) {
    JavaVersion javaVersion;
    javaVersion.component = j.value("component", "jre-legacy");
    javaVersion.majorVersion = j.at("majorVersion").get<unsigned int>();
    return javaVersion;
}

}
