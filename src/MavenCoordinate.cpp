// src/MavenCoordinate.cpp
#include <Quarry/Types/MavenCoordinate.hpp>
#include <Quarry/Errors.hpp>

#include <algorithm>
#include <vector>

namespace Quarry {

MavenCoordinate MavenCoordinate::parse(const std::string& name) {
    MavenCoordinate coord;

    std::string body = name;
    if (auto at = body.find('@'); at != std::string::npos) {
        coord.extension = body.substr(at + 1);
        body.erase(at);
    }

    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t colon = body.find(':', start);
        parts.push_back(body.substr(start, colon == std::string::npos ? std::string::npos : colon - start));
        if (colon == std::string::npos) break;
        start = colon + 1;
    }

    if (parts.size() < 3 || parts[0].empty() || parts[1].empty() || parts[2].empty() || coord.extension.empty()) {
        throw InvalidLibraryNameError(name);
    }

    coord.group = parts[0];
    coord.artifact = parts[1];
    coord.version = parts[2];
    if (parts.size() > 3 && !parts[3].empty()) {
        coord.classifier = parts[3];
    }
    return coord;
}

std::string MavenCoordinate::toPath() const {
    std::string groupPath = group;
    std::replace(groupPath.begin(), groupPath.end(), '.', '/');

    std::string fileName = artifact + "-" + version;
    if (classifier) {
        fileName += "-" + *classifier;
    }
    fileName += "." + extension;

    return groupPath + "/" + artifact + "/" + version + "/" + fileName;
}

}
