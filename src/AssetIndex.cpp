// src/AssetIndex.cpp
#include <Quarry/Types/AssetIndex.hpp>

namespace Quarry {

AssetIndex AssetIndex::from_json(const json& j) {
    AssetIndex assetIndex;
    assetIndex.id = j.at("id").get<std::string>();
    assetIndex.sha1 = j.at("sha1").get<std::string>();
    assetIndex.size = j.at("size").get<std::uint64_t>();
    assetIndex.totalSize = j.at("totalSize").get<std::uint64_t>();
    assetIndex.url = j.at("url").get<std::string>();
    return assetIndex;
}

std::string AssetObject::objectPath() const {
    return "objects/" + hash.substr(0, 2) + "/" + hash;
}

AssetManifest AssetManifest::from_json(const json& j) {
    AssetManifest manifest;
    for (auto& [name, obj] : j.at("objects").items()) {
        AssetObject object;
        object.hash = obj.at("hash").get<std::string>();
        object.size = obj.at("size").get<std::uint64_t>();
        manifest.objects.emplace(name, std::move(object));
    }
    manifest.mapToResources = j.value("map_to_resources", false);
    manifest.isVirtual = j.value("virtual", false);
    return manifest;
}

json AssetManifest::to_json() const {
    json objs = json::object();
    for (const auto& [name, object] : objects) {
        objs[name] = {{"hash", object.hash}, {"size", object.size}};
    }
    json j = {{"objects", objs}};
    if (mapToResources) j["map_to_resources"] = true;
    if (isVirtual) j["virtual"] = true;
    return j;
}

}
