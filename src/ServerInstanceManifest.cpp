// src/ServerInstanceManifest.cpp
#include <Quarry/Types/ServerInstanceManifest.hpp>

namespace Quarry {

ServerInstanceManifest ServerInstanceManifest::from_json(const json& j) {
    ServerInstanceManifest manifest;
    manifest.mcVersion = j.at("mc_version").get<std::string>();
    manifest.serverDir = j.value("server_dir", "server");
    if (j.contains("java_path") && !j.at("java_path").is_null()) {
        manifest.javaPath = j.at("java_path").get<std::string>();
    }
    if (j.contains("java_args") && !j.at("java_args").is_null()) {
        manifest.javaArgs = j.at("java_args").get<std::vector<std::string>>();
    }
    if (j.contains("java_env") && !j.at("java_env").is_null()) {
        manifest.javaEnv = j.at("java_env").get<std::map<std::string, std::string>>();
    }
    if (j.contains("mod_loader") && !j.at("mod_loader").is_null()) {
        manifest.modLoader = ModLoader::from_json(j.at("mod_loader"));
    }
    return manifest;
}

json ServerInstanceManifest::to_json() const {
    json j = {
        {"mc_version", mcVersion},
        {"server_dir", serverDir},
    };
    if (javaPath) j["java_path"] = *javaPath;
    if (javaArgs) j["java_args"] = *javaArgs;
    if (javaEnv) j["java_env"] = *javaEnv;
    if (modLoader) j["mod_loader"] = modLoader->to_json();
    return j;
}

}
