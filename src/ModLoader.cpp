// src/ModLoader.cpp
#include <Quarry/Types/ModLoader.hpp>
#include <Quarry/Errors.hpp>

namespace Quarry {

ModLoaderName string_to_mod_loader_name(const std::string& s) {
    if (s == "forge") return ModLoaderName::FORGE;
    if (s == "neoforge") return ModLoaderName::NEOFORGE;
    throw InvalidModLoaderError(s);
}

std::string mod_loader_name_to_string(ModLoaderName name) {
    switch (name) {
        case ModLoaderName::FORGE: return "forge";
        case ModLoaderName::NEOFORGE: return "neoforge";
    }
    return "forge";
}

ModLoader ModLoader::parse(const std::string& id) {
    const auto dash = id.find('-');
    if (dash == std::string::npos || dash == 0 || dash + 1 == id.size()) {
        throw InvalidModLoaderError(id);
    }

    ModLoader loader;
    try {
        loader.name = string_to_mod_loader_name(id.substr(0, dash));
    } catch (const InvalidModLoaderError&) {
        throw InvalidModLoaderError(id);
    }
    loader.version = id.substr(dash + 1);
    return loader;
}

std::string ModLoader::id() const {
    return mod_loader_name_to_string(name) + "-" + version;
}

std::string ModLoader::cacheFileName() const {
    return mod_loader_name_to_string(name) + "_" + version + ".json";
}

ModLoader ModLoader::from_json(const json& j) {
    ModLoader loader;
    loader.name = string_to_mod_loader_name(j.at("name").get<std::string>());
    loader.version = j.at("version").get<std::string>();
    return loader;
}

json ModLoader::to_json() const {
    return {{"name", mod_loader_name_to_string(name)}, {"version", version}};
}

}
