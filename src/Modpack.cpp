// src/Modpack.cpp
#include <Quarry/Types/Modpack.hpp>
#include <Quarry/Errors.hpp>

namespace Quarry {

ModpackSearch ModpackSearch::from_json(const json& j) {
    ModpackSearch search;
    search.packIds = j.value("packs", std::vector<std::int64_t>{});
    search.curseforgeIds = j.value("curseforge", std::vector<std::int64_t>{});
    search.total = j.value("total", std::int64_t{0});
    search.limit = j.value("limit", std::int64_t{0});
    return search;
}

ModpackTarget ModpackTarget::from_json(const json& j) {
    ModpackTarget target;
    target.id = j.at("id").get<std::int64_t>();
    target.version = j.at("version").get<std::string>();
    target.name = j.at("name").get<std::string>();
    target.type = j.at("type").get<std::string>();
    target.updated = j.value("updated", std::uint64_t{0});
    return target;
}

namespace {
    std::vector<ModpackTarget> targetsFrom(const json& j) {
        std::vector<ModpackTarget> targets;
        if (j.contains("targets")) {
            for (const auto& t : j.at("targets")) {
                targets.push_back(ModpackTarget::from_json(t));
            }
        }
        return targets;
    }
}

ModpackVersion ModpackVersion::from_json(const json& j) {
    ModpackVersion version;
    version.id = j.at("id").get<std::int64_t>();
    version.name = j.at("name").get<std::string>();
    version.type = j.value("type", "");
    version.updated = j.value("updated", std::uint64_t{0});
    version.targets = targetsFrom(j);
    return version;
}

ModpackManifest ModpackManifest::from_json(const json& j) {
    ModpackManifest manifest;
    manifest.id = j.at("id").get<std::int64_t>();
    manifest.name = j.at("name").get<std::string>();
    manifest.synopsis = j.value("synopsis", "");
    for (const auto& v : j.at("versions")) {
        manifest.versions.push_back(ModpackVersion::from_json(v));
    }
    manifest.type = j.value("type", "");
    manifest.provider = j.value("provider", "");
    return manifest;
}

ModpackFile ModpackFile::from_json(const json& j) {
    ModpackFile file;
    file.id = j.at("id").get<std::int64_t>();
    file.name = j.at("name").get<std::string>();
    file.type = j.at("type").get<std::string>();
    file.path = j.at("path").get<std::string>();
    if (j.contains("url") && j.at("url").is_string()) {
        auto url = j.at("url").get<std::string>();
        if (!url.empty()) {
            file.url = std::move(url);
        }
    }
    file.sha1 = j.value("sha1", "");
    file.size = j.value("size", std::int64_t{0});
    file.clientonly = j.value("clientonly", false);
    file.serveronly = j.value("serveronly", false);
    file.optional = j.value("optional", false);
    file.updated = j.value("updated", std::uint64_t{0});
    if (j.contains("curseforge") && j.at("curseforge").is_object()) {
        const auto& cf = j.at("curseforge");
        file.curseforge = ModpackFileCurseforge{cf.at("project").get<std::int64_t>(),
                                                cf.at("file").get<std::int64_t>()};
    }
    return file;
}

ModpackVersionManifest ModpackVersionManifest::from_json(const json& j) {
    ModpackVersionManifest manifest;
    manifest.id = j.at("id").get<std::int64_t>();
    manifest.parent = j.at("parent").get<std::int64_t>();
    manifest.name = j.at("name").get<std::string>();
    for (const auto& f : j.at("files")) {
        manifest.files.push_back(ModpackFile::from_json(f));
    }
    manifest.targets = targetsFrom(j);
    manifest.type = j.value("type", "");
    return manifest;
}

std::string ModpackVersionManifest::getMinecraftVersion() const {
    for (const auto& target : targets) {
        if (target.name == "minecraft") {
            return target.version;
        }
    }
    throw MinecraftTargetNotFoundError(std::to_string(parent) + "/" + std::to_string(id));
}

std::optional<ModLoader> ModpackVersionManifest::getModLoader() const {
    for (const auto& target : targets) {
        if (target.type == "modloader") {
            return ModLoader{string_to_mod_loader_name(target.name), target.version};
        }
    }
    return std::nullopt;
}

}
