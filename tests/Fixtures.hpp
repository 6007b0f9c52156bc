// tests/Fixtures.hpp
#ifndef QUARRY_TESTS_FIXTURES_HPP
#define QUARRY_TESTS_FIXTURES_HPP

#include <Quarry/AssetClient.hpp>
#include <Quarry/Config.hpp>
#include <Quarry/Utils/FileSystem.hpp>
#include <nlohmann/json.hpp>

#include "FakeHttpClient.hpp"

#include <string>
#include <vector>

namespace QuarryTests {

    using json = nlohmann::json;

    inline std::string gameManifestUrl(const std::string& id) {
        return "https://piston-meta.mojang.com/v1/packages/" + id + ".json";
    }

    inline std::string clientJarUrl(const std::string& id) {
        return "https://piston-data.mojang.com/v1/objects/" + id + "/client.jar";
    }

    inline json libraryJson(const std::string& name, const std::string& path) {
        return {{"name", name},
                {"downloads", {{"artifact", {{"path", path},
                                             {"sha1", ""},
                                             {"size", 1},
                                             {"url", "https://libraries.minecraft.net/" + path}}}}}};
    }

    // A release with structured arguments, one asset index and the given libraries
    inline json gameManifestJson(const std::string& id, const json& libraries = json::array()) {
        return {
            {"id", id},
            {"type", "release"},
            {"mainClass", "net.minecraft.client.main.Main"},
            {"releaseTime", "2023-06-12T13:25:51+00:00"},
            {"time", "2023-06-12T13:25:51+00:00"},
            {"assetIndex", {{"id", "5"}, {"sha1", "x"}, {"size", 1}, {"totalSize", 1},
                            {"url", "https://piston-meta.mojang.com/v1/packages/index/5.json"}}},
            {"downloads", {{"client", {{"sha1", ""}, {"size", 1}, {"url", clientJarUrl(id)}}}}},
            {"javaVersion", {{"component", "java-runtime-gamma"}, {"majorVersion", 17}}},
            {"libraries", libraries},
            {"arguments", {
                {"game", json::array({"--username", "${auth_player_name}", "--version", "${version_name}",
                                      {{"rules", json::array({{{"action", "allow"}, {"features", {{"is_demo_user", true}}}}})},
                                       {"value", "--demo"}}})},
                {"jvm", json::array({"-Djava.library.path=${natives_directory}", "-cp", "${classpath}"})}}}};
    }

    inline json versionManifestJson(const std::vector<std::string>& ids) {
        json versions = json::array();
        for (const auto& id : ids) {
            versions.push_back({{"id", id},
                                {"type", "release"},
                                {"url", gameManifestUrl(id)},
                                {"time", "2023-06-12T13:25:51+00:00"},
                                {"releaseTime", "2023-06-12T13:25:51+00:00"}});
        }
        return {{"latest", {{"release", ids.empty() ? "" : ids.front()}, {"snapshot", ""}}}, {"versions", versions}};
    }

    // Scratch data dir with a fake network behind it
    struct TestEnv {
        Quarry::Utils::TempDir dir{"quarry-test"};
        Quarry::Config config{dir.path() / "data"};
        FakeHttpClient http;

        // Lists the versions in the version manifest and serves their game manifests
        void serveVersions(const std::vector<std::pair<std::string, json>>& games) {
            std::vector<std::string> ids;
            for (const auto& [id, game] : games) {
                ids.push_back(id);
                http.respond(gameManifestUrl(id), game.dump());
            }
            http.respond(Quarry::AssetClient::kVersionManifestUrl, versionManifestJson(ids).dump());
        }
    };

} // namespace QuarryTests

#endif // QUARRY_TESTS_FIXTURES_HPP
