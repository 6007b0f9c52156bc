// tests/LibraryDedupTests.cpp
#include <catch2/catch_test_macros.hpp>
#include <Quarry/Errors.hpp>
#include <Quarry/LibraryDedup.hpp>

#include <algorithm>

using namespace Quarry;

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

TEST_CASE("Distinct artifacts pass through", "[dedup]") {
    const std::vector<std::string> libs = {
        "com/mojang/brigadier/1.0.18/brigadier-1.0.18.jar",
        "com/google/guava/guava/31.1-jre/guava-31.1-jre.jar",
    };
    CHECK(dedupLibraries(libs) == libs);
}

TEST_CASE("Higher version wins by semantic order, not string order", "[dedup]") {
    const auto result = dedupLibraries({
        "a/b/45.1.2/b-45.1.2.jar",
        "a/b/45.1.16/b-45.1.16.jar",
    });
    CHECK(result == std::vector<std::string>{"a/b/45.1.16/b-45.1.16.jar"});

    const auto reversed = dedupLibraries({
        "a/b/45.1.16/b-45.1.16.jar",
        "a/b/45.1.2/b-45.1.2.jar",
    });
    CHECK(reversed == std::vector<std::string>{"a/b/45.1.16/b-45.1.16.jar"});
}

TEST_CASE("A fourth version component is compared numerically", "[dedup]") {
    const auto result = dedupLibraries({
        "a/b/1.2.3.10/b-1.2.3.10.jar",
        "a/b/1.2.3.4/b-1.2.3.4.jar",
    });
    CHECK(result == std::vector<std::string>{"a/b/1.2.3.10/b-1.2.3.10.jar"});

    const auto forge = dedupLibraries({
        "net/minecraftforge/forge/14.23.5.2860/forge-14.23.5.2860.jar",
        "net/minecraftforge/forge/14.23.5.2855/forge-14.23.5.2855.jar",
    });
    CHECK(forge == std::vector<std::string>{"net/minecraftforge/forge/14.23.5.2860/forge-14.23.5.2860.jar"});
}

TEST_CASE("Forge style versions are compared leniently", "[dedup]") {
    const auto result = dedupLibraries({
        "net/minecraftforge/forge/1.7.10-10.13.4.1558-1.7.10/forge-1.7.10-10.13.4.1558-1.7.10-universal.jar",
        "org/ow2/asm/asm-all/5.0.3/asm-all-5.0.3.jar",
        "org/ow2/asm/asm-all/4.1/asm-all-4.1.jar",
    });
    REQUIRE(result.size() == 2);
    CHECK(contains(result, "org/ow2/asm/asm-all/5.0.3/asm-all-5.0.3.jar"));
}

TEST_CASE("Dedup is idempotent", "[dedup]") {
    const std::vector<std::string> libs = {
        "org/lwjgl/lwjgl/3.3.1/lwjgl-3.3.1.jar",
        "org/lwjgl/lwjgl/3.2.2/lwjgl-3.2.2.jar",
        "org/lwjgl/lwjgl/3.3.1/lwjgl-3.3.1-natives-linux.jar",
        "io/github/zekerzhayard/ForgeWrapper/mmc2/ForgeWrapper-mmc2.jar",
        "com/mojang/logging/1.1.1/logging-1.1.1.jar",
    };
    const auto once = dedupLibraries(libs);
    CHECK(dedupLibraries(once) == once);
}

TEST_CASE("Natives are kept next to their main artifact", "[dedup]") {
    const auto result = dedupLibraries({
        "org/lwjgl/lwjgl/3.3.1/lwjgl-3.3.1.jar",
        "org/lwjgl/lwjgl/3.3.1/lwjgl-3.3.1-natives-linux.jar",
    });
    CHECK(result.size() == 2);
}

TEST_CASE("An unparseable version degrades instead of failing", "[dedup]") {
    const auto result = dedupLibraries({
        "io/github/zekerzhayard/ForgeWrapper/mmc2/ForgeWrapper-mmc2.jar",
        "net/minecraftforge/forge/47.2.0/forge-47.2.0-universal.jar",
    });
    REQUIRE(result.size() == 2);
    CHECK(contains(result, "io/github/zekerzhayard/ForgeWrapper/mmc2/ForgeWrapper-mmc2.jar"));

    const DedupKey key = DedupKey::fromPath("io/github/zekerzhayard/ForgeWrapper/mmc2/ForgeWrapper-mmc2.jar");
    CHECK(key.versionDegraded);
    CHECK(key.version == Utils::SemVer(9, 9, 9));
}

TEST_CASE("Paths with too few segments are rejected", "[dedup]") {
    CHECK_THROWS_AS(dedupLibraries({"lwjgl-3.3.1.jar"}), InvalidLibraryPathError);
    CHECK_THROWS_AS(dedupLibraries({"ok/lib/1.0/lib-1.0.jar", "1.0/lib.jar"}), InvalidLibraryPathError);
}
