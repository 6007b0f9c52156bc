// tests/CryptoTests.cpp
#include <catch2/catch_test_macros.hpp>
#include <Quarry/Utils/Crypto.hpp>
#include <Quarry/Utils/FileSystem.hpp>

#include "FakeHttpClient.hpp"

using namespace Quarry;
using QuarryTests::writeFile;

TEST_CASE("File digests are lowercase hex", "[crypto]") {
    Utils::TempDir dir;
    const auto file = dir.path() / "abc.txt";
    writeFile(file, "abc");

    CHECK(Utils::calculateFileSHA1(file) == "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_CASE("Digest of an unreadable file is empty", "[crypto]") {
    Utils::TempDir dir;
    CHECK(Utils::calculateFileSHA1(dir.path() / "missing").empty());
}

TEST_CASE("CurseForge fingerprints ignore whitespace", "[crypto][fingerprint]") {
    const std::string text = "hello world";
    const std::string packed = "hello\r\n\tworld";
    const std::vector<unsigned char> a(text.begin(), text.end());
    const std::vector<unsigned char> b(packed.begin(), packed.end());

    CHECK(Utils::curseForgeFingerprint(a) == 2824650221u);
    CHECK(Utils::curseForgeFingerprint(a) == Utils::curseForgeFingerprint(b));
    CHECK(Utils::curseForgeFingerprint({}) == 1540447798u);
    CHECK(Utils::curseForgeFingerprint({' ', '\n'}) == 1540447798u);
}

TEST_CASE("File fingerprint matches the buffer fingerprint", "[crypto][fingerprint]") {
    Utils::TempDir dir;
    writeFile(dir.path() / "mod.jar", "hello world\n");
    CHECK(Utils::calculateFileFingerprint(dir.path() / "mod.jar") == 2824650221u);
    CHECK_THROWS_AS(Utils::calculateFileFingerprint(dir.path() / "nope.jar"), std::filesystem::filesystem_error);
}
