// tests/SemVerTests.cpp
#include <catch2/catch_test_macros.hpp>
#include <Quarry/Utils/SemVer.hpp>

using Quarry::Utils::SemVer;
using Quarry::Utils::VersionRange;

TEST_CASE("Lenient parsing fills missing components", "[semver]") {
    auto v = SemVer::parseLenient("1.8");
    REQUIRE(v);
    CHECK(v->toString() == "1.8.0");

    auto major = SemVer::parseLenient("v45");
    REQUIRE(major);
    CHECK(*major == SemVer(45, 0, 0));
}

TEST_CASE("Lenient parsing accepts Maven and Forge qualifiers", "[semver]") {
    CHECK(SemVer::parseLenient("31.1-jre"));
    CHECK(SemVer::parseLenient("1.7.10-10.13.4.1566-1.7.10"));
    CHECK(SemVer::parseLenient("2.0.beta9"));
    CHECK(SemVer::parseLenient("1.0rc1"));

    auto fourPart = SemVer::parseLenient("1.2.3.4");
    REQUIRE(fourPart);
    CHECK(fourPart->build == std::vector<std::string>{"4"});
    CHECK_FALSE(fourPart->isPrerelease());
}

TEST_CASE("Garbage does not parse", "[semver]") {
    CHECK_FALSE(SemVer::parseLenient("mmc2"));
    CHECK_FALSE(SemVer::parseLenient(""));
    CHECK_FALSE(SemVer::parseLenient("1.2.3-"));
}

TEST_CASE("Ordering follows semantic precedence", "[semver]") {
    CHECK(*SemVer::parseLenient("45.1.16") > *SemVer::parseLenient("45.1.2"));
    CHECK(*SemVer::parseLenient("1.0.0-alpha") < *SemVer::parseLenient("1.0.0"));
    CHECK(*SemVer::parseLenient("1.0.0-alpha.2") < *SemVer::parseLenient("1.0.0-alpha.10"));
}

TEST_CASE("Extra numeric components order by value", "[semver]") {
    CHECK(*SemVer::parseLenient("1.2.3.10") > *SemVer::parseLenient("1.2.3.4"));
    CHECK(*SemVer::parseLenient("14.23.5.2860") > *SemVer::parseLenient("14.23.5.2855"));
    CHECK(*SemVer::parseLenient("1.2.3.4") > *SemVer::parseLenient("1.2.3"));
    CHECK(*SemVer::parseLenient("1.2.3.4") == *SemVer::parseLenient("1.2.3+4"));
    CHECK(*SemVer::parseLenient("1.0.0+2") < *SemVer::parseLenient("1.0.0+build"));
}

TEST_CASE("Ranges apply every constraint", "[semver]") {
    auto range = VersionRange::parse(">=1.4.0 <1.5.0");
    REQUIRE(range);
    CHECK(range->matches(*SemVer::parseLenient("1.4.7")));
    CHECK_FALSE(range->matches(*SemVer::parseLenient("1.5")));
    CHECK_FALSE(range->matches(*SemVer::parseLenient("1.3.2")));

    auto log4j = VersionRange::parse(">2.0.0, <2.17.1");
    REQUIRE(log4j);
    CHECK(log4j->matches(*SemVer::parseLenient("2.14.0")));
    CHECK_FALSE(log4j->matches(*SemVer::parseLenient("2.17.1")));
    CHECK_FALSE(log4j->matches(*SemVer::parseLenient("2.0.0-beta9")));
}
