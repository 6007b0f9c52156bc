// include/Quarry/Utils/SemVer.hpp
#ifndef QUARRY_SEMVER_HPP
#define QUARRY_SEMVER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Quarry::Utils {

    /**
     * @brief Semantic version with a lenient parser for Maven and Forge style strings.
     *
     * Accepted beyond strict SemVer 2.0.0:
     * - a leading "v" and surrounding whitespace
     * - missing minor/patch ("45" -> 45.0.0, "1.8" -> 1.8.0)
     * - extra numeric components, kept as build metadata ("1.2.3.4" -> 1.2.3+4)
     * - a pre-release introduced by '-', by '.' before a non-numeric part, or by a
     *   letter directly after the numbers ("1.7.10-10.13.4.1566-1.7.10", "2.0.beta9", "1.0rc1")
     *
     * Build identifiers order last, after the pre-release, so Forge's fourth
     * component still sorts ("14.23.5.2860" > "14.23.5.2855").
     */
    struct SemVer {
        std::uint64_t major = 0;
        std::uint64_t minor = 0;
        std::uint64_t patch = 0;
        std::vector<std::string> pre;
        std::vector<std::string> build;

        SemVer() = default;
        SemVer(std::uint64_t major, std::uint64_t minor, std::uint64_t patch)
            : major(major), minor(minor), patch(patch) {}

        static std::optional<SemVer> parseLenient(const std::string& text);

        bool isPrerelease() const { return !pre.empty(); }
        std::string toString() const;

        // <0, 0, >0 like strcmp
        int compare(const SemVer& other) const;

        bool operator==(const SemVer& o) const { return compare(o) == 0; }
        bool operator!=(const SemVer& o) const { return compare(o) != 0; }
        bool operator<(const SemVer& o) const { return compare(o) < 0; }
        bool operator<=(const SemVer& o) const { return compare(o) <= 0; }
        bool operator>(const SemVer& o) const { return compare(o) > 0; }
        bool operator>=(const SemVer& o) const { return compare(o) >= 0; }
    };

    enum class Comparator {
        Eq,
        Lt,
        Le,
        Gt,
        Ge
    };

    struct Constraint {
        Comparator op;
        SemVer version;

        bool matches(const SemVer& v) const;
    };

    /**
     * @brief All constraints must hold, e.g. ">=1.4.0 <1.5.0" or ">2.0.0, <2.17.1".
     *
     * A pre-release version only satisfies the range when some constraint names a
     * pre-release of the same major.minor.patch, so "2.0.0-beta9" is not inside ">2.0.0 <2.17.1".
     */
    struct VersionRange {
        std::vector<Constraint> constraints;

        static std::optional<VersionRange> parse(const std::string& text);
        bool matches(const SemVer& v) const;
    };

} // namespace Quarry::Utils

#endif // QUARRY_SEMVER_HPP
