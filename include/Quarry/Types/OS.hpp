// include/Quarry/Types/OS.hpp
#ifndef QUARRY_TYPES_OS_HPP
#define QUARRY_TYPES_OS_HPP

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace Quarry {
    using json = nlohmann::json;

    // OS predicate of a rule. Absent fields match any host.
    struct OS {
        std::optional<std::string> name;    // "windows", "osx", "linux"
        std::optional<std::string> version; // regex in Mojang manifests, never compared
        std::optional<std::string> arch;    // "x86", "x86_64", ...

        static OS from_json(const json& j);
    };
}

#endif // QUARRY_TYPES_OS_HPP
