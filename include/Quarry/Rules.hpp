// include/Quarry/Rules.hpp
#ifndef QUARRY_RULES_HPP
#define QUARRY_RULES_HPP

#include <Quarry/Types/Rule.hpp>
#include <Quarry/Types/Library.hpp>
#include <Quarry/Types/VersionArguments.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Quarry {

    // Host description rules are evaluated against.
    struct RulesContext {
        std::string osName;  // "linux", "osx", "windows"
        std::string osArch;  // "x86_64", "x86", "aarch64", "arm"
        std::string osVersion;
        Features features;

        static RulesContext host();
    };

    // Present name/arch must equal the host's. The version field is never compared.
    bool matchesOs(const OS& predicate, const RulesContext& ctx);

    // Library rules: starts false; an allow sets true, or returns the OS match when
    // it carries an OS; a disallow with a matching OS returns false. An empty list is false.
    bool matchesLibraryRules(const std::vector<Rule>& rules, const RulesContext& ctx);

    // Argument rules: an allow with features returns false, an allow with an OS
    // returns the OS match. Everything else, including an empty list, is true.
    bool matchesArgumentRules(const std::vector<Rule>& rules, const RulesContext& ctx);

    // A library without a rule list always applies.
    bool libraryApplies(const Library& library, const RulesContext& ctx);

    // Flattens string and rule-gated arguments, dropping gated ones that do not match.
    std::vector<std::string> matchedArguments(const std::vector<VersionArgument>& args, const RulesContext& ctx);

} // namespace Quarry

#endif // QUARRY_RULES_HPP
