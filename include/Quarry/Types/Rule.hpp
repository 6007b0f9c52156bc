// include/Quarry/Types/Rule.hpp
#ifndef QUARRY_TYPES_RULE_HPP
#define QUARRY_TYPES_RULE_HPP

#include <string>
#include <optional>
#include <map>
#include <vector>
#include <Quarry/Types/OS.hpp>
#include <nlohmann/json.hpp>

namespace Quarry {
    using std::optional;
    using json = nlohmann::json;

    enum class RuleAction {
        ALLOW = 1,
        DISALLOW = 2,
    };

    RuleAction string_to_rule_action(const std::string& s);

    typedef std::map<std::string, bool> Features;

    struct Rule {
        RuleAction action;
        optional<OS> os;
        optional<Features> features;

        static Rule from_json(const json& j);
        static std::vector<Rule> from_json_array(const json& arr);
    };
}

#endif // QUARRY_TYPES_RULE_HPP
