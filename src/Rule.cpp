// src/Rule.cpp
#include <Quarry/Types/Rule.hpp>
#include <Quarry/Errors.hpp>

namespace Quarry {

RuleAction string_to_rule_action(const std::string& s) {
    if (s == "allow") return RuleAction::ALLOW;
    if (s == "disallow") return RuleAction::DISALLOW;
    throw MalformedManifestError("rule", "unknown rule action '" + s + "'");
}

Rule Rule::from_json(const json& j) {
    Rule rule_obj;
    rule_obj.action = string_to_rule_action(j.at("action").get<std::string>());

    if (j.contains("os")) {
        rule_obj.os = OS::from_json(j.at("os"));
    }

    if (j.contains("features")) {
        Features features_map;
        for (auto& [key, val] : j.at("features").items()) {
            features_map[key] = val.get<bool>();
        }
        rule_obj.features = features_map;
    }
    return rule_obj;
}

std::vector<Rule> Rule::from_json_array(const json& arr) {
    std::vector<Rule> rules;
    for (const auto& rule_json : arr) {
        rules.push_back(Rule::from_json(rule_json));
    }
    return rules;
}

}
