// src/VersionArguments.cpp
#include <Quarry/Types/VersionArguments.hpp>
#include <Quarry/Utils/Logger.hpp>

namespace Quarry {

ConditionalArgumentValue ConditionalArgumentValue::from_json(const json& j) {
    ConditionalArgumentValue cav;
    if (j.contains("rules") && j.at("rules").is_array()) {
        cav.rules = Rule::from_json_array(j.at("rules"));
    }
    const auto& value = j.at("value");
    if (value.is_string()) {
        cav.values.push_back(value.get<std::string>());
    } else {
        for (const auto& item : value) {
            cav.values.push_back(item.get<std::string>());
        }
    }
    return cav;
}

std::vector<VersionArgument> Arguments::parse_argument_array(const json& arr) {
    std::vector<VersionArgument> result_args;
    for (const auto& arg_item_json : arr) {
        if (arg_item_json.is_string()) {
            result_args.emplace_back(arg_item_json.get<std::string>());
        } else if (arg_item_json.is_object()) {
            result_args.emplace_back(ConditionalArgumentValue::from_json(arg_item_json));
        } else {
            QUARRY_LOG_WARN("[VersionArgsParser] Skipping unknown argument type: {}", arg_item_json.dump());
        }
    }
    return result_args;
}

Arguments Arguments::from_json(const json& j) {
    Arguments args;
    if (j.contains("game")) {
        args.game = parse_argument_array(j.at("game"));
    }
    if (j.contains("jvm")) {
        args.jvm = parse_argument_array(j.at("jvm"));
    }
    return args;
}

} // namespace Quarry
