// include/Quarry/Types/VersionArguments.hpp
#ifndef QUARRY_TYPES_VERSION_ARGUMENTS_HPP
#define QUARRY_TYPES_VERSION_ARGUMENTS_HPP

#include <string>
#include <vector>
#include <variant>
#include <Quarry/Types/Rule.hpp>

namespace Quarry {

    // {"rules": [...], "value": "x" | ["x", "y"]}
    struct ConditionalArgumentValue {
        std::vector<Rule> rules;
        std::vector<std::string> values;

        static ConditionalArgumentValue from_json(const json& j);
    };

    using VersionArgument = std::variant<std::string, ConditionalArgumentValue>;

    struct Arguments {
        std::vector<VersionArgument> game;
        std::vector<VersionArgument> jvm;

        static Arguments from_json(const json& j);
        static std::vector<VersionArgument> parse_argument_array(const json& arr);
    };

} // namespace Quarry
#endif // QUARRY_TYPES_VERSION_ARGUMENTS_HPP
