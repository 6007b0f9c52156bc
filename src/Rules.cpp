// src/Rules.cpp
#include <Quarry/Rules.hpp>
#include <Quarry/Utils/OS.hpp>

namespace Quarry {

RulesContext RulesContext::host() {
    RulesContext ctx;
    ctx.osName = Utils::getOSStringForRules(Utils::getCurrentOS());
    ctx.osArch = Utils::getArchStringForRules(Utils::getCurrentArch());
    return ctx;
}

bool matchesOs(const OS& predicate, const RulesContext& ctx) {
    if (predicate.name && *predicate.name != ctx.osName) {
        return false;
    }
    if (predicate.arch && *predicate.arch != ctx.osArch) {
        return false;
    }
    return true;
}

bool matchesLibraryRules(const std::vector<Rule>& rules, const RulesContext& ctx) {
    bool result = false;
    for (const auto& rule : rules) {
        if (rule.action == RuleAction::ALLOW) {
            result = true;
            if (rule.os) {
                return matchesOs(*rule.os, ctx);
            }
        } else if (rule.os && matchesOs(*rule.os, ctx)) {
            return false;
        }
    }
    return result;
}

bool matchesArgumentRules(const std::vector<Rule>& rules, const RulesContext& ctx) {
    for (const auto& rule : rules) {
        if (rule.action != RuleAction::ALLOW) {
            continue;
        }
        if (rule.features) {
            return false;
        }
        if (rule.os) {
            return matchesOs(*rule.os, ctx);
        }
    }
    return true;
}

bool libraryApplies(const Library& library, const RulesContext& ctx) {
    if (!library.rules) {
        return true;
    }
    return matchesLibraryRules(*library.rules, ctx);
}

std::vector<std::string> matchedArguments(const std::vector<VersionArgument>& args, const RulesContext& ctx) {
    std::vector<std::string> out;
    for (const auto& arg : args) {
        if (const auto* plain = std::get_if<std::string>(&arg)) {
            out.push_back(*plain);
            continue;
        }
        const auto& conditional = std::get<ConditionalArgumentValue>(arg);
        if (matchesArgumentRules(conditional.rules, ctx)) {
            out.insert(out.end(), conditional.values.begin(), conditional.values.end());
        }
    }
    return out;
}

} // namespace Quarry
