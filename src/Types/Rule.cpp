// src/Types/Rule.cpp
#include <Piston/Types/Rule.hpp>
#include <stdexcept>

namespace Piston {

RuleAction string_to_rule_action(const std::string& s) {
    if (s == "allow") return RuleAction::ALLOW;
    if (s == "disallow") return RuleAction::DISALLOW;
    throw std::runtime_error("Unknown rule action: " + s);
}

bool Rule::allows(Utils::OperatingSystem hostOs, Utils::Architecture hostArch) const {
    switch (action) {
        case RuleAction::ALLOW:
            return !os || os->matches(hostOs, hostArch);
        case RuleAction::DISALLOW:
            return os && !os->matches(hostOs, hostArch);
    }
    return false;
}

bool Rule::allows() const {
    return allows(Utils::getCurrentOS(), Utils::getCurrentArch());
}

Rule Rule::from_json(const json& j) {
    Rule rule_obj;
    rule_obj.action = string_to_rule_action(j.at("action").get<std::string>());

    if (j.contains("os")) {
        rule_obj.os = OS::from_json(j.at("os"));
    }
    return rule_obj;
}

} // namespace Piston
