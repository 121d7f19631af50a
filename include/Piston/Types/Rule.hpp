// include/Piston/Types/Rule.hpp
#ifndef PISTON_RULE_HPP
#define PISTON_RULE_HPP

#include <string>
#include <optional>
#include <Piston/Types/OS.hpp>
#include <nlohmann/json.hpp>

namespace Piston {
    using json = nlohmann::json;

    enum class RuleAction {
        ALLOW = 1,
        DISALLOW = 2,
    };

    RuleAction string_to_rule_action(const std::string& s);

    struct Rule {
        RuleAction action;
        std::optional<OS> os;

        // allow: applies everywhere, or only where os matches.
        // disallow: applies nowhere, or only where os does not match.
        bool allows(Utils::OperatingSystem hostOs, Utils::Architecture hostArch) const;
        bool allows() const;

        static Rule from_json(const json& j);
    };
}

#endif // PISTON_RULE_HPP
