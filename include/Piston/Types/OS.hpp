// include/Piston/Types/OS.hpp
#ifndef PISTON_RULEOS_HPP
#define PISTON_RULEOS_HPP

#include <Piston/Utils/OS.hpp>
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace Piston {
    using json = nlohmann::json;

    enum class OsName {
        LINUX = 1,
        WINDOWS = 2,
        OSX = 3,
    };

    OsName string_to_os_name(const std::string& s);

    // std::nullopt when the host is none of the three platforms Mojang publishes for
    std::optional<OsName> os_name_for(Utils::OperatingSystem os);

    struct OS {
        std::optional<OsName> name;
        std::optional<std::string> version; // regex against the OS version, not evaluated
        std::optional<std::string> arch;

        // True when every constraint present is satisfied by the given host
        bool matches(Utils::OperatingSystem os, Utils::Architecture arch) const;

        static OS from_json(const json& j);
    };
}

#endif // PISTON_RULEOS_HPP
