// src/Types/OperatingSystem.cpp
#include <Piston/Types/OS.hpp>
#include <stdexcept>

namespace Piston {

OsName string_to_os_name(const std::string& s) {
    if (s == "linux") return OsName::LINUX;
    if (s == "windows") return OsName::WINDOWS;
    if (s == "osx") return OsName::OSX;
    throw std::runtime_error("Unknown OS name: " + s);
}

std::optional<OsName> os_name_for(Utils::OperatingSystem os) {
    switch (os) {
        case Utils::OperatingSystem::LINUX: return OsName::LINUX;
        case Utils::OperatingSystem::WINDOWS: return OsName::WINDOWS;
        case Utils::OperatingSystem::MACOS: return OsName::OSX;
        default: return std::nullopt;
    }
}

bool OS::matches(Utils::OperatingSystem os, Utils::Architecture hostArch) const {
    if (name && os_name_for(os) != name) {
        return false;
    }
    if (arch && *arch != Utils::getArchStringForRules(hostArch)) {
        return false;
    }
    return true;
}

OS OS::from_json(const json& j) {
    OS os_obj;
    if (j.contains("name")) os_obj.name = string_to_os_name(j.at("name").get<std::string>());
    if (j.contains("version")) os_obj.version = j.at("version").get<std::string>();
    if (j.contains("arch")) os_obj.arch = j.at("arch").get<std::string>();
    return os_obj;
}

} // namespace Piston
