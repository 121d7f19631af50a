// include/Piston/Utils/OS.hpp
#ifndef PISTON_OS_UTIL_HPP
#define PISTON_OS_UTIL_HPP

#include <string>

namespace Piston {
    namespace Utils {

        enum class OperatingSystem {
            WINDOWS,
            MACOS,
            LINUX,
            UNKNOWN
        };

        enum class Architecture {
            X86,        // 32-bit x86
            X64,        // 64-bit x86_64/amd64
            ARM64,      // 64-bit ARM (aarch64)
            ARM32,      // 32-bit ARM
            UNKNOWN
        };

        OperatingSystem getCurrentOS();
        Architecture getCurrentArch();

        // Value of "os.arch" in library rules. Mojang only ever uses "x86".
        std::string getArchStringForRules(Architecture arch);

    } // namespace Utils
} // namespace Piston

#endif // PISTON_OS_UTIL_HPP
