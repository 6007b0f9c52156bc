// include/Quarry/Utils/OS.hpp
#ifndef QUARRY_OS_UTIL_HPP
#define QUARRY_OS_UTIL_HPP

#include <string>

namespace Quarry {
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

        // OS name as used by Mojang rules and natives maps: "windows", "osx", "linux"
        std::string getOSStringForRules(OperatingSystem os);
        // "x86_64", "x86", "aarch64", "arm"
        std::string getArchStringForRules(Architecture arch);
        // "64" or "32", substituted for ${arch} in natives classifiers
        std::string getArchBitness(Architecture arch);

        // ':' on unix, ';' on windows
        char getClasspathSeparator();

    } // namespace Utils
} // namespace Quarry

#endif // QUARRY_OS_UTIL_HPP
