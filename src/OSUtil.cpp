// src/OSUtil.cpp
#include <Quarry/Utils/OS.hpp>

namespace Quarry {
namespace Utils {

OperatingSystem getCurrentOS() {
    #if defined(_WIN32) || defined(_WIN64)
        return OperatingSystem::WINDOWS;
    #elif defined(__APPLE__) || defined(__MACH__)
        return OperatingSystem::MACOS;
    #elif defined(__linux__)
        return OperatingSystem::LINUX;
    #else
        return OperatingSystem::UNKNOWN;
    #endif
}

Architecture getCurrentArch() {
    #if defined(_M_AMD64) || defined(__amd64__) || defined(__x86_64__)
        return Architecture::X64;
    #elif defined(_M_IX86) || defined(__i386__)
        return Architecture::X86;
    #elif defined(__aarch64__) || defined(_M_ARM64)
        return Architecture::ARM64;
    #elif defined(__arm__)
        return Architecture::ARM32;
    #else
        return Architecture::UNKNOWN;
    #endif
}

std::string getOSStringForRules(OperatingSystem os) {
    switch (os) {
        case OperatingSystem::WINDOWS: return "windows";
        case OperatingSystem::MACOS: return "osx";
        case OperatingSystem::LINUX: return "linux";
        default: return "unknown";
    }
}

std::string getArchStringForRules(Architecture arch) {
    switch (arch) {
        case Architecture::X64: return "x86_64";
        case Architecture::X86: return "x86";
        case Architecture::ARM64: return "aarch64";
        case Architecture::ARM32: return "arm";
        default: return "unknown";
    }
}

std::string getArchBitness(Architecture arch) {
    switch (arch) {
        case Architecture::X86:
        case Architecture::ARM32:
            return "32";
        default:
            return "64";
    }
}

char getClasspathSeparator() {
    return getCurrentOS() == OperatingSystem::WINDOWS ? ';' : ':';
}

} // namespace Utils
} // namespace Quarry
