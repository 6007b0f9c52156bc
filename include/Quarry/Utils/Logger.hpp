// include/Quarry/Utils/Logger.hpp
#ifndef QUARRY_LOGGER_HPP
#define QUARRY_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <vector>
#include <filesystem>
#include <string>

namespace Quarry::Utils {

    class Logger {
    public:
        // Call once at startup. An empty logDir keeps logging on the console only.
        static void Init(const std::filesystem::path &logDir = "./logs",
                         const std::string &logFileName = "quarry.log",
                         spdlog::level::level_enum consoleLevel = spdlog::level::info,
                         spdlog::level::level_enum fileLevel = spdlog::level::trace);

        static std::shared_ptr<spdlog::logger> &GetCoreLogger();

        // Named loggers share the sinks created by Init().
        static std::shared_ptr<spdlog::logger> GetOrCreateLogger(const std::string &name);

    private:
        static std::vector<spdlog::sink_ptr> s_GlobalSinks;
        static std::shared_ptr<spdlog::logger> s_CoreLogger;
    };

} // namespace Quarry::Utils

#define QUARRY_LOG_TRACE(...)    if(auto& logger = ::Quarry::Utils::Logger::GetCoreLogger(); logger) { logger->trace(__VA_ARGS__); }
#define QUARRY_LOG_INFO(...)     if(auto& logger = ::Quarry::Utils::Logger::GetCoreLogger(); logger) { logger->info(__VA_ARGS__); }
#define QUARRY_LOG_WARN(...)     if(auto& logger = ::Quarry::Utils::Logger::GetCoreLogger(); logger) { logger->warn(__VA_ARGS__); }
#define QUARRY_LOG_ERROR(...)    if(auto& logger = ::Quarry::Utils::Logger::GetCoreLogger(); logger) { logger->error(__VA_ARGS__); }
#define QUARRY_LOG_CRITICAL(...) if(auto& logger = ::Quarry::Utils::Logger::GetCoreLogger(); logger) { logger->critical(__VA_ARGS__); }

#endif // QUARRY_LOGGER_HPP
