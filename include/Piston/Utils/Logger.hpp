// include/Piston/Utils/Logger.hpp
#ifndef PISTON_LOGGER_HPP
#define PISTON_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <mutex>
#include <vector>
#include <filesystem>
#include <string>

namespace Piston::Utils {

    class Logger {
    public:
        // Call once at startup. An empty logDir or logFileName gives a console-only setup.
        static void Init(const std::filesystem::path &logDir = "./logs",
                         const std::string &logFileName = "piston.log",
                         spdlog::level::level_enum consoleLevel = spdlog::level::info,
                         spdlog::level::level_enum fileLevel = spdlog::level::trace);

        static std::shared_ptr<spdlog::logger> &GetCoreLogger();

        // Named loggers share the sinks installed by Init()
        static std::shared_ptr<spdlog::logger> GetOrCreateLogger(const std::string &name);

        static void Shutdown();

    private:
        static std::vector<spdlog::sink_ptr> s_GlobalSinks;
        static std::shared_ptr<spdlog::logger> s_CoreLogger;
        static std::mutex s_RegistryMutex;
    };

} // namespace Piston::Utils

#define CORE_LOG_TRACE(...)    if(auto& logger = ::Piston::Utils::Logger::GetCoreLogger(); logger) { logger->trace(__VA_ARGS__); }
#define CORE_LOG_DEBUG(...)    if(auto& logger = ::Piston::Utils::Logger::GetCoreLogger(); logger) { logger->debug(__VA_ARGS__); }
#define CORE_LOG_INFO(...)     if(auto& logger = ::Piston::Utils::Logger::GetCoreLogger(); logger) { logger->info(__VA_ARGS__); }
#define CORE_LOG_WARN(...)     if(auto& logger = ::Piston::Utils::Logger::GetCoreLogger(); logger) { logger->warn(__VA_ARGS__); }
#define CORE_LOG_ERROR(...)    if(auto& logger = ::Piston::Utils::Logger::GetCoreLogger(); logger) { logger->error(__VA_ARGS__); }
#define CORE_LOG_CRITICAL(...) if(auto& logger = ::Piston::Utils::Logger::GetCoreLogger(); logger) { logger->critical(__VA_ARGS__); }

#endif // PISTON_LOGGER_HPP
