#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace tickwell {

class Log {
public:
    static void init(const std::string& logFile = "", const std::string& level = "debug");
    static void shutdown();

    /// Scheduler / status effect logger ("CORE")
    static std::shared_ptr<spdlog::logger>& getCoreLogger();

    /// Persistence logger ("SAVE")
    static std::shared_ptr<spdlog::logger>& getSaveLogger();

    /// Parse a level name ("trace" .. "critical"). Unknown names map to debug.
    static spdlog::level::level_enum parseLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> makeFallback(const std::string& name);

    static std::shared_ptr<spdlog::logger> s_coreLogger;
    static std::shared_ptr<spdlog::logger> s_saveLogger;
};

} // namespace tickwell

// Core logging macros
#define LOG_TRACE(...)    ::tickwell::Log::getCoreLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::tickwell::Log::getCoreLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::tickwell::Log::getCoreLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::tickwell::Log::getCoreLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::tickwell::Log::getCoreLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::tickwell::Log::getCoreLogger()->critical(__VA_ARGS__)

// Persistence logging macros
#define SAVE_LOG_TRACE(...)    ::tickwell::Log::getSaveLogger()->trace(__VA_ARGS__)
#define SAVE_LOG_DEBUG(...)    ::tickwell::Log::getSaveLogger()->debug(__VA_ARGS__)
#define SAVE_LOG_INFO(...)     ::tickwell::Log::getSaveLogger()->info(__VA_ARGS__)
#define SAVE_LOG_WARN(...)     ::tickwell::Log::getSaveLogger()->warn(__VA_ARGS__)
#define SAVE_LOG_ERROR(...)    ::tickwell::Log::getSaveLogger()->error(__VA_ARGS__)
#define SAVE_LOG_CRITICAL(...) ::tickwell::Log::getSaveLogger()->critical(__VA_ARGS__)
