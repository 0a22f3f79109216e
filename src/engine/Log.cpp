#include "engine/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <vector>

namespace tickwell {

std::shared_ptr<spdlog::logger> Log::s_coreLogger;
std::shared_ptr<spdlog::logger> Log::s_saveLogger;

void Log::init(const std::string& logFile, const std::string& level) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    // Re-init replaces any previously registered loggers of the same name
    spdlog::drop("CORE");
    spdlog::drop("SAVE");

    s_coreLogger = std::make_shared<spdlog::logger>("CORE", sinks.begin(), sinks.end());
    s_saveLogger = std::make_shared<spdlog::logger>("SAVE", sinks.begin(), sinks.end());

    auto spdLevel = parseLevel(level);
    s_coreLogger->set_level(spdLevel);
    s_saveLogger->set_level(spdLevel);

    spdlog::register_logger(s_coreLogger);
    spdlog::register_logger(s_saveLogger);
}

void Log::shutdown() {
    spdlog::shutdown();
    s_coreLogger.reset();
    s_saveLogger.reset();
}

spdlog::level::level_enum Log::parseLevel(const std::string& level) {
    if (level == "trace")    return spdlog::level::trace;
    if (level == "debug")    return spdlog::level::debug;
    if (level == "info")     return spdlog::level::info;
    if (level == "warn")     return spdlog::level::warn;
    if (level == "error")    return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off")      return spdlog::level::off;
    return spdlog::level::debug;
}

std::shared_ptr<spdlog::logger> Log::makeFallback(const std::string& name) {
    // Library code may log before the host calls init() (unit tests, tools)
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto logger = std::make_shared<spdlog::logger>(
        name, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    logger->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
    logger->set_level(spdlog::level::info);
    return logger;
}

std::shared_ptr<spdlog::logger>& Log::getCoreLogger() {
    if (!s_coreLogger) {
        s_coreLogger = makeFallback("CORE");
    }
    return s_coreLogger;
}

std::shared_ptr<spdlog::logger>& Log::getSaveLogger() {
    if (!s_saveLogger) {
        s_saveLogger = makeFallback("SAVE");
    }
    return s_saveLogger;
}

} // namespace tickwell
