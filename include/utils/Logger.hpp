#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace QobuzDL {

/**
 * Logger utility class
 * One named logger per concern, each writing to the console and a rotating file
 */
class Logger {
public:
    // Initialize logging system (idempotent)
    static void initialize(const std::string& logDirectory = "logs");
    
    // Get loggers
    static std::shared_ptr<spdlog::logger> getApiLogger();
    static std::shared_ptr<spdlog::logger> getDownloaderLogger();
    static std::shared_ptr<spdlog::logger> getAppLogger();
    
    // Console verbosity (file sinks always keep trace)
    static void setConsoleLevel(spdlog::level::level_enum level);
    
    // Flush and drop all loggers
    static void shutdown();
    
private:
    static std::shared_ptr<spdlog::logger> apiLogger;
    static std::shared_ptr<spdlog::logger> downloaderLogger;
    static std::shared_ptr<spdlog::logger> appLogger;
    static std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> consoleSink;
    
    static void createLogger(
        const std::string& name,
        const std::string& filename,
        std::shared_ptr<spdlog::logger>& logger
    );
};

// Convenience macros
#define LOG_API_INFO(...)    QobuzDL::Logger::getApiLogger()->info(__VA_ARGS__)
#define LOG_API_WARN(...)    QobuzDL::Logger::getApiLogger()->warn(__VA_ARGS__)
#define LOG_API_ERROR(...)   QobuzDL::Logger::getApiLogger()->error(__VA_ARGS__)
#define LOG_API_DEBUG(...)   QobuzDL::Logger::getApiLogger()->debug(__VA_ARGS__)

#define LOG_DL_INFO(...)     QobuzDL::Logger::getDownloaderLogger()->info(__VA_ARGS__)
#define LOG_DL_WARN(...)     QobuzDL::Logger::getDownloaderLogger()->warn(__VA_ARGS__)
#define LOG_DL_ERROR(...)    QobuzDL::Logger::getDownloaderLogger()->error(__VA_ARGS__)
#define LOG_DL_DEBUG(...)    QobuzDL::Logger::getDownloaderLogger()->debug(__VA_ARGS__)

#define LOG_APP_INFO(...)    QobuzDL::Logger::getAppLogger()->info(__VA_ARGS__)
#define LOG_APP_WARN(...)    QobuzDL::Logger::getAppLogger()->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)   QobuzDL::Logger::getAppLogger()->error(__VA_ARGS__)

} // namespace QobuzDL
