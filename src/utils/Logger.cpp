#include "utils/Logger.hpp"
#include <filesystem>
#include <iostream>
#include <mutex>

namespace QobuzDL {

std::shared_ptr<spdlog::logger> Logger::apiLogger = nullptr;
std::shared_ptr<spdlog::logger> Logger::downloaderLogger = nullptr;
std::shared_ptr<spdlog::logger> Logger::appLogger = nullptr;
std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> Logger::consoleSink = nullptr;

namespace {
std::once_flag initFlag;
}

void Logger::initialize(const std::string& logDirectory) {
    // Worker threads may log before main has finished setting up
    std::call_once(initFlag, [&logDirectory]() {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        
        std::error_code ec;
        std::filesystem::create_directories(logDirectory, ec);
        if (ec) {
            std::cerr << "Could not create log directory " << logDirectory
                      << ": " << ec.message() << std::endl;
        }
        
        consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_level(spdlog::level::info);
        
        createLogger("api", logDirectory + "/api_log.txt", apiLogger);
        createLogger("downloader", logDirectory + "/downloader_log.txt", downloaderLogger);
        createLogger("app", logDirectory + "/app_log.txt", appLogger);
        
        appLogger->debug("Logging system initialized");
    });
}

void Logger::createLogger(
    const std::string& name,
    const std::string& filename,
    std::shared_ptr<spdlog::logger>& logger
) {
    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    try {
        // Rotating file sink: 10MB max size, 3 backup files
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            filename, 1024 * 1024 * 10, 3
        );
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "File logging disabled for " << name << ": " << ex.what() << std::endl;
    }
    
    logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    spdlog::register_logger(logger);
}

std::shared_ptr<spdlog::logger> Logger::getApiLogger() {
    initialize();
    return apiLogger;
}

std::shared_ptr<spdlog::logger> Logger::getDownloaderLogger() {
    initialize();
    return downloaderLogger;
}

std::shared_ptr<spdlog::logger> Logger::getAppLogger() {
    initialize();
    return appLogger;
}

void Logger::setConsoleLevel(spdlog::level::level_enum level) {
    initialize();
    consoleSink->set_level(level);
}

void Logger::shutdown() {
    if (apiLogger) {
        apiLogger->flush();
    }
    if (downloaderLogger) {
        downloaderLogger->flush();
    }
    if (appLogger) {
        appLogger->flush();
    }
    
    spdlog::shutdown();
}

} // namespace QobuzDL
