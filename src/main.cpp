#include "Application.hpp"
#include "api/Errors.hpp"
#include "models/Config.hpp"
#include "utils/Logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

std::atomic<bool> interrupted{false};

void signalHandler(int) {
    interrupted = true;
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <url|file>...\n\n"
              << "Options:\n"
              << "  -c, --config <path>   configuration file (default: config/config.json)\n"
              << "  -s, --search <query>  download the first track matching query\n"
              << "  -v, --verbose         debug output on the console\n"
              << "  -h, --help            show this help\n\n"
              << "Sources are album, track, artist, label or playlist URLs,\n"
              << "or text files with one URL per line.\n";
}

} // namespace

int main(int argc, char* argv[]) {
    QobuzDL::Logger::initialize();
    
    std::string configFile = "config/config.json";
    std::vector<std::string> sources;
    std::vector<std::string> searches;
    
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configFile = argv[++i];
        } else if ((arg == "-s" || arg == "--search") && i + 1 < argc) {
            searches.push_back(argv[++i]);
        } else if (arg == "-v" || arg == "--verbose") {
            QobuzDL::Logger::setConsoleLevel(spdlog::level::debug);
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        } else {
            sources.push_back(arg);
        }
    }
    
    if (sources.empty() && searches.empty()) {
        printUsage(argv[0]);
        return 2;
    }
    
    QobuzDL::Config config;
    if (config.loadFromFile(configFile)) {
        LOG_APP_INFO("Configuration loaded from file: {}", configFile);
    } else {
        LOG_APP_WARN("Failed to load config file, trying environment variables");
        if (!config.loadFromEnvironment()) {
            std::cerr << "Error: Could not load configuration from file or environment\n";
            QobuzDL::Logger::shutdown();
            return 1;
        }
        LOG_APP_INFO("Configuration loaded from environment");
    }
    
    if (!config.isComplete()) {
        std::cerr << "Error: app_id, secrets and a token or email/password are required\n";
        QobuzDL::Logger::shutdown();
        return 1;
    }
    
    QobuzDL::Application app(config);
    int exitCode = 0;
    
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    
    // Signal handlers only flip a flag; cancellation happens here
    std::atomic<bool> finished{false};
    std::thread watcher([&app, &finished]() {
        while (!finished) {
            if (interrupted) {
                std::cerr << "\nInterrupted, aborting downloads...\n";
                app.stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
    
    try {
        app.initialize();
        if (!interrupted) {
            app.run(sources, searches);
        }
    } catch (const QobuzDL::FatalError& e) {
        LOG_APP_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        exitCode = 1;
    } catch (const std::exception& e) {
        LOG_APP_ERROR("Unexpected error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        exitCode = 1;
    }
    
    finished = true;
    watcher.join();
    
    std::cout << app.summary() << std::endl;
    
    if (interrupted && exitCode == 0) {
        exitCode = 130;
    }
    
    QobuzDL::Logger::shutdown();
    return exitCode;
}
