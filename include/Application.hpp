#pragma once

#include "api/ApiClient.hpp"
#include "api/CprTransport.hpp"
#include "api/CredentialProvider.hpp"
#include "api/Session.hpp"
#include "core/DownloadArchive.hpp"
#include "core/DownloadOrchestrator.hpp"
#include "core/ProgressSink.hpp"
#include "core/Tagger.hpp"
#include "models/Config.hpp"
#include "models/SessionStats.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace QobuzDL {

/**
 * One download run
 * Owns the transport, session, client and orchestrator for its lifetime
 */
class Application {
public:
    explicit Application(Config config);
    ~Application();
    
    // Prevent copying
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    
    // Build components and log in. FatalError on bad credentials
    void initialize();
    
    // Download every source, then every first search hit
    void run(const std::vector<std::string>& sources,
             const std::vector<std::string>& searchQueries = {});
    
    // Safe to call from another thread
    void stop();
    
    std::string summary() const;
    const SessionStats& getStats() const { return stats; }
    
private:
    const Config config;
    SessionStats stats;
    
    std::unique_ptr<CprTransport> transport;
    std::unique_ptr<CredentialProvider> credentialProvider;
    std::unique_ptr<Session> session;
    std::unique_ptr<ApiClient> client;
    std::unique_ptr<DownloadArchive> archive;
    std::unique_ptr<Tagger> tagger;
    std::unique_ptr<ProgressSink> progress;
    std::unique_ptr<DownloadOrchestrator> orchestrator;
    std::atomic<bool> stopRequested;
    std::mutex orchestratorMutex;
    
    void login();
};

} // namespace QobuzDL
