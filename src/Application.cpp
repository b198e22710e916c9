#include "Application.hpp"
#include "api/Errors.hpp"
#include "utils/Logger.hpp"

namespace QobuzDL {

Application::Application(Config config)
    : config(std::move(config))
    , stopRequested(false) {
}

Application::~Application() {
    if (session) {
        session->close();
    }
}

void Application::initialize() {
    LOG_APP_INFO("Initializing download session...");
    
    const DownloadOptions& options = config.download;
    ApiClient::validateQuality(options.quality);
    
    transport = std::make_unique<CprTransport>(options.requestTimeoutMs);
    credentialProvider = std::make_unique<ConfigCredentialProvider>(config.app);
    session = std::make_unique<Session>(credentialProvider->getCredentials());
    client = std::make_unique<ApiClient>(*session, *transport);
    
    if (options.downloadArchive) {
        // Dry runs consult the archive but never extend it
        archive = std::make_unique<DownloadArchive>(options.archivePath, options.dryRun);
        if (archive->load()) {
            LOG_APP_INFO("Download archive {}: {} tracks", archive->getPath(), archive->size());
        } else {
            LOG_APP_WARN("Could not read download archive {}", archive->getPath());
        }
    } else {
        archive = std::make_unique<DownloadArchive>();
    }
    
    tagger = std::make_unique<PassthroughTagger>();
    progress = std::make_unique<LogProgressSink>();
    
    login();
    
    {
        std::lock_guard<std::mutex> lock(orchestratorMutex);
        orchestrator = std::make_unique<DownloadOrchestrator>(
            *client, options, *archive, stats, *tagger, *transport, *progress);
        if (stopRequested) {
            orchestrator->cancel();
        }
    }
    
    LOG_APP_INFO("Quality: {}", qualityLabel(options.quality));
    LOG_APP_INFO("Output directory: {}", options.directory);
    LOG_APP_INFO("Workers: {}", options.maxWorkers);
    if (options.dryRun) {
        LOG_APP_INFO("Dry run: nothing will be written");
    }
}

void Application::login() {
    const AccountCredentials& account = config.account;
    
    if (account.hasToken()) {
        client->authenticateWithToken(account.token);
    } else if (account.hasPassword()) {
        client->authenticate(account.email, account.passwordMd5);
    } else {
        throw AuthenticationError("No token or email/password configured.");
    }
    
    LOG_APP_INFO("Logged in");
}

void Application::run(const std::vector<std::string>& sources,
                      const std::vector<std::string>& searchQueries) {
    if (!orchestrator) {
        throw QobuzError("Application is not initialized");
    }
    
    orchestrator->downloadUrls(sources);
    
    for (const auto& query : searchQueries) {
        if (stopRequested) {
            break;
        }
        
        LOG_APP_INFO("Searching for '{}'", query);
        try {
            if (auto trackId = orchestrator->searchTrackId(query)) {
                orchestrator->handleUrl("https://play.qobuz.com/track/" + *trackId);
            }
        } catch (const FatalError&) {
            throw;
        } catch (const QobuzError& e) {
            LOG_APP_ERROR("Search for '{}' failed: {}", query, e.what());
        }
    }
    
    if (session) {
        session->close();
    }
}

void Application::stop() {
    if (stopRequested.exchange(true)) {
        return;
    }
    LOG_APP_WARN("Stop requested");
    std::lock_guard<std::mutex> lock(orchestratorMutex);
    if (orchestrator) {
        orchestrator->cancel();
    }
}

std::string Application::summary() const {
    return stats.summary(config.download.dryRun);
}

} // namespace QobuzDL
