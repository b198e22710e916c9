#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace QobuzDL {

using json = nlohmann::json;

/**
 * Account login material
 * Either a user auth token, or an email plus MD5-hashed password
 */
struct AccountCredentials {
    std::string email;
    std::string passwordMd5;
    std::string token;
    
    bool hasToken() const { return !token.empty(); }
    bool hasPassword() const { return !email.empty() && !passwordMd5.empty(); }
};

/**
 * Application credentials harvested by the external credential provider
 */
struct AppCredentials {
    std::string appId;
    std::vector<std::string> secrets;   // ordered candidates
};

/**
 * Immutable download settings, copied into each component
 */
struct DownloadOptions {
    std::string directory = "Qobuz Downloads";
    int quality = 6;
    int maxWorkers = 8;
    std::string outputTemplate;            // empty = PathTemplate::DEFAULT_PATTERN
    bool embedArt = false;
    bool albumsOnly = false;               // skip singles, EPs and VA releases
    bool qualityFallback = true;
    bool coverOriginalQuality = false;
    bool noCover = false;
    bool smartDiscography = false;
    bool discographySaveSpace = true;
    bool discographySkipExtras = true;
    bool dryRun = false;
    bool downloadArchive = false;
    std::string archivePath = "download_archive.txt";
    int requestTimeoutMs = 30000;
};

/**
 * Configuration management class
 * Loads configuration from a JSON file or from environment variables
 */
class Config {
public:
    AccountCredentials account;
    AppCredentials app;
    DownloadOptions download;
    
    Config() = default;
    
    // Load configuration
    bool loadFromFile(const std::string& filename);
    bool loadFromEnvironment();
    
    // Enough to open a session
    bool isComplete() const;
    
    json toJson() const;
    
private:
    // Helper methods
    std::string getEnv(const std::string& key, const std::string& defaultValue = "") const;
    int64_t getEnvInt(const std::string& key, int64_t defaultValue = 0) const;
    bool getEnvBool(const std::string& key, bool defaultValue) const;
    std::vector<std::string> parseSecrets(const std::string& commaSeparated) const;
};

} // namespace QobuzDL
