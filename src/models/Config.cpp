#include "models/Config.hpp"
#include "utils/FileUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace QobuzDL {

bool Config::loadFromFile(const std::string& filename) {
    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            return false;
        }
        
        json config;
        file >> config;
        
        // Account
        if (config.contains("account")) {
            const auto& acc = config["account"];
            account.email = acc.value("email", "");
            account.passwordMd5 = acc.value("password", "");
            account.token = acc.value("token", "");
        }
        
        // App credentials
        if (config.contains("app_id")) {
            app.appId = config["app_id"].is_string()
                ? config["app_id"].get<std::string>()
                : std::to_string(config["app_id"].get<int64_t>());
        }
        if (config.contains("secrets")) {
            app.secrets.clear();
            if (config["secrets"].is_array()) {
                for (const auto& secret : config["secrets"]) {
                    app.secrets.push_back(secret.get<std::string>());
                }
            } else if (config["secrets"].is_string()) {
                app.secrets = parseSecrets(config["secrets"].get<std::string>());
            }
        }
        
        // Download options
        if (config.contains("download")) {
            const auto& dl = config["download"];
            download.directory = dl.value("directory", download.directory);
            download.quality = dl.value("quality", download.quality);
            download.maxWorkers = dl.value("max_workers", download.maxWorkers);
            download.outputTemplate = dl.value("output_template", download.outputTemplate);
            download.embedArt = dl.value("embed_art", download.embedArt);
            download.albumsOnly = dl.value("albums_only", download.albumsOnly);
            download.qualityFallback = dl.value("quality_fallback", download.qualityFallback);
            download.coverOriginalQuality = dl.value("og_cover", download.coverOriginalQuality);
            download.noCover = dl.value("no_cover", download.noCover);
            download.smartDiscography = dl.value("smart_discography", download.smartDiscography);
            download.discographySaveSpace =
                dl.value("discography_save_space", download.discographySaveSpace);
            download.discographySkipExtras =
                dl.value("discography_skip_extras", download.discographySkipExtras);
            download.dryRun = dl.value("dry_run", download.dryRun);
            download.downloadArchive = dl.value("download_archive", download.downloadArchive);
            download.requestTimeoutMs = dl.value("request_timeout_ms", download.requestTimeoutMs);
        }
        
        // Archive lives next to the config file unless told otherwise
        const json* archivePath = nullptr;
        if (config.contains("download") && config["download"].contains("archive_path")) {
            archivePath = &config["download"]["archive_path"];
        }
        if (archivePath && archivePath->is_string()) {
            download.archivePath = archivePath->get<std::string>();
        } else {
            auto parent = std::filesystem::path(filename).parent_path();
            download.archivePath = (parent / "download_archive.txt").string();
        }
        
        return true;
    } catch (const json::exception&) {
        return false;
    }
}

bool Config::loadFromEnvironment() {
    // Account
    account.email = getEnv("QOBUZ_EMAIL");
    account.passwordMd5 = getEnv("QOBUZ_PASSWORD_MD5");
    account.token = getEnv("QOBUZ_TOKEN");
    
    // App credentials
    app.appId = getEnv("QOBUZ_APP_ID");
    app.secrets = parseSecrets(getEnv("QOBUZ_SECRETS"));
    
    // Download options
    download.directory = getEnv("QOBUZ_DIRECTORY", download.directory);
    download.quality = static_cast<int>(getEnvInt("QOBUZ_QUALITY", download.quality));
    download.maxWorkers = static_cast<int>(getEnvInt("QOBUZ_MAX_WORKERS", download.maxWorkers));
    download.outputTemplate = getEnv("QOBUZ_OUTPUT_TEMPLATE", download.outputTemplate);
    download.downloadArchive = getEnvBool("QOBUZ_DOWNLOAD_ARCHIVE", download.downloadArchive);
    download.archivePath = getEnv("QOBUZ_ARCHIVE_PATH", download.archivePath);
    download.dryRun = getEnvBool("QOBUZ_DRY_RUN", download.dryRun);
    
    return isComplete();
}

bool Config::isComplete() const {
    return !app.appId.empty() && !app.secrets.empty() &&
           (account.hasToken() || account.hasPassword());
}

json Config::toJson() const {
    // Secrets and password hash are never echoed back
    return json{
        {"account", {{"email", account.email}, {"token", account.hasToken() ? "<set>" : ""}}},
        {"app_id", app.appId},
        {"secrets", app.secrets.size()},
        {"download", {
            {"directory", download.directory},
            {"quality", download.quality},
            {"max_workers", download.maxWorkers},
            {"output_template", download.outputTemplate},
            {"embed_art", download.embedArt},
            {"albums_only", download.albumsOnly},
            {"quality_fallback", download.qualityFallback},
            {"og_cover", download.coverOriginalQuality},
            {"no_cover", download.noCover},
            {"smart_discography", download.smartDiscography},
            {"dry_run", download.dryRun},
            {"download_archive", download.downloadArchive},
            {"archive_path", download.archivePath}
        }}
    };
}

std::string Config::getEnv(const std::string& key, const std::string& defaultValue) const {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : defaultValue;
}

int64_t Config::getEnvInt(const std::string& key, int64_t defaultValue) const {
    const char* value = std::getenv(key.c_str());
    if (!value) return defaultValue;
    
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

bool Config::getEnvBool(const std::string& key, bool defaultValue) const {
    std::string value = toLower(getEnv(key));
    if (value.empty()) return defaultValue;
    
    return value == "1" || value == "true" || value == "yes";
}

std::vector<std::string> Config::parseSecrets(const std::string& commaSeparated) const {
    std::vector<std::string> secrets;
    std::stringstream ss(commaSeparated);
    std::string item;
    
    while (std::getline(ss, item, ',')) {
        // Trim whitespace
        item.erase(0, item.find_first_not_of(" \t\n\r"));
        item.erase(item.find_last_not_of(" \t\n\r") + 1);
        
        if (!item.empty()) {
            secrets.push_back(item);
        }
    }
    
    return secrets;
}

} // namespace QobuzDL
