#include "core/DownloadArchive.hpp"
#include "utils/Logger.hpp"
#include <filesystem>
#include <fstream>

namespace QobuzDL {

DownloadArchive::DownloadArchive()
    : enabled(false)
    , readOnly(true) {
}

DownloadArchive::DownloadArchive(std::string archivePath, bool readOnlyArchive)
    : path(std::move(archivePath))
    , enabled(true)
    , readOnly(readOnlyArchive) {
}

bool DownloadArchive::load() {
    if (!enabled) {
        return true;
    }
    
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_DL_INFO("Download archive not found. A new one will be created at {}", path);
        return true;
    }
    
    std::lock_guard<std::mutex> lock(mutex);
    std::string line;
    while (std::getline(file, line)) {
        // Tolerate CRLF files
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
            line.pop_back();
        }
        if (!line.empty()) {
            ids.insert(line);
        }
    }
    
    if (file.bad()) {
        LOG_DL_ERROR("Error while reading download archive {}", path);
        return false;
    }
    
    LOG_DL_INFO("Loaded {} track IDs from the download archive.", ids.size());
    return true;
}

bool DownloadArchive::contains(const std::string& trackId) const {
    if (!enabled) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    return ids.count(trackId) > 0;
}

bool DownloadArchive::add(const std::string& trackId) {
    if (!enabled || readOnly || trackId.empty()) {
        return false;
    }
    
    std::lock_guard<std::mutex> lock(mutex);
    if (!ids.insert(trackId).second) {
        return false;
    }
    
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    
    std::ofstream file(path, std::ios::app);
    file << trackId << '\n';
    if (!file) {
        LOG_DL_ERROR("Could not append track {} to download archive {}", trackId, path);
    }
    return true;
}

std::size_t DownloadArchive::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return ids.size();
}

} // namespace QobuzDL
