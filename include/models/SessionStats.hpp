#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>

namespace QobuzDL {

/**
 * Counters for one download session
 * Each track outcome is recorded exactly once by the orchestrator
 */
class SessionStats {
public:
    SessionStats();
    
    std::atomic<std::uint64_t> tracksDownloaded{0};
    std::atomic<std::uint64_t> tracksSkippedArchive{0};
    std::atomic<std::uint64_t> tracksSkippedExists{0};
    std::atomic<std::uint64_t> tracksFailed{0};
    std::atomic<std::uint64_t> bytesDownloaded{0};
    
    // Albums and playlists seen this session
    void addProcessedTitle(const std::string& title);
    std::size_t processedTitleCount() const;
    
    std::uint64_t totalProcessed() const;
    std::chrono::seconds elapsed() const;
    
    // Multi-line human readable summary
    std::string summary(bool dryRun = false) const;
    
private:
    std::chrono::steady_clock::time_point startTime;
    std::set<std::string> processedTitles;
    mutable std::mutex mutex;
};

} // namespace QobuzDL
