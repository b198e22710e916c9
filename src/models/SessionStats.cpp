#include "models/SessionStats.hpp"
#include <iomanip>
#include <sstream>

namespace QobuzDL {

SessionStats::SessionStats()
    : startTime(std::chrono::steady_clock::now()) {
}

void SessionStats::addProcessedTitle(const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex);
    processedTitles.insert(title);
}

std::size_t SessionStats::processedTitleCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return processedTitles.size();
}

std::uint64_t SessionStats::totalProcessed() const {
    return tracksDownloaded + tracksSkippedArchive + tracksSkippedExists + tracksFailed;
}

std::chrono::seconds SessionStats::elapsed() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - startTime);
}

std::string SessionStats::summary(bool dryRun) const {
    if (totalProcessed() == 0 && !dryRun) {
        return "No tracks were processed in this session.";
    }
    
    auto seconds = elapsed().count();
    double sizeMiB = static_cast<double>(bytesDownloaded.load()) / (1024.0 * 1024.0);
    
    std::ostringstream ss;
    ss << (dryRun ? "Dry Run Summary" : "Download Session Summary") << "\n"
       << "  Albums/Playlists Processed: " << processedTitleCount() << "\n"
       << "  Tracks Downloaded:          " << tracksDownloaded << "\n"
       << "  Skipped (in archive):       " << tracksSkippedArchive << "\n"
       << "  Skipped (already exists):   " << tracksSkippedExists << "\n"
       << "  Tracks Failed:              " << tracksFailed << "\n"
       << "  Total Size Downloaded:      " << std::fixed << std::setprecision(2) << sizeMiB << " MiB\n"
       << "  Time Elapsed:               "
       << std::setfill('0') << std::setw(2) << seconds / 3600 << ":"
       << std::setw(2) << (seconds / 60) % 60 << ":"
       << std::setw(2) << seconds % 60;
    return ss.str();
}

} // namespace QobuzDL
