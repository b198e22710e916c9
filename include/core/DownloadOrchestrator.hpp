#pragma once

#include "api/ApiClient.hpp"
#include "core/ContentResolver.hpp"
#include "core/DownloadArchive.hpp"
#include "core/FileMaterializer.hpp"
#include "core/ProgressSink.hpp"
#include "core/QualityNegotiator.hpp"
#include "core/TaskPool.hpp"
#include "models/Config.hpp"
#include "models/Content.hpp"
#include "models/SessionStats.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace QobuzDL {

/**
 * Drives content references through expansion, scheduling and materialization
 *
 * Per reference: resolve -> expand into track jobs -> drop archived and
 * repeated ids -> resolve stream descriptors on the worker pool -> submit every
 * job of the item to the pool -> wait for all of them. A failing track is counted and logged but never
 * cancels its siblings. FatalError aborts the run after the running item settles.
 */
class DownloadOrchestrator {
public:
    DownloadOrchestrator(ApiClient& client,
                         DownloadOptions options,
                         DownloadArchive& archive,
                         SessionStats& stats,
                         Tagger& tagger,
                         HttpTransport& transport,
                         ProgressSink& progress);
    
    // Prevent copying
    DownloadOrchestrator(const DownloadOrchestrator&) = delete;
    DownloadOrchestrator& operator=(const DownloadOrchestrator&) = delete;
    
    // Sources are URLs or text files with one URL per line
    void downloadUrls(const std::vector<std::string>& sources);
    
    // Per-item errors are logged and swallowed here; FatalError propagates
    void handleUrl(const std::string& url);
    
    void download(const ContentRef& ref);
    void downloadAlbum(const std::string& albumId, const std::string& directory);
    void downloadTrack(const std::string& trackId, const std::string& directory);
    void downloadTrackList(const std::vector<json>& tracks,
                           const std::string& description,
                           const std::string& directory);
    
    // First hit of a track search, if any
    std::optional<std::string> searchTrackId(const std::string& query);
    
    // Closes the work queue and aborts running transfers; queued tracks are dropped
    void cancel();
    bool isCancelled() const { return cancelled.load(); }
    
private:
    ApiClient& client;
    const DownloadOptions options;
    DownloadArchive& archive;
    SessionStats& stats;
    ProgressSink& progress;
    HttpTransport& transport;
    
    QualityNegotiator negotiator;
    ContentResolver resolver;
    FileMaterializer materializer;
    TaskPool pool;
    std::atomic<bool> cancelled;
    
    void downloadAlbumCollection(const CollectionListing& listing);
    
    // Removes archived and repeated ids and counts them; returns the remaining items
    std::vector<json> dropArchived(const std::vector<json>& tracks);
    
    // Resolves descriptors concurrently, keeping listing order.
    // albumMeta == nullptr means every item is its own release (playlists).
    std::vector<TrackJob> resolveJobs(const std::vector<json>& tracks, const json* albumMeta);
    
    // nullopt when the API returned a sample or no usable stream
    std::optional<TrackJob> buildTrackJob(const json& trackMeta,
                                          const json& albumOrTrackMeta,
                                          bool isTrack);
    
    bool meetsQuality(const FileDescriptor& file, const std::string& title);
    bool skipNonAlbum(const json& albumMeta) const;
    
    void runJobs(const std::vector<TrackJob>& jobs,
                 const std::string& description,
                 const std::string& directory);
    void recordResult(const MaterializeResult& result);
    std::uint64_t totalSize(const std::vector<TrackJob>& jobs);
};

} // namespace QobuzDL
