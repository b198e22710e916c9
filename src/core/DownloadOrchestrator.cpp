#include "core/DownloadOrchestrator.hpp"
#include "api/Errors.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include <filesystem>
#include <exception>
#include <future>
#include <unordered_set>

namespace fs = std::filesystem;

namespace QobuzDL {

static ResolverOptions resolverOptionsFrom(const DownloadOptions& options) {
    ResolverOptions resolverOptions;
    resolverOptions.smartDiscography = options.smartDiscography;
    resolverOptions.discography.saveSpace = options.discographySaveSpace;
    resolverOptions.discography.skipExtras = options.discographySkipExtras;
    return resolverOptions;
}

DownloadOrchestrator::DownloadOrchestrator(ApiClient& client,
                                           DownloadOptions options,
                                           DownloadArchive& archive,
                                           SessionStats& stats,
                                           Tagger& tagger,
                                           HttpTransport& transport,
                                           ProgressSink& progress)
    : client(client)
    , options(options)
    , archive(archive)
    , stats(stats)
    , progress(progress)
    , transport(transport)
    , resolver(client, resolverOptionsFrom(options))
    , materializer(transport, tagger, archive, options)
    , pool(static_cast<std::size_t>(options.maxWorkers > 0 ? options.maxWorkers : 1))
    , cancelled(false) {
}

void DownloadOrchestrator::downloadUrls(const std::vector<std::string>& sources) {
    for (const auto& source : sources) {
        if (isCancelled()) {
            break;
        }
        
        if (fs::is_regular_file(source)) {
            LOG_DL_INFO("Reading URLs from {}", source);
            for (const auto& url : readSourceLines(source)) {
                if (isCancelled()) {
                    break;
                }
                handleUrl(url);
            }
        } else {
            handleUrl(source);
        }
    }
}

void DownloadOrchestrator::handleUrl(const std::string& url) {
    ContentRef ref;
    try {
        ref = ContentResolver::parseUrl(url);
    } catch (const InvalidUrl& e) {
        LOG_DL_ERROR("{}", e.what());
        return;
    }
    
    LOG_DL_INFO("Processing {} {}", contentTypeToString(ref.type), ref.id);
    
    try {
        download(ref);
    } catch (const FatalError&) {
        throw;
    } catch (const NonStreamable& e) {
        LOG_DL_WARN("{}", e.what());
    } catch (const QobuzError& e) {
        stats.tracksFailed++;
        LOG_DL_ERROR("Error processing {}: {}", url, e.what());
    } catch (const json::exception& e) {
        stats.tracksFailed++;
        LOG_DL_ERROR("Unexpected metadata for {}: {}", url, e.what());
    } catch (const fs::filesystem_error& e) {
        stats.tracksFailed++;
        LOG_DL_ERROR("Filesystem error while processing {}: {}", url, e.what());
    }
}

void DownloadOrchestrator::download(const ContentRef& ref) {
    switch (ref.type) {
        case ContentType::Album:
            downloadAlbum(ref.id, options.directory);
            return;
        case ContentType::Track:
            downloadTrack(ref.id, options.directory);
            return;
        case ContentType::Artist:
        case ContentType::Label:
            downloadAlbumCollection(resolver.expand(ref));
            return;
        case ContentType::Playlist: {
            CollectionListing listing = resolver.expand(ref);
            stats.addProcessedTitle(listing.name);
            std::string directory = (fs::path(options.directory) / sanitizeFilename(listing.name)).string();
            LOG_DL_INFO("Downloading playlist: {} ({} tracks)", listing.name, listing.items.size());
            downloadTrackList(listing.items, listing.name, directory);
            return;
        }
    }
}

void DownloadOrchestrator::downloadAlbumCollection(const CollectionListing& listing) {
    stats.addProcessedTitle(listing.name);
    std::string directory = (fs::path(options.directory) / sanitizeFilename(listing.name)).string();
    LOG_DL_INFO("Downloading {} {}: {} releases",
                contentTypeToString(listing.ref.type), listing.name, listing.items.size());
    
    for (const auto& album : listing.items) {
        if (isCancelled()) {
            return;
        }
        
        std::string albumId = idToString(album.value("id", json()));
        if (albumId.empty()) {
            continue;
        }
        
        // One bad release must not stop the rest of the catalog
        try {
            downloadAlbum(albumId, directory);
        } catch (const FatalError&) {
            throw;
        } catch (const NonStreamable& e) {
            LOG_DL_WARN("{}", e.what());
        } catch (const QobuzError& e) {
            stats.tracksFailed++;
            LOG_DL_ERROR("Error downloading album {}: {}", albumId, e.what());
        }
    }
}

bool DownloadOrchestrator::skipNonAlbum(const json& albumMeta) const {
    if (!options.albumsOnly) {
        return false;
    }
    
    std::string releaseType = stringAt(albumMeta, {"release_type"}, "album");
    std::string artist = stringAt(albumMeta, {"artist", "name"});
    if (releaseType != "album" || artist == "Various Artists") {
        LOG_DL_INFO("Ignoring Single/EP/VA: {}", composeTitle(albumMeta));
        return true;
    }
    return false;
}

void DownloadOrchestrator::downloadAlbum(const std::string& albumId, const std::string& directory) {
    json meta = client.getAlbumMeta(albumId);
    std::string title = composeTitle(meta);
    
    const json* streamable = findPath(meta, {"streamable"});
    if (!streamable || !streamable->is_boolean() || !streamable->get<bool>()) {
        throw NonStreamable("This release is not streamable: " + title);
    }
    
    if (skipNonAlbum(meta)) {
        return;
    }
    
    stats.addProcessedTitle(title);
    LOG_DL_INFO("Downloading album: {}", title);
    
    std::vector<json> tracks;
    if (const json* items = findPath(meta, {"tracks", "items"})) {
        if (items->is_array()) {
            tracks.assign(items->begin(), items->end());
        }
    }
    
    std::vector<TrackJob> jobs = resolveJobs(dropArchived(tracks), &meta);
    
    // The whole album shares one tier; the first descriptor decides
    if (!jobs.empty() && !meetsQuality(jobs.front().file, title)) {
        return;
    }
    
    runJobs(jobs, title, directory);
}

void DownloadOrchestrator::downloadTrack(const std::string& trackId, const std::string& directory) {
    if (archive.contains(trackId)) {
        stats.tracksSkippedArchive++;
        LOG_DL_INFO("Track {} was already downloaded. Skipping.", trackId);
        return;
    }
    
    json meta = client.getTrackMeta(trackId);
    std::string title = composeTitle(meta);
    
    const json* streamable = findPath(meta, {"streamable"});
    if (streamable && streamable->is_boolean() && !streamable->get<bool>()) {
        throw NonStreamable("Track is not available for download: " + title);
    }
    
    std::optional<TrackJob> job = buildTrackJob(meta, meta, true);
    if (!job || !meetsQuality(job->file, title)) {
        return;
    }
    
    LOG_DL_INFO("Downloading track: {}", title);
    runJobs({*job}, title, directory);
}

void DownloadOrchestrator::downloadTrackList(const std::vector<json>& tracks,
                                             const std::string& description,
                                             const std::string& directory) {
    std::vector<TrackJob> jobs;
    for (auto& job : resolveJobs(dropArchived(tracks), nullptr)) {
        if (meetsQuality(job.file, composeTitle(job.trackMeta))) {
            jobs.push_back(std::move(job));
        }
    }
    
    runJobs(jobs, description, directory);
}

std::vector<json> DownloadOrchestrator::dropArchived(const std::vector<json>& tracks) {
    std::vector<json> remaining;
    remaining.reserve(tracks.size());
    std::unordered_set<std::string> scheduled;
    
    for (const auto& track : tracks) {
        std::string trackId = idToString(track.value("id", json()));
        if (!trackId.empty() && archive.contains(trackId)) {
            stats.tracksSkippedArchive++;
            LOG_DL_INFO("{} was already downloaded. Skipping.", composeTitle(track));
            continue;
        }
        // Listed more than once; one worker per id
        if (!trackId.empty() && !scheduled.insert(trackId).second) {
            stats.tracksSkippedArchive++;
            LOG_DL_INFO("{} is listed more than once. Skipping the repeat.", composeTitle(track));
            continue;
        }
        remaining.push_back(track);
    }
    return remaining;
}

std::vector<TrackJob> DownloadOrchestrator::resolveJobs(const std::vector<json>& tracks,
                                                        const json* albumMeta) {
    std::vector<std::optional<TrackJob>> slots(tracks.size());
    std::vector<std::future<void>> futures;
    futures.reserve(tracks.size());
    
    for (std::size_t i = 0; i < tracks.size(); ++i) {
        auto work = [this, &tracks, &slots, albumMeta, i]() {
            const json& track = tracks[i];
            slots[i] = buildTrackJob(track, albumMeta ? *albumMeta : track, albumMeta == nullptr);
        };
        
        try {
            futures.push_back(pool.submit(work));
        } catch (const std::runtime_error&) {
            LOG_DL_WARN("Download cancelled while resolving streams");
            break;
        }
    }
    
    // Every task references tracks and slots; join all before leaving
    std::exception_ptr fatal;
    std::exception_ptr failure;
    for (auto& future : futures) {
        try {
            future.get();
        } catch (const std::future_error& e) {
            if (e.code() != std::future_errc::broken_promise && !failure) {
                failure = std::current_exception();
            }
        } catch (const FatalError&) {
            if (!fatal) {
                fatal = std::current_exception();
            }
        } catch (const std::exception&) {
            if (!failure) {
                failure = std::current_exception();
            }
        }
    }
    
    if (fatal) {
        std::rethrow_exception(fatal);
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
    
    std::vector<TrackJob> jobs;
    for (auto& slot : slots) {
        if (slot) {
            jobs.push_back(std::move(*slot));
        }
    }
    return jobs;
}

std::optional<TrackJob> DownloadOrchestrator::buildTrackJob(const json& trackMeta,
                                                            const json& albumOrTrackMeta,
                                                            bool isTrack) {
    std::string trackId = idToString(trackMeta.value("id", json()));
    if (trackId.empty()) {
        LOG_DL_WARN("Track without id in listing. Skipping.");
        return std::nullopt;
    }
    
    FileDescriptor file;
    try {
        file = FileDescriptor::fromJson(client.getTrackUrl(trackId, options.quality));
    } catch (const FatalError&) {
        throw;
    } catch (const QobuzError& e) {
        stats.tracksFailed++;
        LOG_DL_ERROR("Could not resolve stream for track {}: {}", trackId, e.what());
        return std::nullopt;
    }
    
    if (!file.isDownloadable()) {
        LOG_DL_INFO("Demo or unavailable stream for '{}'. Skipping.", composeTitle(trackMeta));
        return std::nullopt;
    }
    
    TrackJob job;
    job.trackMeta = trackMeta;
    job.albumOrTrackMeta = albumOrTrackMeta;
    job.file = std::move(file);
    job.isTrack = isTrack;
    return job;
}

bool DownloadOrchestrator::meetsQuality(const FileDescriptor& file, const std::string& title) {
    Negotiation negotiation = negotiator.negotiate(options.quality, file);
    
    if (negotiator.shouldSkip(negotiation, options.qualityFallback)) {
        LOG_DL_INFO("Skipping '{}' as it doesn't meet the quality requirement", title);
        return false;
    }
    if (!negotiation.qualityMet) {
        LOG_DL_WARN("'{}' is not available in the requested quality, downloading {}-bit / {} kHz",
                    title, file.bitDepth.value_or(0), file.samplingRate.value_or(0.0));
    }
    return true;
}

std::uint64_t DownloadOrchestrator::totalSize(const std::vector<TrackJob>& jobs) {
    std::uint64_t total = 0;
    for (const auto& job : jobs) {
        total += job.file.size;
    }
    
    if (total > 0 || options.dryRun) {
        return total;
    }
    
    // Sizes were omitted; ask the CDN
    for (const auto& job : jobs) {
        if (!job.file.url.empty()) {
            total += transport.contentLength(job.file.url);
        }
    }
    return total;
}

void DownloadOrchestrator::recordResult(const MaterializeResult& result) {
    switch (result.status) {
        case MaterializeStatus::Done:
            stats.tracksDownloaded++;
            stats.bytesDownloaded += result.bytes;
            break;
        case MaterializeStatus::SkippedExists:
            stats.tracksSkippedExists++;
            break;
        case MaterializeStatus::Failed:
            stats.tracksFailed++;
            break;
        case MaterializeStatus::Cancelled:
            break;
    }
}

void DownloadOrchestrator::runJobs(const std::vector<TrackJob>& jobs,
                                   const std::string& description,
                                   const std::string& directory) {
    if (jobs.empty()) {
        LOG_DL_INFO("Nothing to download for {}", description);
        return;
    }
    
    std::uint64_t total = totalSize(jobs);
    ProgressUnit unit = total > 0 ? ProgressUnit::Bytes : ProgressUnit::Files;
    int taskId = progress.addTask(description, unit == ProgressUnit::Bytes ? total : jobs.size(), unit);
    
    std::vector<std::future<void>> futures;
    futures.reserve(jobs.size());
    
    for (const auto& job : jobs) {
        auto work = [this, &job, &directory, taskId, unit]() {
            ChunkCallback onChunk;
            if (unit == ProgressUnit::Bytes) {
                onChunk = [this, taskId](std::uint64_t bytes) { progress.advance(taskId, bytes); };
            }
            
            try {
                MaterializeResult result = materializer.materialize(
                    job, directory, onChunk, [this]() { return isCancelled(); });
                recordResult(result);
            } catch (const FatalError&) {
                stats.tracksFailed++;
                throw;
            } catch (const std::exception& e) {
                stats.tracksFailed++;
                LOG_DL_ERROR("Error downloading '{}': {}", composeTitle(job.trackMeta), e.what());
            }
            
            if (unit == ProgressUnit::Files) {
                progress.advance(taskId, 1);
            }
        };
        
        try {
            futures.push_back(pool.submit(work));
        } catch (const std::runtime_error&) {
            LOG_DL_WARN("Download cancelled, {} of {} tracks not scheduled",
                        jobs.size() - futures.size(), jobs.size());
            break;
        }
    }
    
    // Wait for every track of the item before moving on
    std::exception_ptr fatal;
    std::size_t dropped = 0;
    for (auto& future : futures) {
        try {
            future.get();
        } catch (const std::future_error& e) {
            if (e.code() != std::future_errc::broken_promise) {
                throw;
            }
            ++dropped;
        } catch (const FatalError&) {
            if (!fatal) {
                fatal = std::current_exception();
            }
        }
    }
    
    progress.finishTask(taskId);
    
    if (dropped > 0) {
        LOG_DL_WARN("{} queued tracks of {} were cancelled", dropped, description);
    }
    if (fatal) {
        std::rethrow_exception(fatal);
    }
}

std::optional<std::string> DownloadOrchestrator::searchTrackId(const std::string& query) {
    json results = client.searchTracks(query, 1);
    
    const json* items = findPath(results, {"tracks", "items"});
    if (!items || !items->is_array() || items->empty()) {
        LOG_DL_INFO("No track found for '{}'", query);
        return std::nullopt;
    }
    
    std::string trackId = idToString(items->front().value("id", json()));
    if (trackId.empty()) {
        return std::nullopt;
    }
    return trackId;
}

void DownloadOrchestrator::cancel() {
    if (cancelled.exchange(true)) {
        return;
    }
    LOG_DL_WARN("Cancelling downloads...");
    pool.close();
}

} // namespace QobuzDL
