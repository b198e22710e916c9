#pragma once

#include "api/HttpTransport.hpp"
#include "core/DownloadArchive.hpp"
#include "core/PathTemplate.hpp"
#include "core/Tagger.hpp"
#include "models/Config.hpp"
#include "models/Content.hpp"
#include <filesystem>
#include <mutex>
#include <set>
#include <string>

namespace QobuzDL {

enum class MaterializeStatus {
    Done,
    SkippedExists,
    Failed,
    Cancelled
};

std::string statusToString(MaterializeStatus status);

struct MaterializeResult {
    MaterializeStatus status;
    std::uint64_t bytes = 0;
    std::string path;
    std::string error;
};

/**
 * Writes one track job to disk
 *
 * final path = directory / rendered template. Audio goes to a hidden
 * ".<trackId>.tmp" next to it, is handed to the Tagger, and only then renamed
 * into place and recorded in the archive. Cover art and booklet are fetched
 * once per directory and never fail the track.
 */
class FileMaterializer {
public:
    FileMaterializer(HttpTransport& transport,
                     Tagger& tagger,
                     DownloadArchive& archive,
                     DownloadOptions options);
    
    // Template errors and filesystem errors propagate to the caller.
    // A stop request aborts the transfer and leaves the temp file behind.
    MaterializeResult materialize(const TrackJob& job,
                                  const std::string& directory,
                                  const ChunkCallback& onChunk = nullptr,
                                  const StopCheck& shouldStop = nullptr);
    
    std::filesystem::path resolvePath(const TrackJob& job, const std::string& directory) const;
    
    TemplateVariables templateVariables(const TrackJob& job) const;
    
private:
    HttpTransport& transport;
    Tagger& tagger;
    DownloadArchive& archive;
    const DownloadOptions options;
    const PathTemplate pathTemplate;
    
    std::set<std::string> decoratedDirectories;
    std::mutex directoriesMutex;
    
    void fetchDirectoryExtras(const std::filesystem::path& directory, const json& albumMeta);
    bool fetchAsset(const std::string& url,
                    const std::filesystem::path& target,
                    const std::string& description);
};

} // namespace QobuzDL
