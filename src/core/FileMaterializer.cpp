#include "core/FileMaterializer.hpp"
#include "api/Errors.hpp"
#include "core/QualityNegotiator.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace QobuzDL {

std::string statusToString(MaterializeStatus status) {
    switch (status) {
        case MaterializeStatus::Done: return "done";
        case MaterializeStatus::SkippedExists: return "skipped (exists)";
        case MaterializeStatus::Failed: return "failed";
        case MaterializeStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

static std::string twoDigits(std::int64_t value) {
    std::ostringstream ss;
    ss << std::setw(2) << std::setfill('0') << value;
    return ss.str();
}

// 44.1 -> "44.1", 96.0 -> "96", 192000 -> "192"
static std::string formatSamplingRate(double rate) {
    if (rate >= 1000.0) {
        rate /= 1000.0;
    }
    std::ostringstream ss;
    if (std::fabs(rate - std::round(rate)) < 1e-9) {
        ss << static_cast<std::int64_t>(std::round(rate));
    } else {
        ss << std::fixed << std::setprecision(1) << rate;
    }
    return ss.str();
}

FileMaterializer::FileMaterializer(HttpTransport& transport,
                                   Tagger& tagger,
                                   DownloadArchive& archive,
                                   DownloadOptions options)
    : transport(transport)
    , tagger(tagger)
    , archive(archive)
    , options(options)
    , pathTemplate(options.outputTemplate) {
}

TemplateVariables FileMaterializer::templateVariables(const TrackJob& job) const {
    const json& track = job.trackMeta;
    const json& album = effectiveAlbumMeta(job.albumOrTrackMeta);
    
    std::string albumArtist = stringAt(album, {"artist", "name"});
    std::string artist = stringAt(track, {"performer", "name"}, albumArtist);
    std::int64_t mediaCount = integerAt(album, {"media_count"}, 1);
    
    std::string releaseDate = stringAt(album, {"release_date_original"});
    std::string year = releaseDate.empty() ? "0" : releaseDate.substr(0, releaseDate.find('-'));
    
    TemplateVariables vars{
        {"tracknumber", twoDigits(integerAt(track, {"track_number"}, 0))},
        {"tracktitle", composeTitle(track)},
        {"artist", artist},
        {"albumartist", albumArtist},
        {"album", stringAt(album, {"title"})},
        {"year", year},
        {"release_date", releaseDate},
        {"label", stringAt(album, {"label", "name"})},
        {"upc", stringAt(album, {"upc"})},
        {"isrc", stringAt(track, {"isrc"})},
        {"bit_depth", std::to_string(job.file.bitDepth.value_or(0))},
        {"sampling_rate", formatSamplingRate(job.file.samplingRate.value_or(0.0))},
        {"ext", formatExtension(QualityNegotiator::formatFor(options.quality))},
        {"composer", stringAt(track, {"composer", "name"})},
        {"release_type", stringAt(album, {"release_type"}, "album")},
        {"media_number", twoDigits(integerAt(track, {"media_number"}, 1))},
        {"media_count", std::to_string(mediaCount)},
        {"work", stringAt(track, {"work"})},
        {"version", stringAt(album, {"version"})},
        {"copyright", stringAt(album, {"copyright"})},
        {"genre", stringAt(album, {"genre", "name"})},
        {"is_multidisc", mediaCount > 1 ? "1" : "0"}
    };
    
    // Values must never introduce separators or reserved characters
    for (auto& [name, value] : vars) {
        value = sanitizeFilename(value);
    }
    return vars;
}

fs::path FileMaterializer::resolvePath(const TrackJob& job, const std::string& directory) const {
    std::string rendered = sanitizeFilepath(pathTemplate.render(templateVariables(job)));
    if (rendered.empty()) {
        throw TemplateError("Output template rendered an empty path");
    }
    return fs::path(directory) / rendered;
}

MaterializeResult FileMaterializer::materialize(const TrackJob& job,
                                                const std::string& directory,
                                                const ChunkCallback& onChunk,
                                                const StopCheck& shouldStop) {
    MaterializeResult result{MaterializeStatus::Failed, 0, "", ""};
    
    const std::string trackId = job.trackId();
    fs::path finalFile = resolvePath(job, directory);
    fs::path finalDir = finalFile.parent_path();
    result.path = finalFile.string();
    
    if (options.dryRun) {
        LOG_DL_INFO("DRY RUN: Would save track to: {}", result.path);
        result.status = MaterializeStatus::Done;
        return result;
    }
    
    if (fs::is_regular_file(finalFile)) {
        LOG_DL_INFO("Track already exists: {}", finalFile.filename().string());
        archive.add(trackId);
        result.status = MaterializeStatus::SkippedExists;
        return result;
    }
    
    fs::create_directories(finalDir);
    
    if (job.file.url.empty()) {
        result.error = "no stream URL";
        LOG_DL_WARN("Track '{}' not available for download. Skipping.", composeTitle(job.trackMeta));
        return result;
    }
    
    if (shouldStop && shouldStop()) {
        result.status = MaterializeStatus::Cancelled;
        return result;
    }
    
    fetchDirectoryExtras(finalDir, effectiveAlbumMeta(job.albumOrTrackMeta));
    
    fs::path tempFile = finalDir / ("." + trackId + ".tmp");
    HttpResponse response = transport.download(job.file.url, tempFile.string(), onChunk, shouldStop);
    if (response.aborted) {
        result.status = MaterializeStatus::Cancelled;
        result.error = response.error;
        LOG_DL_WARN("Download of '{}' interrupted", composeTitle(job.trackMeta));
        return result;
    }
    if (!response.ok()) {
        std::error_code ec;
        fs::remove(tempFile, ec);
        result.error = response.error.empty()
            ? "HTTP " + std::to_string(response.statusCode)
            : response.error;
        LOG_DL_ERROR("Download of '{}' failed: {}", composeTitle(job.trackMeta), result.error);
        return result;
    }
    
    TagResult tagged = TagResult::failure("tagger did not run");
    try {
        tagged = tagger.tag(tempFile.string(), job.trackMeta, job.albumOrTrackMeta,
                            job.isTrack, options.embedArt);
    } catch (const std::exception& e) {
        tagged = TagResult::failure(e.what());
    }
    
    if (!tagged.success) {
        // Temp file stays for the leftover sweep
        result.error = tagged.error;
        LOG_DL_ERROR("Error tagging '{}': {}", result.path, tagged.error);
        return result;
    }
    
    result.bytes = job.file.size > 0 ? job.file.size : fs::file_size(tempFile);
    fs::rename(tempFile, finalFile);
    archive.add(trackId);
    
    result.status = MaterializeStatus::Done;
    LOG_DL_DEBUG("Saved {}", result.path);
    return result;
}

void FileMaterializer::fetchDirectoryExtras(const fs::path& directory, const json& albumMeta) {
    {
        std::lock_guard<std::mutex> lock(directoriesMutex);
        if (!decoratedDirectories.insert(directory.string()).second) {
            return;
        }
    }
    
    if (!options.noCover) {
        std::string imageUrl = stringAt(albumMeta, {"image", "large"});
        if (!imageUrl.empty()) {
            if (options.coverOriginalQuality) {
                auto pos = imageUrl.find("_600.");
                if (pos != std::string::npos) {
                    imageUrl.replace(pos, 5, "_org.");
                }
            }
            fetchAsset(imageUrl, directory / "cover.jpg", "cover art");
        }
    }
    
    const json* goodies = findPath(albumMeta, {"goodies"});
    if (goodies && goodies->is_array() && !goodies->empty()) {
        std::string bookletUrl = stringAt(goodies->front(), {"url"});
        const std::string pdf = ".pdf";
        if (bookletUrl.size() > pdf.size() &&
            bookletUrl.compare(bookletUrl.size() - pdf.size(), pdf.size(), pdf) == 0) {
            fetchAsset(bookletUrl, directory / "booklet.pdf", "booklet");
        }
    }
}

bool FileMaterializer::fetchAsset(const std::string& url,
                                  const fs::path& target,
                                  const std::string& description) {
    if (fs::is_regular_file(target)) {
        LOG_DL_DEBUG("{} '{}' already exists. Skipping.", description, target.filename().string());
        return true;
    }
    
    HttpResponse response = transport.download(url, target.string(), nullptr, nullptr);
    if (!response.ok()) {
        std::error_code ec;
        fs::remove(target, ec);
        LOG_DL_WARN("Error downloading {}: {}", description,
                    response.error.empty() ? "HTTP " + std::to_string(response.statusCode)
                                           : response.error);
        return false;
    }
    return true;
}

} // namespace QobuzDL
