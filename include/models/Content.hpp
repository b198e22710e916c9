#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace QobuzDL {

using json = nlohmann::json;

/**
 * Kind of content a URL points at
 */
enum class ContentType {
    Album,
    Track,
    Artist,
    Label,
    Playlist
};

/**
 * Convert URL path segment ("album", "track", ...) to ContentType
 */
std::optional<ContentType> stringToContentType(const std::string& str);

/**
 * Convert ContentType to its URL path segment
 */
std::string contentTypeToString(ContentType type);

// Artist, label and playlist references expand into many items
bool isCollection(ContentType type);

/**
 * Resolved (type, id) pair
 */
struct ContentRef {
    ContentType type;
    std::string id;
    
    bool operator==(const ContentRef& other) const {
        return type == other.type && id == other.id;
    }
};

/**
 * Quality ids accepted by track/getFileUrl
 */
constexpr int QUALITY_MP3 = 5;
constexpr int QUALITY_CD = 6;
constexpr int QUALITY_HIRES_96 = 7;
constexpr int QUALITY_HIRES_192 = 27;

bool isValidQuality(int quality);

// Human readable label, e.g. "6 - CD-Lossless (16-bit / 44.1kHz)"
std::string qualityLabel(int quality);

/**
 * Stream descriptor returned by track/getFileUrl
 */
struct FileDescriptor {
    std::string trackId;
    std::string url;                        // empty when the API withheld it
    std::uint64_t size = 0;                 // 0 when unknown
    std::optional<int> bitDepth;
    std::optional<double> samplingRate;     // kHz as reported
    std::vector<std::string> restrictions;  // restriction codes
    bool sample = false;                    // demo / preview stream
    
    // A descriptor can become a job only if it is a full stream with a sampling rate
    bool isDownloadable() const;
    
    bool hasRestriction(const std::string& code) const;
    
    static FileDescriptor fromJson(const json& j);
};

/**
 * Unit of work for the materializer
 */
struct TrackJob {
    json trackMeta;
    json albumOrTrackMeta;     // album/get tree, or the track tree itself for single tracks
    FileDescriptor file;
    bool isTrack = false;
    
    std::string trackId() const;
};

// Nested lookups that never throw
const json* findPath(const json& j, std::initializer_list<const char*> path);
std::string stringAt(const json& j, std::initializer_list<const char*> path,
                     const std::string& fallback = "");
std::int64_t integerAt(const json& j, std::initializer_list<const char*> path,
                       std::int64_t fallback = 0);

// Ids arrive as numbers for tracks and strings for albums
std::string idToString(const json& value);

/**
 * Title with " (version)" appended unless the version is already part of it
 */
std::string composeTitle(const json& item);

// album/get tree for album jobs, the nested "album" node for single tracks
const json& effectiveAlbumMeta(const json& albumOrTrackMeta);

} // namespace QobuzDL
