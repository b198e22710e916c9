#include "models/Content.hpp"
#include "utils/FileUtils.hpp"
#include <algorithm>
#include <cmath>

namespace QobuzDL {

std::optional<ContentType> stringToContentType(const std::string& str) {
    std::string lower = toLower(str);
    
    if (lower == "album") return ContentType::Album;
    if (lower == "track") return ContentType::Track;
    if (lower == "artist") return ContentType::Artist;
    if (lower == "label") return ContentType::Label;
    if (lower == "playlist") return ContentType::Playlist;
    
    return std::nullopt;
}

std::string contentTypeToString(ContentType type) {
    switch (type) {
        case ContentType::Album: return "album";
        case ContentType::Track: return "track";
        case ContentType::Artist: return "artist";
        case ContentType::Label: return "label";
        case ContentType::Playlist: return "playlist";
    }
    return "unknown";
}

bool isCollection(ContentType type) {
    switch (type) {
        case ContentType::Artist:
        case ContentType::Label:
        case ContentType::Playlist:
            return true;
        case ContentType::Album:
        case ContentType::Track:
            return false;
    }
    return false;
}

bool isValidQuality(int quality) {
    return quality == QUALITY_MP3 || quality == QUALITY_CD ||
           quality == QUALITY_HIRES_96 || quality == QUALITY_HIRES_192;
}

std::string qualityLabel(int quality) {
    switch (quality) {
        case QUALITY_MP3: return "5 - MP3 (320 kbps)";
        case QUALITY_CD: return "6 - CD-Lossless (16-bit / 44.1kHz)";
        case QUALITY_HIRES_96: return "7 - Hi-Res (24-bit / up to 96kHz)";
        case QUALITY_HIRES_192: return "27 - Hi-Res (24-bit / up to 192kHz)";
        default: return "Unknown";
    }
}

bool FileDescriptor::isDownloadable() const {
    return !sample && samplingRate.has_value() && *samplingRate > 0 && !trackId.empty();
}

bool FileDescriptor::hasRestriction(const std::string& code) const {
    return std::find(restrictions.begin(), restrictions.end(), code) != restrictions.end();
}

FileDescriptor FileDescriptor::fromJson(const json& j) {
    FileDescriptor fd;
    
    if (j.contains("track_id")) {
        fd.trackId = idToString(j["track_id"]);
    }
    fd.url = stringAt(j, {"url"});
    
    // Some responses only carry url_size
    std::int64_t size = integerAt(j, {"size"});
    if (size <= 0) {
        size = integerAt(j, {"url_size"});
    }
    fd.size = size > 0 ? static_cast<std::uint64_t>(size) : 0;
    
    if (j.contains("bit_depth") && j["bit_depth"].is_number()) {
        fd.bitDepth = j["bit_depth"].get<int>();
    }
    if (j.contains("sampling_rate") && j["sampling_rate"].is_number()) {
        fd.samplingRate = j["sampling_rate"].get<double>();
    }
    if (j.contains("restrictions") && j["restrictions"].is_array()) {
        for (const auto& restriction : j["restrictions"]) {
            std::string code = stringAt(restriction, {"code"});
            if (!code.empty()) {
                fd.restrictions.push_back(code);
            }
        }
    }
    fd.sample = j.contains("sample");
    
    return fd;
}

std::string TrackJob::trackId() const {
    if (trackMeta.contains("id")) {
        return idToString(trackMeta["id"]);
    }
    return file.trackId;
}

const json* findPath(const json& j, std::initializer_list<const char*> path) {
    const json* current = &j;
    for (const char* key : path) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(key);
        if (it == current->end() || it->is_null()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

std::string stringAt(const json& j, std::initializer_list<const char*> path,
                     const std::string& fallback) {
    const json* node = findPath(j, path);
    if (!node) {
        return fallback;
    }
    if (node->is_string()) {
        return node->get<std::string>();
    }
    if (node->is_number()) {
        return idToString(*node);
    }
    return fallback;
}

std::int64_t integerAt(const json& j, std::initializer_list<const char*> path,
                       std::int64_t fallback) {
    const json* node = findPath(j, path);
    if (!node) {
        return fallback;
    }
    if (node->is_number_integer()) {
        return node->get<std::int64_t>();
    }
    if (node->is_number()) {
        return static_cast<std::int64_t>(std::llround(node->get<double>()));
    }
    if (node->is_string()) {
        try {
            return std::stoll(node->get<std::string>());
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

std::string idToString(const json& value) {
    if (value.is_null()) {
        return "";
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<std::int64_t>());
    }
    return value.dump();
}

std::string composeTitle(const json& item) {
    std::string title = stringAt(item, {"title"}, "Unknown Title");
    std::string version = stringAt(item, {"version"});
    if (version.empty()) {
        return title;
    }
    
    if (toLower(title).find(toLower(version)) == std::string::npos) {
        title += " (" + version + ")";
    }
    return title;
}

const json& effectiveAlbumMeta(const json& albumOrTrackMeta) {
    auto it = albumOrTrackMeta.find("album");
    if (it != albumOrTrackMeta.end() && it->is_object()) {
        return *it;
    }
    return albumOrTrackMeta;
}

} // namespace QobuzDL
