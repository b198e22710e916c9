#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace QobuzDL {

using json = nlohmann::json;

struct DiscographyOptions {
    bool saveSpace = false;     // prefer the lowest sampling rate at the best bit depth
    bool skipExtras = false;    // drop deluxe, live, demo, remix... editions
};

/**
 * Picks one release per base title out of an artist's album list
 */
class DiscographyFilter {
public:
    explicit DiscographyFilter(DiscographyOptions options = {});
    
    // requestedArtist empty = take the artist of the first album
    std::vector<json> apply(const std::vector<json>& albums,
                            const std::string& requestedArtist = "") const;
    
    // "Album (Deluxe) [2011]" -> "album"
    static std::string baseTitle(const json& album);
    static bool isRemaster(const json& album);
    static bool isExtra(const json& album);
    
private:
    DiscographyOptions options;
};

} // namespace QobuzDL
