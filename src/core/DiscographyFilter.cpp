#include "core/DiscographyFilter.hpp"
#include "models/Content.hpp"
#include "utils/FileUtils.hpp"
#include <algorithm>
#include <map>
#include <regex>

namespace QobuzDL {

static const std::regex REMASTER_PATTERN(R"((re)?master(ed)?)", std::regex::icase);
static const std::regex EXTRA_PATTERN(
    R"((anniversary|deluxe|live|collector|demo|expanded|remix|acoustic|instrumental))",
    std::regex::icase);

static std::string releaseText(const json& album) {
    return stringAt(album, {"title"}) + " " + stringAt(album, {"version"});
}

static double numberAt(const json& album, const char* key) {
    const json* node = findPath(album, {key});
    return node && node->is_number() ? node->get<double>() : 0.0;
}

DiscographyFilter::DiscographyFilter(DiscographyOptions options)
    : options(options) {
}

std::string DiscographyFilter::baseTitle(const json& album) {
    std::string title = stringAt(album, {"title"});
    
    // Everything before the first parenthetical or bracketed suffix
    std::string base = title.substr(0, title.find_first_of("(["));
    base.erase(0, base.find_first_not_of(" \t"));
    base.erase(base.find_last_not_of(" \t") + 1);
    if (base.empty()) {
        base = title;
    }
    
    return toLower(base);
}

bool DiscographyFilter::isRemaster(const json& album) {
    return std::regex_search(releaseText(album), REMASTER_PATTERN);
}

bool DiscographyFilter::isExtra(const json& album) {
    return std::regex_search(releaseText(album), EXTRA_PATTERN);
}

std::vector<json> DiscographyFilter::apply(const std::vector<json>& albums,
                                           const std::string& requestedArtist) const {
    if (albums.empty()) {
        return {};
    }
    
    std::string artist = requestedArtist.empty()
        ? stringAt(albums.front(), {"artist", "name"})
        : requestedArtist;
    
    // Group by base title, keeping first-seen order
    std::vector<std::string> order;
    std::map<std::string, std::vector<const json*>> groups;
    for (const auto& album : albums) {
        // Guest appearances and compilations credited to someone else
        if (stringAt(album, {"artist", "name"}) != artist) {
            continue;
        }
        std::string key = baseTitle(album);
        auto& group = groups[key];
        if (group.empty()) {
            order.push_back(key);
        }
        group.push_back(&album);
    }
    
    std::vector<json> result;
    for (const auto& key : order) {
        const auto& group = groups[key];
        
        double bestBitDepth = 0.0;
        for (const json* album : group) {
            bestBitDepth = std::max(bestBitDepth, numberAt(*album, "maximum_bit_depth"));
        }
        
        bool haveRate = false;
        double bestRate = 0.0;
        for (const json* album : group) {
            if (numberAt(*album, "maximum_bit_depth") != bestBitDepth) {
                continue;
            }
            double rate = numberAt(*album, "maximum_sampling_rate");
            if (!haveRate) {
                bestRate = rate;
                haveRate = true;
            } else {
                bestRate = options.saveSpace ? std::min(bestRate, rate) : std::max(bestRate, rate);
            }
        }
        
        bool remasterExists = std::any_of(group.begin(), group.end(),
                                          [](const json* album) { return isRemaster(*album); });
        
        for (const json* album : group) {
            if (numberAt(*album, "maximum_bit_depth") != bestBitDepth) continue;
            if (numberAt(*album, "maximum_sampling_rate") != bestRate) continue;
            if (remasterExists && !isRemaster(*album)) continue;
            if (options.skipExtras && isExtra(*album)) continue;
            
            // Remaining candidates are assumed identical
            result.push_back(*album);
            break;
        }
    }
    
    return result;
}

} // namespace QobuzDL
