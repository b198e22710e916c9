#include "core/ContentResolver.hpp"
#include "api/Errors.hpp"
#include "utils/Logger.hpp"
#include <regex>

namespace QobuzDL {

// play.qobuz.com / open.qobuz.com / www.qobuz.com/<locale>/<type>/<slug>/<id>
static const std::regex SLUG_URL_PATTERN(
    R"(/(album|artist|track|playlist|label)/[^/]+/([A-Za-z0-9_]+))");

// Simpler <host>/<type>/<id>
static const std::regex SIMPLE_URL_PATTERN(
    R"(/(album|artist|track|playlist|label)/([A-Za-z0-9_]+))");

ContentResolver::ContentResolver(ApiClient& client, ResolverOptions options)
    : client(client)
    , options(options) {
}

ContentRef ContentResolver::parseUrl(const std::string& url) {
    std::smatch matches;
    
    if (std::regex_search(url, matches, SLUG_URL_PATTERN) ||
        std::regex_search(url, matches, SIMPLE_URL_PATTERN)) {
        auto type = stringToContentType(matches[1].str());
        if (type) {
            return ContentRef{*type, matches[2].str()};
        }
    }
    
    throw InvalidUrl("Invalid or unsupported URL: \"" + url + "\"");
}

const char* ContentResolver::itemKeyFor(ContentType type) {
    switch (type) {
        case ContentType::Artist:
        case ContentType::Label:
            return "albums";
        case ContentType::Playlist:
            return "tracks";
        case ContentType::Album:
        case ContentType::Track:
            break;
    }
    return "";
}

PageCursor ContentResolver::cursorFor(const ContentRef& ref) {
    switch (ref.type) {
        case ContentType::Artist: return client.getArtistPages(ref.id);
        case ContentType::Label: return client.getLabelPages(ref.id);
        case ContentType::Playlist: return client.getPlaylistPages(ref.id);
        case ContentType::Album:
        case ContentType::Track:
            break;
    }
    throw QobuzError(contentTypeToString(ref.type) + " references are not collections");
}

CollectionListing ContentResolver::expand(const ContentRef& ref) {
    PageCursor cursor = cursorFor(ref);
    const char* itemKey = itemKeyFor(ref.type);
    
    CollectionListing listing;
    listing.ref = ref;
    
    while (auto page = cursor.next()) {
        ++listing.pagesFetched;
        if (listing.name.empty()) {
            listing.name = stringAt(*page, {"name"});
            if (listing.name.empty()) {
                listing.name = stringAt(*page, {"title"});
            }
        }
        
        const json* items = findPath(*page, {itemKey, "items"});
        if (items && items->is_array()) {
            for (const auto& item : *items) {
                listing.items.push_back(item);
            }
        }
    }
    
    if (listing.name.empty()) {
        listing.name = "Unknown";
    }
    
    LOG_DL_DEBUG("Expanded {} {} into {} items over {} pages",
                 contentTypeToString(ref.type), ref.id, listing.items.size(), listing.pagesFetched);
    
    if (options.smartDiscography && ref.type == ContentType::Artist) {
        DiscographyFilter filter(options.discography);
        std::size_t before = listing.items.size();
        listing.items = filter.apply(listing.items, listing.name);
        LOG_DL_INFO("Smart discography kept {} of {} releases", listing.items.size(), before);
    }
    
    return listing;
}

} // namespace QobuzDL
