#pragma once

#include "api/ApiClient.hpp"
#include "core/DiscographyFilter.hpp"
#include "models/Content.hpp"
#include <string>
#include <vector>

namespace QobuzDL {

/**
 * Flattened member list of an artist, label or playlist
 * items are album trees for artists/labels and track trees for playlists
 */
struct CollectionListing {
    ContentRef ref;
    std::string name;
    std::vector<json> items;
    std::size_t pagesFetched = 0;
};

struct ResolverOptions {
    bool smartDiscography = false;
    DiscographyOptions discography;
};

/**
 * Turns source URLs into content references and drains collection listings
 */
class ContentResolver {
public:
    ContentResolver(ApiClient& client, ResolverOptions options = {});
    
    // Throws InvalidUrl when no pattern matches
    static ContentRef parseUrl(const std::string& url);
    
    // Only valid for collection types
    CollectionListing expand(const ContentRef& ref);
    
private:
    ApiClient& client;
    ResolverOptions options;
    
    PageCursor cursorFor(const ContentRef& ref);
    static const char* itemKeyFor(ContentType type);
};

} // namespace QobuzDL
