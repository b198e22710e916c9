#pragma once

#include "api/HttpTransport.hpp"
#include "api/Session.hpp"
#include <string>
#include <optional>
#include <mutex>
#include <nlohmann/json.hpp>

namespace QobuzDL {

using json = nlohmann::json;

class ApiClient;

/**
 * Lazy sequence over a paginated listing endpoint
 * Each next() issues one request; reset() starts over from offset 0
 */
class PageCursor {
public:
    static constexpr int PAGE_LIMIT = 500;
    
    PageCursor(ApiClient& client,
               std::string endpoint,
               std::string itemKey,
               std::string countKey,
               Parameters params);
    
    // Next page, or nullopt once the declared total was reached or a page came back empty
    std::optional<json> next();
    
    void reset();
    bool isDone() const { return done; }
    int getOffset() const { return offset; }
    
private:
    ApiClient& client;
    std::string endpoint;
    std::string itemKey;
    std::string countKey;
    Parameters params;
    int offset;
    bool done;
};

/**
 * Client for the private JSON API (v0.2)
 * Owns request building and signing; all state lives in the Session
 */
class ApiClient {
public:
    static constexpr const char* BASE_URL = "https://www.qobuz.com/api.json/0.2/";
    
    // Probe used to check candidate app secrets
    static constexpr const char* PROBE_TRACK_ID = "5966783";
    
    ApiClient(Session& session, HttpTransport& transport,
              std::string baseUrl = BASE_URL);
    
    // Prevent copying
    ApiClient(const ApiClient&) = delete;
    ApiClient& operator=(const ApiClient&) = delete;
    
    // Generic authenticated GET
    json call(const std::string& endpoint, const Parameters& params = {});
    
    // Authentication
    void authenticate(const std::string& email, const std::string& passwordMd5);
    void authenticateWithToken(const std::string& token);
    
    // Metadata
    json getUserInfo();
    json getAlbumMeta(const std::string& albumId);
    json getTrackMeta(const std::string& trackId);
    json searchTracks(const std::string& query, int limit = 50);
    
    // Signed stream resolution
    json getTrackUrl(const std::string& trackId, int quality);
    
    // Paginated listings
    PageCursor getArtistPages(const std::string& artistId);
    PageCursor getLabelPages(const std::string& labelId);
    PageCursor getPlaylistPages(const std::string& playlistId);
    
    // Secret validation (single flight, memoized in the Session)
    std::string ensureSecret();
    bool testSecret(const std::string& secret);
    
    static void validateQuality(int quality);
    
    Session& getSession() { return session; }
    
private:
    Session& session;
    HttpTransport& transport;
    std::string baseUrl;
    std::mutex secretMutex;
    
    json requestFileUrl(const std::string& trackId, int quality, const std::string& secret);
    json execute(const std::string& endpoint, Parameters params);
    static void checkEligible(const json& user);
};

} // namespace QobuzDL
