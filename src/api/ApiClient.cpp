#include "api/ApiClient.hpp"
#include "api/Errors.hpp"
#include "api/Signature.hpp"
#include "models/Content.hpp"
#include "utils/Logger.hpp"
#include <chrono>

namespace QobuzDL {

static const char* USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:83.0) Gecko/20100101 Firefox/83.0";

// ---------------------------------------------------------------------------
// PageCursor
// ---------------------------------------------------------------------------

PageCursor::PageCursor(ApiClient& client,
                       std::string endpoint,
                       std::string itemKey,
                       std::string countKey,
                       Parameters params)
    : client(client)
    , endpoint(std::move(endpoint))
    , itemKey(std::move(itemKey))
    , countKey(std::move(countKey))
    , params(std::move(params))
    , offset(0)
    , done(false) {
}

std::optional<json> PageCursor::next() {
    if (done) {
        return std::nullopt;
    }
    
    Parameters pageParams = params;
    pageParams.emplace_back("offset", std::to_string(offset));
    pageParams.emplace_back("limit", std::to_string(PAGE_LIMIT));
    
    json page = client.call(endpoint, pageParams);
    
    // Declared total: top-level count key, else the nested page total
    std::int64_t total = integerAt(page, {countKey.c_str()}, -1);
    if (total < 0) {
        total = integerAt(page, {itemKey.c_str(), "total"}, 0);
    }
    
    std::size_t itemsInPage = 0;
    if (const json* items = findPath(page, {itemKey.c_str(), "items"})) {
        if (items->is_array()) {
            itemsInPage = items->size();
        }
    }
    
    if (itemsInPage == 0 || offset + static_cast<std::int64_t>(itemsInPage) >= total) {
        done = true;
    } else {
        offset += static_cast<int>(itemsInPage);
    }
    
    return page;
}

void PageCursor::reset() {
    offset = 0;
    done = false;
}

// ---------------------------------------------------------------------------
// ApiClient
// ---------------------------------------------------------------------------

ApiClient::ApiClient(Session& session, HttpTransport& transport, std::string baseUrl)
    : session(session)
    , transport(transport)
    , baseUrl(std::move(baseUrl)) {
}

json ApiClient::call(const std::string& endpoint, const Parameters& params) {
    return execute(endpoint, params);
}

json ApiClient::execute(const std::string& endpoint, Parameters params) {
    if (session.isClosed()) {
        throw QobuzError("API session is closed");
    }
    
    // The user auth token is added to every call after login
    if (auto token = session.getUserAuthToken()) {
        params.emplace_back("user_auth_token", *token);
    }
    
    Headers headers{
        {"User-Agent", USER_AGENT},
        {"X-App-Id", session.getAppId()}
    };
    
    LOG_API_DEBUG("GET {}", endpoint);
    HttpResponse response = transport.get(baseUrl + endpoint, params, headers);
    
    if (response.statusCode == 0) {
        throw RemoteError(endpoint + ": " + 
                          (response.error.empty() ? "no response" : response.error));
    }
    
    if (endpoint == "user/login") {
        if (response.statusCode == 401) {
            throw AuthenticationError("Invalid email or password.");
        }
        if (response.statusCode == 400) {
            throw InvalidAppIdError("Invalid App ID.");
        }
    } else if (endpoint == "track/getFileUrl" && response.statusCode == 400) {
        throw InvalidAppSecretError("The app secret is invalid or has expired.");
    }
    
    if (response.statusCode < 200 || response.statusCode >= 300) {
        std::string message = endpoint + " returned HTTP " + std::to_string(response.statusCode);
        try {
            json body = json::parse(response.text);
            if (body.contains("message") && body["message"].is_string()) {
                message += ": " + body["message"].get<std::string>();
            }
        } catch (const json::exception&) {
            // Error body is not JSON; the status is enough
        }
        throw RemoteError(message, response.statusCode);
    }
    
    try {
        return json::parse(response.text);
    } catch (const json::exception& e) {
        throw RemoteError(endpoint + " returned invalid JSON: " + e.what(), response.statusCode);
    }
}

void ApiClient::checkEligible(const json& user) {
    const json* parameters = findPath(user, {"credential", "parameters"});
    if (!parameters || parameters->empty()) {
        throw IneligibleError("This account is not eligible for streaming.");
    }
}

void ApiClient::authenticate(const std::string& email, const std::string& passwordMd5) {
    LOG_API_INFO("Logging in with email/password...");
    
    json info = call("user/login", {
        {"email", email},
        {"password", passwordMd5},
        {"app_id", session.getAppId()}
    });
    
    checkEligible(info.value("user", json::object()));
    
    std::string token = stringAt(info, {"user_auth_token"});
    if (token.empty()) {
        throw AuthenticationError("Login response did not contain a user auth token.");
    }
    session.setUserAuthToken(token);
    
    LOG_API_INFO("Membership: {}",
                 stringAt(info, {"user", "credential", "parameters", "short_label"}, "unknown"));
}

void ApiClient::authenticateWithToken(const std::string& token) {
    LOG_API_INFO("Logging in with authentication token...");
    session.setUserAuthToken(token);
    
    json info;
    try {
        info = getUserInfo();
    } catch (const RemoteError& e) {
        if (e.getStatusCode() == 401) {
            throw AuthenticationError("The provided token is invalid or has expired.");
        }
        throw;
    }
    
    checkEligible(info);
    LOG_API_INFO("Successfully authenticated as {}", stringAt(info, {"email"}, "<unknown>"));
}

json ApiClient::getUserInfo() {
    return call("user/get");
}

json ApiClient::getAlbumMeta(const std::string& albumId) {
    return call("album/get", {{"album_id", albumId}});
}

json ApiClient::getTrackMeta(const std::string& trackId) {
    return call("track/get", {{"track_id", trackId}});
}

json ApiClient::searchTracks(const std::string& query, int limit) {
    return call("track/search", {{"query", query}, {"limit", std::to_string(limit)}});
}

void ApiClient::validateQuality(int quality) {
    if (!isValidQuality(quality)) {
        throw InvalidQuality("Invalid quality ID " + std::to_string(quality) +
                             ": choose from 5, 6, 7, or 27.");
    }
}

json ApiClient::getTrackUrl(const std::string& trackId, int quality) {
    validateQuality(quality);
    return requestFileUrl(trackId, quality, ensureSecret());
}

json ApiClient::requestFileUrl(const std::string& trackId, int quality, const std::string& secret) {
    validateQuality(quality);
    
    auto unixTs = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    
    return execute("track/getFileUrl", {
        {"request_ts", std::to_string(unixTs)},
        {"request_sig", signFileUrlRequest(quality, trackId, unixTs, secret)},
        {"track_id", trackId},
        {"format_id", std::to_string(quality)},
        {"intent", "stream"}
    });
}

bool ApiClient::testSecret(const std::string& secret) {
    try {
        requestFileUrl(PROBE_TRACK_ID, QUALITY_MP3, secret);
        return true;
    } catch (const InvalidAppSecretError&) {
        return false;
    } catch (const RemoteError& e) {
        LOG_API_DEBUG("Secret probe failed: {}", e.what());
        return false;
    }
}

std::string ApiClient::ensureSecret() {
    // Concurrent callers wait here instead of probing again
    std::lock_guard<std::mutex> lock(secretMutex);
    
    if (auto secret = session.getValidatedSecret()) {
        return *secret;
    }
    
    for (const auto& secret : session.getSecrets()) {
        if (secret.empty()) {
            continue;
        }
        if (testSecret(secret)) {
            session.setValidatedSecret(secret);
            LOG_API_DEBUG("Found valid app secret: {}...", secret.substr(0, 4));
            return secret;
        }
    }
    
    throw InvalidAppSecretError(
        "None of the provided app secrets are valid. "
        "Re-provision the app credentials and try again.");
}

PageCursor ApiClient::getArtistPages(const std::string& artistId) {
    return PageCursor(*this, "artist/get", "albums", "albums_count",
                      {{"artist_id", artistId}, {"extra", "albums"}});
}

PageCursor ApiClient::getLabelPages(const std::string& labelId) {
    return PageCursor(*this, "label/get", "albums", "albums_count",
                      {{"label_id", labelId}, {"extra", "albums"}});
}

PageCursor ApiClient::getPlaylistPages(const std::string& playlistId) {
    return PageCursor(*this, "playlist/get", "tracks", "tracks_count",
                      {{"playlist_id", playlistId}, {"extra", "tracks"}});
}

} // namespace QobuzDL
