#include "api/ApiClient.hpp"
#include "api/Errors.hpp"
#include "api/Signature.hpp"
#include "support/FakeTransport.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <thread>

using namespace QobuzDL;
using QobuzDL::Testing::FakeTransport;

namespace {

const char* ELIGIBLE_USER = R"({
    "email": "someone@example.com",
    "credential": {"parameters": {"short_label": "Studio", "lossless_streaming": true}}
})";

class ApiClientTest : public ::testing::Test {
protected:
    FakeTransport transport;
    
    static AppCredentials credentials(std::vector<std::string> secrets) {
        return AppCredentials{"123456789", std::move(secrets)};
    }
    
    // Accepts only requests signed with goodSecret
    void acceptSecret(const std::string& goodSecret) {
        transport.route("track/getFileUrl", [goodSecret](const Parameters& params) {
            FakeTransport::Request request{"", params, {}};
            std::string expected = signFileUrlRequest(
                std::stoi(request.param("format_id")),
                request.param("track_id"),
                std::stoll(request.param("request_ts")),
                goodSecret);
            if (request.param("request_sig") != expected) {
                return FakeTransport::respond(R"({"message":"Invalid Request Signature parameter"})", 400);
            }
            return FakeTransport::respond(
                R"({"track_id": )" + request.param("track_id") +
                R"(, "url": "https://cdn/x", "sampling_rate": 44.1, "bit_depth": 16})");
        });
    }
    
    std::vector<std::string> signaturesSentWith(const std::string& secret) {
        std::vector<std::string> matches;
        for (const auto& request : transport.getRequests()) {
            if (request.param("request_sig").empty()) {
                continue;
            }
            std::string signedWith = signFileUrlRequest(
                std::stoi(request.param("format_id")),
                request.param("track_id"),
                std::stoll(request.param("request_ts")),
                secret);
            if (signedWith == request.param("request_sig")) {
                matches.push_back(request.param("track_id"));
            }
        }
        return matches;
    }
};

} // namespace

TEST_F(ApiClientTest, SecretTrialCachesFirstValidSecret) {
    Session session(credentials({"bad", "bad", "good", "good2"}));
    ApiClient client(session, transport);
    acceptSecret("good");
    
    json first = client.getTrackUrl("1001", 6);
    json second = client.getTrackUrl("1002", 6);
    
    EXPECT_EQ(first["url"], "https://cdn/x");
    EXPECT_EQ(second["track_id"], 1002);
    ASSERT_TRUE(session.getValidatedSecret().has_value());
    EXPECT_EQ(*session.getValidatedSecret(), "good");
    
    // bad, bad, good probes plus the two real requests
    EXPECT_EQ(transport.countRequests("track/getFileUrl"), 5u);
    EXPECT_TRUE(signaturesSentWith("good2").empty());
}

TEST_F(ApiClientTest, SecretProbeUsesFixedTrackAndMp3Quality) {
    Session session(credentials({"good"}));
    ApiClient client(session, transport);
    acceptSecret("good");
    
    client.ensureSecret();
    
    auto requests = transport.getRequests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].param("track_id"), ApiClient::PROBE_TRACK_ID);
    EXPECT_EQ(requests[0].param("format_id"), "5");
    EXPECT_EQ(requests[0].param("intent"), "stream");
}

TEST_F(ApiClientTest, ConcurrentCallersProbeOnce) {
    Session session(credentials({"bad", "good"}));
    ApiClient client(session, transport);
    acceptSecret("good");
    
    std::vector<std::thread> threads;
    std::vector<std::string> results(4);
    for (std::size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&client, &results, i]() { results[i] = client.ensureSecret(); });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    
    for (const auto& secret : results) {
        EXPECT_EQ(secret, "good");
    }
    EXPECT_EQ(transport.countRequests("track/getFileUrl"), 2u);
}

TEST_F(ApiClientTest, NoValidSecretIsFatal) {
    Session session(credentials({"bad", "", "worse"}));
    ApiClient client(session, transport);
    acceptSecret("good");
    
    EXPECT_THROW(client.getTrackUrl("1", 6), InvalidAppSecretError);
    EXPECT_FALSE(session.getValidatedSecret().has_value());
    EXPECT_EQ(transport.countRequests("track/getFileUrl"), 2u);
}

TEST_F(ApiClientTest, InvalidQualityRejectedBeforeAnyRequest) {
    Session session(credentials({"good"}));
    ApiClient client(session, transport);
    acceptSecret("good");
    
    EXPECT_THROW(client.getTrackUrl("1", 4), InvalidQuality);
    EXPECT_THROW(client.getTrackUrl("1", 28), InvalidQuality);
    EXPECT_TRUE(transport.getRequests().empty());
    
    EXPECT_NO_THROW(ApiClient::validateQuality(5));
    EXPECT_NO_THROW(ApiClient::validateQuality(27));
}

TEST_F(ApiClientTest, LoginStoresTokenAndSendsItAfterwards) {
    Session session(credentials({"good"}));
    ApiClient client(session, transport);
    
    transport.route("user/login", [](const Parameters&) {
        return FakeTransport::respond(std::string(R"({"user_auth_token": "tok-1", "user": )") +
                                      ELIGIBLE_USER + "}");
    });
    transport.route("album/get", [](const Parameters&) {
        return FakeTransport::respond(R"({"id": "abc", "title": "X"})");
    });
    
    client.authenticate("someone@example.com", md5Hex("hunter2"));
    EXPECT_TRUE(session.isAuthenticated());
    EXPECT_EQ(*session.getUserAuthToken(), "tok-1");
    
    client.getAlbumMeta("abc");
    
    auto requests = transport.getRequests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].param("password"), md5Hex("hunter2"));
    EXPECT_EQ(requests[0].headers.at("X-App-Id"), "123456789");
    EXPECT_EQ(requests[1].param("album_id"), "abc");
    EXPECT_EQ(requests[1].param("user_auth_token"), "tok-1");
    EXPECT_EQ(requests[1].headers.at("X-App-Id"), "123456789");
}

TEST_F(ApiClientTest, LoginStatusMapping) {
    Session session(credentials({"good"}));
    ApiClient client(session, transport);
    
    transport.route("user/login", [](const Parameters&) {
        return FakeTransport::respond(R"({"message": "nope"})", 401);
    });
    EXPECT_THROW(client.authenticate("a@b.c", "x"), AuthenticationError);
    
    transport.route("user/login", [](const Parameters&) {
        return FakeTransport::respond(R"({"message": "bad app"})", 400);
    });
    EXPECT_THROW(client.authenticate("a@b.c", "x"), InvalidAppIdError);
    EXPECT_FALSE(session.isAuthenticated());
}

TEST_F(ApiClientTest, IneligibleAccountRejected) {
    Session session(credentials({"good"}));
    ApiClient client(session, transport);
    
    transport.route("user/login", [](const Parameters&) {
        return FakeTransport::respond(
            R"({"user_auth_token": "tok", "user": {"credential": {"parameters": null}}})");
    });
    EXPECT_THROW(client.authenticate("a@b.c", "x"), IneligibleError);
    
    transport.route("user/get", [](const Parameters&) {
        return FakeTransport::respond(R"({"credential": {}})");
    });
    EXPECT_THROW(client.authenticateWithToken("tok"), IneligibleError);
}

TEST_F(ApiClientTest, TokenLoginVerifiesWithUserGet) {
    Session session(credentials({"good"}));
    ApiClient client(session, transport);
    
    transport.route("user/get", [](const Parameters& params) {
        FakeTransport::Request request{"", params, {}};
        if (request.param("user_auth_token") != "valid") {
            return FakeTransport::respond(R"({"message": "expired"})", 401);
        }
        return FakeTransport::respond(ELIGIBLE_USER);
    });
    
    EXPECT_THROW(client.authenticateWithToken("expired"), AuthenticationError);
    EXPECT_NO_THROW(client.authenticateWithToken("valid"));
    EXPECT_EQ(*session.getUserAuthToken(), "valid");
}

TEST_F(ApiClientTest, HttpErrorsBecomeRemoteError) {
    Session session(credentials({"good"}));
    ApiClient client(session, transport);
    
    transport.route("album/get", [](const Parameters&) {
        return FakeTransport::respond(R"({"message": "No result matching given argument"})", 404);
    });
    transport.route("track/get", [](const Parameters&) {
        return FakeTransport::respond("<html>", 200);
    });
    
    try {
        client.getAlbumMeta("missing");
        FAIL() << "expected RemoteError";
    } catch (const RemoteError& e) {
        EXPECT_EQ(e.getStatusCode(), 404);
        EXPECT_NE(std::string(e.what()).find("No result"), std::string::npos);
    }
    
    EXPECT_THROW(client.getTrackMeta("1"), RemoteError);
}

TEST_F(ApiClientTest, ClosedSessionRefusesCalls) {
    Session session(credentials({"good"}));
    ApiClient client(session, transport);
    session.close();
    
    EXPECT_THROW(client.getAlbumMeta("abc"), QobuzError);
    EXPECT_TRUE(transport.getRequests().empty());
}

TEST_F(ApiClientTest, PaginationFollowsDeclaredTotal) {
    Session session(credentials({"good"}));
    ApiClient client(session, transport);
    
    transport.route("playlist/get", [](const Parameters& params) {
        FakeTransport::Request request{"", params, {}};
        int offset = std::stoi(request.param("offset"));
        int count = std::min(500, 1200 - offset);
        json items = json::array();
        for (int i = 0; i < count; ++i) {
            items.push_back({{"id", offset + i}});
        }
        json page = {{"name", "Big"}, {"tracks_count", 1200},
                     {"tracks", {{"total", 1200}, {"items", items}}}};
        return FakeTransport::respond(page.dump());
    });
    
    PageCursor cursor = client.getPlaylistPages("p1");
    std::size_t items = 0;
    int pages = 0;
    while (auto page = cursor.next()) {
        items += (*page)["tracks"]["items"].size();
        ++pages;
    }
    
    EXPECT_EQ(pages, 3);
    EXPECT_EQ(items, 1200u);
    EXPECT_TRUE(cursor.isDone());
    
    auto requests = transport.getRequests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[0].param("offset"), "0");
    EXPECT_EQ(requests[1].param("offset"), "500");
    EXPECT_EQ(requests[2].param("offset"), "1000");
    EXPECT_EQ(requests[0].param("limit"), "500");
    EXPECT_EQ(requests[0].param("extra"), "tracks");
    
    // Restartable from the first page
    cursor.reset();
    ASSERT_TRUE(cursor.next().has_value());
    EXPECT_EQ(transport.getRequests().back().param("offset"), "0");
}

TEST_F(ApiClientTest, PaginationStopsOnEmptyPage) {
    Session session(credentials({"good"}));
    ApiClient client(session, transport);
    
    // Declares more than it delivers
    transport.route("artist/get", [](const Parameters& params) {
        FakeTransport::Request request{"", params, {}};
        json items = json::array();
        if (request.param("offset") == "0") {
            items.push_back({{"id", "a1"}});
            items.push_back({{"id", "a2"}});
        }
        json page = {{"name", "Someone"}, {"albums_count", 10},
                     {"albums", {{"total", 10}, {"items", items}}}};
        return FakeTransport::respond(page.dump());
    });
    
    PageCursor cursor = client.getArtistPages("42");
    int pages = 0;
    while (cursor.next()) {
        ++pages;
    }
    
    EXPECT_EQ(pages, 2);
    EXPECT_EQ(transport.getRequests()[1].param("offset"), "2");
}
