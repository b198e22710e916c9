#include "core/DiscographyFilter.hpp"
#include <gtest/gtest.h>

using namespace QobuzDL;

namespace {

json album(const std::string& id, const std::string& title, int bitDepth, double rate,
           const std::string& artist = "Band", const std::string& version = "") {
    json j = {
        {"id", id},
        {"title", title},
        {"maximum_bit_depth", bitDepth},
        {"maximum_sampling_rate", rate},
        {"artist", {{"name", artist}}}
    };
    if (!version.empty()) {
        j["version"] = version;
    }
    return j;
}

std::vector<std::string> ids(const std::vector<json>& albums) {
    std::vector<std::string> result;
    for (const auto& a : albums) {
        result.push_back(a["id"].get<std::string>());
    }
    return result;
}

} // namespace

TEST(DiscographyFilterTest, DeluxeLosesToHigherResolutionOriginal) {
    DiscographyFilter filter({false, true});
    auto result = filter.apply({
        album("x", "X", 24, 96.0),
        album("xd", "X (Deluxe)", 16, 44.1)
    }, "Band");
    
    EXPECT_EQ(ids(result), std::vector<std::string>{"x"});
}

TEST(DiscographyFilterTest, GroupsByBaseTitleInFirstSeenOrder) {
    DiscographyFilter filter({false, false});
    auto result = filter.apply({
        album("b1", "Second", 16, 44.1),
        album("a1", "First [2011]", 16, 44.1),
        album("b2", "Second (Live)", 24, 192.0),
        album("a2", "first", 16, 44.1)
    }, "Band");
    
    EXPECT_EQ(ids(result), (std::vector<std::string>{"b2", "a1"}));
}

TEST(DiscographyFilterTest, SaveSpacePrefersLowestRateAtBestDepth) {
    auto albums = std::vector<json>{
        album("hi", "Y", 24, 192.0),
        album("lo", "Y [96k]", 24, 96.0),
        album("cd", "Y", 16, 44.1)
    };
    
    EXPECT_EQ(ids(DiscographyFilter({true, false}).apply(albums, "Band")),
              std::vector<std::string>{"lo"});
    EXPECT_EQ(ids(DiscographyFilter({false, false}).apply(albums, "Band")),
              std::vector<std::string>{"hi"});
}

TEST(DiscographyFilterTest, RemasterWinsWhenPresent) {
    DiscographyFilter filter({false, false});
    auto result = filter.apply({
        album("orig", "Z", 24, 96.0),
        album("rm", "Z", 24, 96.0, "Band", "2015 Remastered")
    }, "Band");
    
    EXPECT_EQ(ids(result), std::vector<std::string>{"rm"});
}

TEST(DiscographyFilterTest, OtherArtistsAreExcluded) {
    DiscographyFilter filter;
    auto result = filter.apply({
        album("own", "Mine", 16, 44.1, "Band"),
        album("guest", "Theirs", 24, 96.0, "Other Band")
    }, "Band");
    
    EXPECT_EQ(ids(result), std::vector<std::string>{"own"});
}

TEST(DiscographyFilterTest, ArtistDefaultsToFirstAlbum) {
    DiscographyFilter filter;
    auto result = filter.apply({
        album("a", "A", 16, 44.1, "Solo"),
        album("b", "B", 16, 44.1, "Someone Else")
    });
    
    EXPECT_EQ(ids(result), std::vector<std::string>{"a"});
}

TEST(DiscographyFilterTest, TextClassification) {
    EXPECT_EQ(DiscographyFilter::baseTitle(album("1", "  Hello World (Deluxe Edition) [Live]", 16, 44.1)),
              "hello world");
    EXPECT_TRUE(DiscographyFilter::isRemaster(album("1", "Album (Remastered)", 16, 44.1)));
    EXPECT_TRUE(DiscographyFilter::isRemaster(album("1", "Album", 16, 44.1, "Band", "2009 Remaster")));
    EXPECT_FALSE(DiscographyFilter::isRemaster(album("1", "Album", 16, 44.1)));
    EXPECT_TRUE(DiscographyFilter::isExtra(album("1", "Album (Collector's Edition)", 16, 44.1)));
    EXPECT_TRUE(DiscographyFilter::isExtra(album("1", "Album", 16, 44.1, "Band", "Acoustic")));
    EXPECT_FALSE(DiscographyFilter::isExtra(album("1", "Album", 16, 44.1)));
}

TEST(DiscographyFilterTest, NonAsciiTitlesGroupTogether) {
    EXPECT_EQ(DiscographyFilter::baseTitle(album("1", "Bj\xC3\xB6rk Live (Deluxe)", 16, 44.1)),
              "bj\xC3\xB6rk live");
    
    DiscographyFilter filter({false, true});
    auto result = filter.apply({
        album("a", "D\xC3\x89J\xC3\x80 VU", 16, 44.1),
        album("b", "D\xC3\x89J\xC3\x80 VU (Remastered)", 24, 96.0)
    }, "Band");
    
    EXPECT_EQ(ids(result), std::vector<std::string>{"b"});
}
