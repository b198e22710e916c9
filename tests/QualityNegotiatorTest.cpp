#include "core/QualityNegotiator.hpp"
#include <gtest/gtest.h>

using namespace QobuzDL;

namespace {

FileDescriptor descriptor(bool restricted) {
    FileDescriptor fd;
    fd.trackId = "1";
    fd.url = "https://cdn/1";
    fd.samplingRate = 44.1;
    fd.bitDepth = 16;
    if (restricted) {
        fd.restrictions.push_back(QualityNegotiator::DOWNGRADE_CODE);
    }
    return fd;
}

} // namespace

TEST(QualityNegotiatorTest, RestrictedWithoutFallbackIsSkipped) {
    QualityNegotiator negotiator;
    Negotiation n = negotiator.negotiate(6, descriptor(true));
    
    EXPECT_EQ(n.format, AudioFormat::Flac);
    EXPECT_FALSE(n.qualityMet);
    EXPECT_TRUE(negotiator.shouldSkip(n, false));
}

TEST(QualityNegotiatorTest, RestrictedWithFallbackUsesReturnedDescriptor) {
    QualityNegotiator negotiator;
    FileDescriptor fd = descriptor(true);
    Negotiation n = negotiator.negotiate(6, fd);
    
    EXPECT_FALSE(n.qualityMet);
    EXPECT_FALSE(negotiator.shouldSkip(n, true));
    EXPECT_EQ(fd.restrictions.size(), 1u);
}

TEST(QualityNegotiatorTest, Mp3IsAlwaysAccepted) {
    QualityNegotiator negotiator;
    for (bool restricted : {false, true}) {
        Negotiation n = negotiator.negotiate(5, descriptor(restricted));
        EXPECT_EQ(n.format, AudioFormat::Mp3);
        EXPECT_TRUE(n.qualityMet);
        EXPECT_FALSE(negotiator.shouldSkip(n, false));
    }
}

TEST(QualityNegotiatorTest, UnrelatedRestrictionsDoNotCount) {
    QualityNegotiator negotiator;
    FileDescriptor fd = descriptor(false);
    fd.restrictions.push_back("UserUncredentialed");
    
    Negotiation n = negotiator.negotiate(27, fd);
    EXPECT_TRUE(n.qualityMet);
}

TEST(QualityNegotiatorTest, FormatFromQuality) {
    EXPECT_EQ(QualityNegotiator::formatFor(5), AudioFormat::Mp3);
    EXPECT_EQ(QualityNegotiator::formatFor(7), AudioFormat::Flac);
    EXPECT_EQ(formatExtension(AudioFormat::Mp3), "mp3");
    EXPECT_EQ(formatExtension(AudioFormat::Flac), "flac");
}
