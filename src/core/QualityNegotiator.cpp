#include "core/QualityNegotiator.hpp"

namespace QobuzDL {

std::string formatToString(AudioFormat format) {
    switch (format) {
        case AudioFormat::Mp3: return "MP3";
        case AudioFormat::Flac: return "FLAC";
    }
    return "Unknown";
}

std::string formatExtension(AudioFormat format) {
    switch (format) {
        case AudioFormat::Mp3: return "mp3";
        case AudioFormat::Flac: return "flac";
    }
    return "bin";
}

AudioFormat QualityNegotiator::formatFor(int requestedQuality) {
    return requestedQuality == QUALITY_MP3 ? AudioFormat::Mp3 : AudioFormat::Flac;
}

Negotiation QualityNegotiator::negotiate(int requestedQuality,
                                         const FileDescriptor& descriptor) const {
    // No lower tier to fall back from
    if (requestedQuality == QUALITY_MP3) {
        return {AudioFormat::Mp3, true};
    }
    
    return {AudioFormat::Flac, !descriptor.hasRestriction(DOWNGRADE_CODE)};
}

bool QualityNegotiator::shouldSkip(const Negotiation& negotiation, bool fallbackAllowed) const {
    return !negotiation.qualityMet && !fallbackAllowed;
}

} // namespace QobuzDL
