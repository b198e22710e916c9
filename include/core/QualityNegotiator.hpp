#pragma once

#include "models/Content.hpp"
#include <string>

namespace QobuzDL {

/**
 * Container of the downloaded stream
 */
enum class AudioFormat {
    Mp3,
    Flac
};

std::string formatToString(AudioFormat format);

// File extension without the dot
std::string formatExtension(AudioFormat format);

/**
 * Result of checking a returned stream against the requested tier
 */
struct Negotiation {
    AudioFormat format;
    bool qualityMet;
};

/**
 * Classifies file descriptors; never modifies them
 */
class QualityNegotiator {
public:
    // Restriction code meaning the server served a lower tier than asked for
    static constexpr const char* DOWNGRADE_CODE = "FormatRestrictedByFormatAvailability";
    
    static AudioFormat formatFor(int requestedQuality);
    
    Negotiation negotiate(int requestedQuality, const FileDescriptor& descriptor) const;
    
    // True when the item must be dropped instead of downloaded at a lower tier
    bool shouldSkip(const Negotiation& negotiation, bool fallbackAllowed) const;
};

} // namespace QobuzDL
