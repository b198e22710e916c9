#pragma once

#include <string>
#include <cstdint>

namespace QobuzDL {

/**
 * Lowercase hex MD5 of input
 */
std::string md5Hex(const std::string& input);

/**
 * Signature for track/getFileUrl:
 * md5("trackgetFileUrlformat_id" + fmt + "intentstreamtrack_id" + trackId + ts + secret)
 */
std::string signFileUrlRequest(int formatId,
                               const std::string& trackId,
                               std::int64_t unixTimestamp,
                               const std::string& secret);

} // namespace QobuzDL
