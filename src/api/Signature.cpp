#include "api/Signature.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace QobuzDL {

std::string md5Hex(const std::string& input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    
    if (EVP_Digest(input.data(), input.size(), digest, &digestLen, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }
    
    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digestLen; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

std::string signFileUrlRequest(int formatId,
                               const std::string& trackId,
                               std::int64_t unixTimestamp,
                               const std::string& secret) {
    std::string payload = "trackgetFileUrlformat_id" + std::to_string(formatId) +
                          "intentstreamtrack_id" + trackId +
                          std::to_string(unixTimestamp) + secret;
    return md5Hex(payload);
}

} // namespace QobuzDL
