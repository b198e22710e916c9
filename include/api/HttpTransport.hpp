#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <functional>

namespace QobuzDL {

using Parameters = std::vector<std::pair<std::string, std::string>>;
using Headers = std::map<std::string, std::string>;

/**
 * Response of a single HTTP exchange
 * statusCode is 0 when the request never got an answer (DNS, TLS, timeout...)
 */
struct HttpResponse {
    long statusCode = 0;
    std::string text;
    std::string error;
    bool aborted = false;
    
    bool ok() const { return statusCode >= 200 && statusCode < 300 && error.empty(); }
};

/**
 * Called with the number of new bytes written during a download
 */
using ChunkCallback = std::function<void(std::uint64_t)>;

/**
 * Polled while a download runs; returning true aborts the transfer
 */
using StopCheck = std::function<bool()>;

/**
 * Blocking HTTP transport used by the API client and the materializer
 * Implementations must be safe to call from several worker threads at once
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    
    // GET with query parameters and extra headers
    virtual HttpResponse get(const std::string& url,
                             const Parameters& params,
                             const Headers& headers) = 0;
    
    // HEAD request, returns Content-Length or 0 when unknown
    virtual std::uint64_t contentLength(const std::string& url) = 0;
    
    // Stream the body of url into destination
    // An aborted transfer sets aborted and leaves the partial file in place
    virtual HttpResponse download(const std::string& url,
                                  const std::string& destination,
                                  const ChunkCallback& onChunk,
                                  const StopCheck& shouldStop) = 0;
};

} // namespace QobuzDL
