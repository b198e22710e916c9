#pragma once

#include "api/HttpTransport.hpp"

namespace QobuzDL {

/**
 * HttpTransport backed by cpr (libcurl)
 */
class CprTransport : public HttpTransport {
public:
    explicit CprTransport(int requestTimeoutMs = 30000);
    
    HttpResponse get(const std::string& url,
                     const Parameters& params,
                     const Headers& headers) override;
    
    std::uint64_t contentLength(const std::string& url) override;
    
    HttpResponse download(const std::string& url,
                          const std::string& destination,
                          const ChunkCallback& onChunk,
                          const StopCheck& shouldStop) override;
    
private:
    int timeoutMs;
};

} // namespace QobuzDL
