#include "api/CprTransport.hpp"
#include "utils/Logger.hpp"
#include <cpr/cpr.h>
#include <fstream>

namespace QobuzDL {

// Size probes should not hold a worker for long
static constexpr int HEAD_TIMEOUT_MS = 10000;

CprTransport::CprTransport(int requestTimeoutMs)
    : timeoutMs(requestTimeoutMs) {
}

HttpResponse CprTransport::get(const std::string& url,
                               const Parameters& params,
                               const Headers& headers) {
    cpr::Parameters parameters;
    for (const auto& [key, value] : params) {
        parameters.Add({key, value});
    }
    
    cpr::Header header;
    for (const auto& [key, value] : headers) {
        header[key] = value;
    }
    
    cpr::Response response = cpr::Get(
        cpr::Url{url},
        parameters,
        header,
        cpr::Timeout{timeoutMs}
    );
    
    HttpResponse result;
    result.statusCode = response.status_code;
    result.text = std::move(response.text);
    if (response.error) {
        result.error = response.error.message;
    }
    return result;
}

std::uint64_t CprTransport::contentLength(const std::string& url) {
    cpr::Response response = cpr::Head(
        cpr::Url{url},
        cpr::Timeout{HEAD_TIMEOUT_MS}
    );
    
    if (response.error || response.status_code < 200 || response.status_code >= 300) {
        LOG_DL_DEBUG("Size probe failed for {}: HTTP {}", url, response.status_code);
        return 0;
    }
    
    auto it = response.header.find("Content-Length");
    if (it == response.header.end()) {
        return 0;
    }
    
    try {
        return std::stoull(it->second);
    } catch (const std::exception&) {
        return 0;
    }
}

HttpResponse CprTransport::download(const std::string& url,
                                    const std::string& destination,
                                    const ChunkCallback& onChunk,
                                    const StopCheck& shouldStop) {
    HttpResponse result;
    
    std::ofstream file(destination, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        result.error = "cannot open " + destination + " for writing";
        return result;
    }
    
    std::uint64_t reported = 0;
    bool stopped = false;
    cpr::Response response = cpr::Download(
        file,
        cpr::Url{url},
        cpr::ProgressCallback{[&](cpr::cpr_off_t, cpr::cpr_off_t downloadNow,
                                  cpr::cpr_off_t, cpr::cpr_off_t, intptr_t) -> bool {
            auto now = static_cast<std::uint64_t>(downloadNow);
            if (onChunk && now > reported) {
                onChunk(now - reported);
                reported = now;
            }
            // libcurl aborts the transfer when this returns false
            stopped = shouldStop && shouldStop();
            return !stopped;
        }}
    );
    file.close();
    
    result.statusCode = response.status_code;
    if (stopped) {
        result.aborted = true;
        result.error = "aborted";
    } else if (response.error) {
        result.error = response.error.message;
    } else if (!file) {
        result.error = "write error on " + destination;
    } else if (response.status_code >= 400) {
        result.error = "HTTP " + std::to_string(response.status_code);
    }
    return result;
}

} // namespace QobuzDL
