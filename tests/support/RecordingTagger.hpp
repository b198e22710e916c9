#pragma once

#include "core/Tagger.hpp"
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace QobuzDL {
namespace Testing {

/**
 * Tagger that records its calls and can be told to fail
 */
class RecordingTagger : public Tagger {
public:
    struct Call {
        std::string path;
        std::string trackId;
        bool isTrack;
        bool embedArt;
        bool fileExisted;
    };
    
    bool failNext = false;
    
    TagResult tag(const std::string& path,
                  const json& trackMeta,
                  const json&,
                  bool isTrack,
                  bool embedArt) override {
        std::lock_guard<std::mutex> lock(mutex);
        calls.push_back({path, trackMeta.value("id", json()).dump(), isTrack, embedArt,
                         std::filesystem::exists(path)});
        if (failNext) {
            return TagResult::failure("unsupported container");
        }
        return TagResult::ok();
    }
    
    std::vector<Call> getCalls() const {
        std::lock_guard<std::mutex> lock(mutex);
        return calls;
    }
    
private:
    std::vector<Call> calls;
    mutable std::mutex mutex;
};

} // namespace Testing
} // namespace QobuzDL
