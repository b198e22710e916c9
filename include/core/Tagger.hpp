#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace QobuzDL {

using json = nlohmann::json;

/**
 * Outcome of a tagging attempt
 */
struct TagResult {
    bool success;
    std::string error;
    
    static TagResult ok() { return {true, ""}; }
    static TagResult failure(const std::string& message) { return {false, message}; }
};

/**
 * Writes metadata into a finished audio file
 * Called from worker threads; implementations must not share mutable state unguarded
 */
class Tagger {
public:
    virtual ~Tagger() = default;
    
    virtual TagResult tag(const std::string& path,
                          const json& trackMeta,
                          const json& albumMeta,
                          bool isTrack,
                          bool embedArt) = 0;
};

/**
 * Leaves files exactly as downloaded
 */
class PassthroughTagger : public Tagger {
public:
    TagResult tag(const std::string& path,
                  const json& trackMeta,
                  const json& albumMeta,
                  bool isTrack,
                  bool embedArt) override;
};

} // namespace QobuzDL
