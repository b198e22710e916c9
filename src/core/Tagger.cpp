#include "core/Tagger.hpp"
#include "utils/Logger.hpp"
#include <filesystem>

namespace QobuzDL {

TagResult PassthroughTagger::tag(const std::string& path,
                                 const json& trackMeta,
                                 const json& albumMeta,
                                 bool isTrack,
                                 bool embedArt) {
    (void)albumMeta;
    (void)isTrack;
    (void)embedArt;
    
    if (!std::filesystem::is_regular_file(path)) {
        return TagResult::failure("file to tag does not exist: " + path);
    }
    
    LOG_DL_DEBUG("Tagging skipped for track {}", trackMeta.value("id", json()).dump());
    return TagResult::ok();
}

} // namespace QobuzDL
