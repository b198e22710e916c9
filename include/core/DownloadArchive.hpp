#pragma once

#include <string>
#include <unordered_set>
#include <mutex>

namespace QobuzDL {

/**
 * Append-only set of downloaded track ids, one per line on disk
 * The in-memory set is updated before the file append so later lookups
 * in the same session see the new id immediately.
 */
class DownloadArchive {
public:
    // Disabled archive: contains() is always false and add() does nothing
    DownloadArchive();
    
    // readOnly keeps the file untouched (dry runs)
    explicit DownloadArchive(std::string archivePath, bool readOnlyArchive = false);
    
    // Load ids from disk; a missing file is not an error
    bool load();
    
    bool contains(const std::string& trackId) const;
    
    // Returns true if the id was not known before
    bool add(const std::string& trackId);
    
    bool isEnabled() const { return enabled; }
    std::size_t size() const;
    const std::string& getPath() const { return path; }
    
private:
    std::string path;
    bool enabled;
    bool readOnly;
    std::unordered_set<std::string> ids;
    mutable std::mutex mutex;
};

} // namespace QobuzDL
