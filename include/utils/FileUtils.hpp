#pragma once

#include <string>
#include <vector>

namespace QobuzDL {

/**
 * Make a single path component safe on every common filesystem
 * Strips separators, reserved characters and control characters, trims
 * surrounding whitespace and trailing dots, and caps the length at 255 bytes.
 */
std::string sanitizeFilename(const std::string& name);

/**
 * Sanitize every component of a '/'-separated relative path
 * Empty, "." and ".." components are dropped; the result is always relative
 */
std::string sanitizeFilepath(const std::string& path);

// ASCII lowercase; bytes outside ASCII (UTF-8 sequences) are left untouched
std::string toLower(const std::string& str);

/**
 * Non-empty, non-comment ('#') lines of a text file, trimmed
 */
std::vector<std::string> readSourceLines(const std::string& filename);

} // namespace QobuzDL
