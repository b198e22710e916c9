#include "utils/FileUtils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace QobuzDL {

static constexpr std::size_t MAX_COMPONENT_BYTES = 255;

static bool isReservedChar(unsigned char c) {
    switch (c) {
        case '/': case '\\': case ':': case '*': case '?':
        case '"': case '<': case '>': case '|':
            return true;
        default:
            return c < 0x20 || c == 0x7f;
    }
}

static std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string toLower(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return lower;
}

std::string sanitizeFilename(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        if (!isReservedChar(static_cast<unsigned char>(c))) {
            result += c;
        }
    }
    
    result = trim(result);
    while (!result.empty() && (result.back() == '.' || result.back() == ' ')) {
        result.pop_back();
    }
    
    if (result.size() > MAX_COMPONENT_BYTES) {
        size_t cut = MAX_COMPONENT_BYTES;
        // Do not split a UTF-8 sequence
        while (cut > 0 && (static_cast<unsigned char>(result[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        result.resize(cut);
    }
    
    return result;
}

std::string sanitizeFilepath(const std::string& path) {
    std::string result;
    std::stringstream ss(path);
    std::string component;
    
    while (std::getline(ss, component, '/')) {
        std::string clean = sanitizeFilename(component);
        if (clean.empty() || clean == "." || clean == "..") {
            continue;
        }
        if (!result.empty()) {
            result += '/';
        }
        result += clean;
    }
    
    return result;
}

std::vector<std::string> readSourceLines(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open " + filename);
    }
    
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (!line.empty() && line.front() != '#') {
            lines.push_back(line);
        }
    }
    return lines;
}

} // namespace QobuzDL
