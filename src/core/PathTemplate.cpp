#include "core/PathTemplate.hpp"
#include "api/Errors.hpp"
#include <regex>

namespace QobuzDL {

const char* const PathTemplate::DEFAULT_PATTERN =
    "{albumartist}/{album} ({year})/"
    "%{?is_multidisc,Disc {media_number}/|}{tracknumber} - {tracktitle}.{ext}";

static const std::regex CONDITIONAL_PATTERN(R"(%\{\?(\w+),([^|]*?)\|([^}]*?)\})");

PathTemplate::PathTemplate(std::string templatePattern)
    : pattern(templatePattern.empty() ? std::string(DEFAULT_PATTERN) : std::move(templatePattern)) {
}

bool PathTemplate::isTruthy(const TemplateVariables& variables, const std::string& key) {
    auto it = variables.find(key);
    return it != variables.end() && !it->second.empty() && it->second != "0";
}

std::string PathTemplate::expandConditionals(const std::string& input,
                                             const TemplateVariables& variables) {
    std::string output;
    auto begin = std::sregex_iterator(input.begin(), input.end(), CONDITIONAL_PATTERN);
    auto end = std::sregex_iterator();
    
    std::size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        const std::smatch& match = *it;
        output.append(input, last, static_cast<std::size_t>(match.position(0)) - last);
        output += isTruthy(variables, match[1].str()) ? match[2].str() : match[3].str();
        last = static_cast<std::size_t>(match.position(0) + match.length(0));
    }
    output.append(input, last, std::string::npos);
    
    return output;
}

std::string PathTemplate::substitute(const std::string& input,
                                     const TemplateVariables& variables) {
    std::string output;
    output.reserve(input.size());
    
    for (std::size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        
        if (c == '{') {
            if (i + 1 < input.size() && input[i + 1] == '{') {
                output += '{';
                ++i;
                continue;
            }
            std::size_t close = input.find('}', i + 1);
            if (close == std::string::npos) {
                throw TemplateError("Unclosed '{' in output template");
            }
            std::string name = input.substr(i + 1, close - i - 1);
            auto it = variables.find(name);
            if (it == variables.end()) {
                throw TemplateError("Unknown template variable '" + name + "'");
            }
            output += it->second;
            i = close;
        } else if (c == '}') {
            if (i + 1 < input.size() && input[i + 1] == '}') {
                ++i;
            }
            output += '}';
        } else {
            output += c;
        }
    }
    
    return output;
}

std::string PathTemplate::render(const TemplateVariables& variables) const {
    return substitute(expandConditionals(pattern, variables), variables);
}

} // namespace QobuzDL
