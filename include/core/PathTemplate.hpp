#pragma once

#include <string>
#include <map>

namespace QobuzDL {

using TemplateVariables = std::map<std::string, std::string>;

/**
 * Output path template
 *
 * Grammar:
 *   {name}                    replaced by the variable's value
 *   {{ and }}                 literal braces
 *   %{?flag,ifTrue|ifFalse}   ifTrue when flag is set and not "0", else ifFalse;
 *                             both branches may contain {name} placeholders
 *
 * Rendering throws TemplateError on an unknown variable or an unclosed brace.
 */
class PathTemplate {
public:
    static const char* const DEFAULT_PATTERN;
    
    explicit PathTemplate(std::string templatePattern = DEFAULT_PATTERN);
    
    std::string render(const TemplateVariables& variables) const;
    
    const std::string& getPattern() const { return pattern; }
    
private:
    std::string pattern;
    
    static bool isTruthy(const TemplateVariables& variables, const std::string& key);
    static std::string expandConditionals(const std::string& input,
                                          const TemplateVariables& variables);
    static std::string substitute(const std::string& input,
                                  const TemplateVariables& variables);
};

} // namespace QobuzDL
