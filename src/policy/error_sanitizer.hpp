#pragma once

#include <regex>
#include <string>
#include <vector>

namespace toolbridge::policy {

struct RedactionRule {
    std::regex pattern;
    std::string replacement;
};

// Strips credential-like tokens and absolute filesystem paths from text that
// is about to leave the process.
class ErrorSanitizer {
public:
    ErrorSanitizer();

    std::string sanitize(const std::string& text) const;

private:
    std::vector<RedactionRule> rules_;
};

}  // namespace toolbridge::policy
