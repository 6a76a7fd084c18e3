#include "policy/error_sanitizer.hpp"

namespace toolbridge::policy {

namespace {

constexpr const char* kTokenMask = "[REDACTED_TOKEN]";
constexpr const char* kPathMask = "[REDACTED_PATH]";

}  // namespace

ErrorSanitizer::ErrorSanitizer() {
    const auto icase = std::regex::ECMAScript | std::regex::icase;
    // Tokens first: a token embedded in a URL path must not survive as a path.
    rules_.push_back({std::regex(R"re(\bgh[pousr]_[A-Za-z0-9]{16,})re"), kTokenMask});
    rules_.push_back({std::regex(R"re(\bgithub_pat_[A-Za-z0-9_]{16,})re"), kTokenMask});
    rules_.push_back({std::regex(R"re(\bBearer\s+[A-Za-z0-9._~+/=-]+)re", icase),
                      std::string("Bearer ") + kTokenMask});
    rules_.push_back({std::regex(
                          R"re(\b(token|password|passwd|secret|api[_-]?key|private[_-]?key)(\s*[=:]\s*)[^\s,;&"']+)re",
                          icase),
                      std::string("$1$2") + kTokenMask});
    // file:// URLs, absolute POSIX paths with two or more segments, drive paths.
    rules_.push_back({std::regex(R"re(file:///[^\s:)"'\]]+)re"), kPathMask});
    rules_.push_back({std::regex(
                          R"re((^|[\s("'=\[])(/[A-Za-z0-9._-]+/[^\s:)"'\]]*))re"),
                      std::string("$1") + kPathMask});
    rules_.push_back({std::regex(R"re(\b[A-Za-z]:\\[^\s:)"'\]]*)re"), kPathMask});
}

std::string ErrorSanitizer::sanitize(const std::string& text) const {
    std::string out = text;
    for (const auto& rule : rules_) {
        out = std::regex_replace(out, rule.pattern, rule.replacement);
    }
    return out;
}

}  // namespace toolbridge::policy
