#pragma once

#include <cstddef>
#include <filesystem>
#include <regex>
#include <string>
#include <vector>
#include "core/errors/worker_errors.hpp"

namespace toolbridge::policy {

enum class RuleSeverity {
    Error,
    Warning
};

enum class MatchKind {
    Substring,
    Regex
};

struct PolicyRule {
    std::string id;
    std::string category;   // ambient_api, import, dynamic_code, ...
    std::string pattern;
    MatchKind match = MatchKind::Substring;
    RuleSeverity severity = RuleSeverity::Error;
    std::string message;
};

struct CodePolicy {
    std::size_t max_code_length = 100000;
    std::vector<PolicyRule> rules;

    static CodePolicy defaults();
};

struct ValidationOutcome {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

// Loads a policy document; see CodePolicyGuard for the rule semantics.
core::errors::Result<CodePolicy> load_code_policy(const std::filesystem::path& path);

class CodePolicyGuard {
public:
    // Fails when a regex rule does not compile.
    static core::errors::Result<CodePolicyGuard> create(CodePolicy policy);

    CodePolicyGuard();

    ValidationOutcome validate(const std::string& code) const;

    const CodePolicy& policy() const { return policy_; }

private:
    explicit CodePolicyGuard(CodePolicy policy, std::vector<std::regex> compiled);

    CodePolicy policy_;
    // Parallel to policy_.rules; empty entries for substring rules.
    std::vector<std::regex> compiled_;
};

}  // namespace toolbridge::policy
