#include "policy/code_policy_guard.hpp"

#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace toolbridge::policy {

using core::errors::ErrorCategory;
using core::errors::WorkerError;
using nlohmann::json;

namespace {

PolicyRule make_rule(std::string id, std::string category, std::string pattern,
                     RuleSeverity severity, std::string message) {
    PolicyRule rule;
    rule.id = std::move(id);
    rule.category = std::move(category);
    rule.pattern = std::move(pattern);
    rule.match = MatchKind::Regex;
    rule.severity = severity;
    rule.message = std::move(message);
    return rule;
}

core::errors::Result<PolicyRule> rule_from_json(const json& item, const std::size_t index) {
    if (!item.is_object()) {
        return WorkerError{ErrorCategory::Input,
                           "Policy rule #" + std::to_string(index) + " is not an object.",
                           "invalid_policy"};
    }
    if (!item.contains("pattern") || !item["pattern"].is_string() ||
        item["pattern"].get<std::string>().empty()) {
        return WorkerError{ErrorCategory::Input,
                           "Policy rule #" + std::to_string(index) +
                               " needs a non-empty string 'pattern'.",
                           "invalid_policy"};
    }

    PolicyRule rule;
    rule.pattern = item["pattern"].get<std::string>();
    rule.id = item.value("id", "rule-" + std::to_string(index));
    rule.category = item.value("category", "custom");
    rule.message = item.value("message", "");

    const std::string match = item.value("match", "substring");
    if (match == "substring") {
        rule.match = MatchKind::Substring;
    } else if (match == "regex") {
        rule.match = MatchKind::Regex;
    } else {
        return WorkerError{ErrorCategory::Input,
                           "Unknown match kind '" + match + "' in rule " + rule.id,
                           "invalid_policy", "Use \"substring\" or \"regex\"."};
    }

    const std::string severity = item.value("severity", "error");
    if (severity == "error") {
        rule.severity = RuleSeverity::Error;
    } else if (severity == "warning") {
        rule.severity = RuleSeverity::Warning;
    } else {
        return WorkerError{ErrorCategory::Input,
                           "Unknown severity '" + severity + "' in rule " + rule.id,
                           "invalid_policy", "Use \"error\" or \"warning\"."};
    }
    return rule;
}

}  // namespace

CodePolicy CodePolicy::defaults() {
    CodePolicy policy;
    policy.rules = {
        make_rule("deno-global", "ambient_api", R"(\bDeno\s*\.)", RuleSeverity::Error,
                  "Access to the Deno runtime API is not allowed"),
        make_rule("process-global", "ambient_api", R"(\bprocess\s*\.)", RuleSeverity::Error,
                  "Access to the process object is not allowed"),
        make_rule("global-this", "ambient_api", R"(\bglobalThis\b)", RuleSeverity::Error,
                  "Access to globalThis is not allowed"),
        make_rule("window-global", "ambient_api", R"(\bwindow\s*\.)", RuleSeverity::Error,
                  "Access to window is not allowed"),
        make_rule("require-call", "import", R"(\brequire\s*\()", RuleSeverity::Error,
                  "require() is not allowed"),
        make_rule("static-import", "import", R"((^|[\n;])\s*import\s+[^(\s])",
                  RuleSeverity::Error, "Module imports are not allowed"),
        make_rule("dynamic-import", "import", R"(\bimport\s*\()", RuleSeverity::Error,
                  "Dynamic import() is not allowed"),
        make_rule("eval-call", "dynamic_code", R"(\beval\s*\()", RuleSeverity::Error,
                  "eval() is not allowed"),
        make_rule("function-constructor", "dynamic_code", R"(\bFunction\s*\()",
                  RuleSeverity::Error, "The Function constructor is not allowed"),
        make_rule("proto-access", "prototype", R"(__proto__)", RuleSeverity::Error,
                  "Prototype manipulation is not allowed"),
        make_rule("constructor-access", "prototype", R"(\.\s*constructor\b)",
                  RuleSeverity::Error, "Constructor access is not allowed"),
        make_rule("infinite-while", "resource", R"(while\s*\(\s*true\s*\))",
                  RuleSeverity::Warning, "Possible infinite loop: while (true)"),
        make_rule("infinite-for", "resource", R"(for\s*\(\s*;\s*;\s*\))",
                  RuleSeverity::Warning, "Possible infinite loop: for (;;)"),
    };
    return policy;
}

core::errors::Result<CodePolicy> load_code_policy(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return WorkerError{ErrorCategory::Input,
                           "Unable to open policy file: " + path.string(),
                           "policy_file_unreadable"};
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return WorkerError{ErrorCategory::Input,
                           "Policy file is not a JSON object: " + path.string(),
                           "invalid_policy"};
    }

    CodePolicy policy;
    if (document.contains("max_code_length")) {
        const auto& limit = document["max_code_length"];
        if (!limit.is_number_unsigned() || limit.get<std::size_t>() == 0) {
            return WorkerError{ErrorCategory::Input,
                               "max_code_length must be a positive integer.",
                               "invalid_policy"};
        }
        policy.max_code_length = limit.get<std::size_t>();
    }

    if (document.contains("rules")) {
        if (!document["rules"].is_array()) {
            return WorkerError{ErrorCategory::Input, "'rules' must be an array.",
                               "invalid_policy"};
        }
        std::size_t index = 0;
        for (const auto& item : document["rules"]) {
            auto rule = rule_from_json(item, index++);
            if (core::errors::is_error(rule)) {
                return core::errors::get_error(rule);
            }
            policy.rules.push_back(core::errors::get_value(rule));
        }
    }
    return policy;
}

CodePolicyGuard::CodePolicyGuard()
    : CodePolicyGuard(std::get<CodePolicyGuard>(create(CodePolicy::defaults()))) {}

CodePolicyGuard::CodePolicyGuard(CodePolicy policy, std::vector<std::regex> compiled)
    : policy_(std::move(policy)), compiled_(std::move(compiled)) {}

core::errors::Result<CodePolicyGuard> CodePolicyGuard::create(CodePolicy policy) {
    std::vector<std::regex> compiled;
    compiled.reserve(policy.rules.size());
    for (const auto& rule : policy.rules) {
        if (rule.match == MatchKind::Substring) {
            compiled.emplace_back();
            continue;
        }
        try {
            compiled.emplace_back(rule.pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            return WorkerError{ErrorCategory::Input,
                               "Rule " + rule.id + " has an invalid regex: " + e.what(),
                               "invalid_policy"};
        }
    }
    return CodePolicyGuard(std::move(policy), std::move(compiled));
}

ValidationOutcome CodePolicyGuard::validate(const std::string& code) const {
    ValidationOutcome outcome;

    if (code.size() > policy_.max_code_length) {
        outcome.errors.push_back("Code exceeds maximum length of " +
                                 std::to_string(policy_.max_code_length) +
                                 " characters");
    }

    for (std::size_t i = 0; i < policy_.rules.size(); ++i) {
        const auto& rule = policy_.rules[i];
        bool hit = false;
        if (rule.match == MatchKind::Substring) {
            hit = code.find(rule.pattern) != std::string::npos;
        } else {
            hit = std::regex_search(code, compiled_[i]);
        }
        if (!hit) {
            continue;
        }

        std::string text = rule.message.empty()
                               ? "Forbidden pattern detected: " + rule.pattern
                               : rule.message;
        text += " [" + rule.id + "]";
        if (rule.severity == RuleSeverity::Error) {
            outcome.errors.push_back(std::move(text));
        } else {
            outcome.warnings.push_back(std::move(text));
        }
    }

    outcome.valid = outcome.errors.empty();
    return outcome;
}

}  // namespace toolbridge::policy
