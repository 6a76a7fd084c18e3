#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/worker_id.hpp"
#include "core/errors/worker_errors.hpp"
#include "policy/code_policy_guard.hpp"

namespace {

using toolbridge::core::errors::get_error;
using toolbridge::core::errors::get_value;
using toolbridge::core::errors::is_error;
using toolbridge::policy::CodePolicy;
using toolbridge::policy::CodePolicyGuard;
using toolbridge::policy::MatchKind;
using toolbridge::policy::PolicyRule;
using toolbridge::policy::RuleSeverity;

class TempDir {
public:
    TempDir() {
        root_ = std::filesystem::temp_directory_path() /
                (".tmp_code_policy_" + toolbridge::core::config::generate_worker_id());
        std::filesystem::create_directories(root_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path write(const std::string& name, const std::string& content) const {
        const auto path = root_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

TEST(CodePolicyGuardTest, AcceptsOrdinaryToolCode) {
    CodePolicyGuard guard;
    const auto outcome = guard.validate(
        "const user = await callMCPTool('github_get_user', {username: 'octocat'});\n"
        "return user.login;");
    EXPECT_TRUE(outcome.valid);
    EXPECT_TRUE(outcome.errors.empty());
    EXPECT_TRUE(outcome.warnings.empty());
}

TEST(CodePolicyGuardTest, RejectsAmbientRuntimeAccess) {
    CodePolicyGuard guard;
    for (const std::string code :
         {"Deno.readTextFile('/etc/passwd')", "return process.env.TOKEN", "globalThis.x = 1",
          "window.location", "const fs = require('fs')"}) {
        const auto outcome = guard.validate(code);
        EXPECT_FALSE(outcome.valid) << code;
        EXPECT_FALSE(outcome.errors.empty()) << code;
    }
}

TEST(CodePolicyGuardTest, RejectsDynamicCodeAndImports) {
    CodePolicyGuard guard;
    for (const std::string code :
         {"eval('1+1')", "new Function('return 1')", "import fs from 'fs'",
          "const m = await import('./x.js')", "({}).__proto__.polluted = 1",
          "return [].constructor"}) {
        EXPECT_FALSE(guard.validate(code).valid) << code;
    }
}

TEST(CodePolicyGuardTest, IdentifiersContainingKeywordsAreAllowed) {
    CodePolicyGuard guard;
    EXPECT_TRUE(guard.validate("const processed = items.length; return processed;").valid);
    EXPECT_TRUE(guard.validate("const important = 1; return important;").valid);
    EXPECT_TRUE(guard.validate("const evaluation = 2; return evaluation;").valid);
}

TEST(CodePolicyGuardTest, WarnsOnInfiniteLoopWithoutBlocking) {
    CodePolicyGuard guard;
    const auto outcome = guard.validate("let i = 0; while (true) { if (++i > 3) break; } return i;");
    EXPECT_TRUE(outcome.valid);
    ASSERT_EQ(outcome.warnings.size(), 1u);
    EXPECT_NE(outcome.warnings[0].find("infinite-while"), std::string::npos);
}

TEST(CodePolicyGuardTest, RejectsCodeOverMaximumLength) {
    CodePolicy policy;
    policy.max_code_length = 10;
    auto created = CodePolicyGuard::create(policy);
    ASSERT_FALSE(is_error(created));

    const auto outcome = get_value(created).validate("return 1234567890;");
    EXPECT_FALSE(outcome.valid);
    ASSERT_EQ(outcome.errors.size(), 1u);
    EXPECT_NE(outcome.errors[0].find("maximum length of 10"), std::string::npos);
}

TEST(CodePolicyGuardTest, CreateFailsOnInvalidRegex) {
    PolicyRule rule;
    rule.id = "broken";
    rule.pattern = "([a-z";
    rule.match = MatchKind::Regex;

    CodePolicy policy;
    policy.rules.push_back(rule);
    auto created = CodePolicyGuard::create(policy);
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).code, "invalid_policy");
}

TEST(CodePolicyGuardTest, LoadsPolicyFileReplacingDefaults) {
    TempDir dir;
    const auto path = dir.write("policy.json", R"({
        "max_code_length": 500,
        "rules": [
            {"id": "no-delete", "pattern": "delete_", "message": "Deletes are disabled"},
            {"id": "slow", "pattern": "sleep\\s*\\(", "match": "regex", "severity": "warning"}
        ]
    })");

    auto loaded = toolbridge::policy::load_code_policy(path);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).max_code_length, 500u);
    ASSERT_EQ(get_value(loaded).rules.size(), 2u);
    EXPECT_EQ(get_value(loaded).rules[1].severity, RuleSeverity::Warning);

    auto created = CodePolicyGuard::create(get_value(loaded));
    ASSERT_FALSE(is_error(created));
    const auto& guard = get_value(created);

    const auto rejected = guard.validate("await callMCPTool('github_delete_repository', {})");
    EXPECT_FALSE(rejected.valid);
    EXPECT_EQ(rejected.errors[0], "Deletes are disabled [no-delete]");

    const auto warned = guard.validate("sleep (10); return process.env");
    EXPECT_TRUE(warned.valid);
    EXPECT_EQ(warned.warnings.size(), 1u);
}

TEST(CodePolicyGuardTest, LoadRejectsMalformedPolicy) {
    TempDir dir;
    auto not_object = toolbridge::policy::load_code_policy(dir.write("a.json", "[1, 2]"));
    ASSERT_TRUE(is_error(not_object));
    EXPECT_EQ(get_error(not_object).code, "invalid_policy");

    auto bad_match = toolbridge::policy::load_code_policy(
        dir.write("b.json", R"({"rules": [{"pattern": "x", "match": "glob"}]})"));
    ASSERT_TRUE(is_error(bad_match));
    EXPECT_EQ(get_error(bad_match).code, "invalid_policy");

    auto missing = toolbridge::policy::load_code_policy(dir.root() / "missing.json");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "policy_file_unreadable");
}

}  // namespace
