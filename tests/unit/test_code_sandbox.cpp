#include <chrono>
#include <memory>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/worker_errors.hpp"
#include "runtime/capability_set.hpp"
#include "runtime/code_sandbox.hpp"
#include "session/connection_manager.hpp"
#include "support/stub_tool_provider.hpp"
#include "tools/tool_catalog.hpp"

namespace {

using nlohmann::json;
using toolbridge::core::errors::ErrorCategory;
using toolbridge::core::errors::Result;
using toolbridge::core::errors::WorkerError;
using toolbridge::core::errors::get_value;
using toolbridge::core::errors::is_error;
using toolbridge::protocol::ExecutionFailure;
using toolbridge::protocol::ExecutionResult;
using toolbridge::protocol::ExecutionSuccess;
using toolbridge::runtime::CodeSandbox;
using toolbridge::runtime::SandboxOptions;
using toolbridge::session::ConnectionManager;
using toolbridge::session::ConnectionState;
using toolbridge::testing::StubToolProvider;

SandboxOptions quick_options() {
    SandboxOptions options;
    options.settle = std::chrono::milliseconds(0);
    options.timeout = std::chrono::milliseconds(2000);
    return options;
}

class CodeSandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        stub = std::make_shared<StubToolProvider>();
        stub->handlers["github_get_user"] = [](const json& args) -> Result<json> {
            return json{{"login", args.value("username", "")}, {"public_repos", 8}};
        };
        stub->handlers["github_list_issues"] = [](const json&) -> Result<json> {
            return json::array({json{{"number", 1}, {"state", "open"}},
                                json{{"number", 2}, {"state", "closed"}}});
        };
        stub->handlers["github_delete_repo"] = [](const json&) -> Result<json> {
            return WorkerError{ErrorCategory::Execution, "Resource not accessible by integration",
                               "tool_error"};
        };
        manager = std::make_unique<ConnectionManager>(stub);
        ASSERT_FALSE(is_error(manager->ensure_ready()));
    }

    ExecutionResult execute(const std::string& code, SandboxOptions options = quick_options()) {
        CodeSandbox sandbox(*manager, options);
        return sandbox.execute(code);
    }

    static const ExecutionFailure& failure_of(const ExecutionResult& result) {
        return std::get<ExecutionFailure>(result);
    }

    static const json& data_of(const ExecutionResult& result) {
        return std::get<ExecutionSuccess>(result).data;
    }

    std::shared_ptr<StubToolProvider> stub;
    std::unique_ptr<ConnectionManager> manager;
};

TEST_F(CodeSandboxTest, ReturnsToolResultThroughSnippet) {
    const auto result = execute(R"(
        const user = await callMCPTool('github_get_user', {username: 'octocat'});
        return {login: user.login, repos: user.public_repos};
    )");
    ASSERT_FALSE(toolbridge::protocol::is_failure(result));
    EXPECT_EQ(data_of(result), json({{"login", "octocat"}, {"repos", 8}}));
    ASSERT_EQ(stub->invoked.size(), 1u);
    EXPECT_EQ(stub->invoked[0], "github_get_user");
}

TEST_F(CodeSandboxTest, SequentialToolCallsShareTheConnection) {
    const auto result = execute(R"(
        const issues = await callMCPTool('github_list_issues', {});
        const open = issues.filter(i => i.state === 'open');
        const user = await callMCPTool('github_get_user', {username: 'hubot'});
        return `${user.login}:${open.length}`;
    )");
    ASSERT_FALSE(toolbridge::protocol::is_failure(result));
    EXPECT_EQ(data_of(result), json("hubot:1"));
    EXPECT_EQ(stub->connect_calls, 1u);
}

TEST_F(CodeSandboxTest, UndefinedCompletionBecomesNull) {
    const auto result = execute("const x = 1;");
    ASSERT_FALSE(toolbridge::protocol::is_failure(result));
    EXPECT_TRUE(data_of(result).is_null());
}

TEST_F(CodeSandboxTest, ToolErrorIsExecutionErrorAndConnectionStaysReady) {
    const auto result = execute("await callMCPTool('github_delete_repo', {repo: 'x'});");
    ASSERT_TRUE(toolbridge::protocol::is_failure(result));
    EXPECT_EQ(failure_of(result).code, "EXECUTION_ERROR");
    EXPECT_EQ(failure_of(result).message, "Resource not accessible by integration");
    EXPECT_EQ(manager->state(), ConnectionState::Ready);
}

TEST_F(CodeSandboxTest, SnippetCanCatchToolErrors) {
    const auto result = execute(R"(
        try {
            await callMCPTool('github_delete_repo', {});
            return 'unreachable';
        } catch (e) {
            return {caught: e.message};
        }
    )");
    ASSERT_FALSE(toolbridge::protocol::is_failure(result));
    EXPECT_EQ(data_of(result)["caught"], "Resource not accessible by integration");
}

TEST_F(CodeSandboxTest, ThrownErrorCarriesStackDetails) {
    const auto result = execute("function check() { throw new Error('bad state'); }\ncheck();");
    ASSERT_TRUE(toolbridge::protocol::is_failure(result));
    const auto& failure = failure_of(result);
    EXPECT_EQ(failure.code, "EXECUTION_ERROR");
    EXPECT_EQ(failure.message, "bad state");
    ASSERT_TRUE(failure.details.contains("stack"));
    EXPECT_NE(failure.details["stack"].get<std::string>().find("at check"), std::string::npos);
}

TEST_F(CodeSandboxTest, LostConnectionIsConnectionErrorAndDegrades) {
    stub->connected = false;
    const auto result = execute("return await callMCPTool('github_get_user', {username: 'a'});");
    ASSERT_TRUE(toolbridge::protocol::is_failure(result));
    EXPECT_EQ(failure_of(result).code, "CONNECTION_ERROR");
    EXPECT_EQ(manager->state(), ConnectionState::Degraded);
}

TEST_F(CodeSandboxTest, RethrownConnectionErrorKeepsCategory) {
    stub->connected = false;
    const auto result = execute(R"(
        try {
            await callMCPTool('github_get_user', {});
        } catch (e) {
            throw e;
        }
    )");
    ASSERT_TRUE(toolbridge::protocol::is_failure(result));
    EXPECT_EQ(failure_of(result).code, "CONNECTION_ERROR");
}

TEST_F(CodeSandboxTest, DeadlineProducesTimeoutError) {
    auto options = quick_options();
    options.timeout = std::chrono::milliseconds(30);
    const auto result = execute("while (true) {}", options);
    ASSERT_TRUE(toolbridge::protocol::is_failure(result));
    EXPECT_EQ(failure_of(result).code, "TIMEOUT_ERROR");
    EXPECT_EQ(failure_of(result).message, "Execution timed out after 30 ms");
    EXPECT_EQ(manager->state(), ConnectionState::Ready);
}

TEST_F(CodeSandboxTest, SettlesAfterSuccessAndFailure) {
    auto options = quick_options();
    options.settle = std::chrono::milliseconds(5);

    execute("return 1", options);
    EXPECT_EQ(stub->settle_calls, 1u);
    EXPECT_EQ(stub->last_settle, std::chrono::milliseconds(5));

    execute("throw new Error('x')", options);
    EXPECT_EQ(stub->settle_calls, 2u);
}

TEST_F(CodeSandboxTest, SyntaxErrorIsExecutionError) {
    const auto result = execute("return (1 + ;");
    ASSERT_TRUE(toolbridge::protocol::is_failure(result));
    EXPECT_EQ(failure_of(result).code, "EXECUTION_ERROR");
    EXPECT_EQ(stub->invoke_calls, 0u);
}

TEST_F(CodeSandboxTest, FailureMessagesAreSanitized) {
    const auto result =
        execute("throw new Error('token=abc123 rejected reading /home/runner/.config/gh.yml')");
    ASSERT_TRUE(toolbridge::protocol::is_failure(result));
    const std::string message = failure_of(result).message;
    EXPECT_EQ(message.find("abc123"), std::string::npos);
    EXPECT_EQ(message.find("/home/runner"), std::string::npos);
    EXPECT_EQ(failure_of(result).details["stack"].get<std::string>().find("abc123"),
              std::string::npos);
}

TEST_F(CodeSandboxTest, DiscoveryUsesProviderListingWithoutCatalog) {
    const auto result = execute(R"(
        const all = listAvailableTools();
        const found = searchTools('issues');
        return {total: all.totalTools, found: found.map(t => t.name),
                info: getToolInfo('github_get_user').description,
                missing: getToolInfo('nope') === undefined};
    )");
    ASSERT_FALSE(toolbridge::protocol::is_failure(result));
    EXPECT_EQ(data_of(result),
              json({{"total", 2},
                    {"found", {"github_list_issues"}},
                    {"info", "Fetch a user profile"},
                    {"missing", true}}));
    EXPECT_EQ(stub->invoke_calls, 0u);
}

TEST_F(CodeSandboxTest, DiscoveryUsesFixedCatalogWhenGiven) {
    auto catalog = toolbridge::tools::ToolCatalog::from_json(json::array(
        {json{{"name", "github_get_repo"}, {"category", "Repository Management"}},
         json{{"name", "github_create_issue"}, {"category", "Issues"}}}));
    ASSERT_FALSE(is_error(catalog));

    CodeSandbox sandbox(*manager, quick_options(), get_value(catalog));
    const auto result = sandbox.execute(R"(
        return getToolsInCategory('Issues').map(t => t.name)
            .concat(listAvailableTools().categories);
    )");
    ASSERT_FALSE(toolbridge::protocol::is_failure(result));
    EXPECT_EQ(data_of(result),
              json::array({"github_create_issue", "Issues", "Repository Management"}));
}

TEST_F(CodeSandboxTest, CallToolRejectsNonStringName) {
    const auto result = execute("return await callMCPTool(42, {});");
    ASSERT_TRUE(toolbridge::protocol::is_failure(result));
    EXPECT_EQ(failure_of(result).message, "callMCPTool expects a tool name as a string");
    EXPECT_EQ(stub->invoke_calls, 0u);
}

TEST_F(CodeSandboxTest, EachExecutionStartsWithFreshGlobals) {
    CodeSandbox sandbox(*manager, quick_options());
    ASSERT_FALSE(toolbridge::protocol::is_failure(sandbox.execute("var leaked = 41; return leaked;")));
    const auto second = sandbox.execute("return typeof leaked;");
    ASSERT_FALSE(toolbridge::protocol::is_failure(second));
    EXPECT_EQ(data_of(second), json("undefined"));
}

TEST(CapabilitySetTest, ExposesDiscoveryNames) {
    const auto& names = toolbridge::runtime::CapabilitySet::names();
    ASSERT_EQ(names.size(), 5u);
    EXPECT_EQ(names.front(), "callMCPTool");
}

}  // namespace
