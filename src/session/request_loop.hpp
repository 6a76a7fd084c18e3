#pragma once

#include <cstddef>
#include <exception>
#include <iosfwd>
#include <optional>
#include <string>
#include "core/errors/worker_errors.hpp"
#include "policy/code_policy_guard.hpp"
#include "policy/error_sanitizer.hpp"
#include "protocol/execution_request.hpp"
#include "protocol/execution_result.hpp"
#include "runtime/code_sandbox.hpp"
#include "session/connection_manager.hpp"

namespace toolbridge::session {

inline constexpr const char* kNoCodeMessage = "No code provided in request";
inline constexpr const char* kLoopErrorCode = "POOLED_EXECUTOR_ERROR";

// Raw request bytes. read_some() yields nullopt at end of input.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual core::errors::Result<std::optional<std::string>> read_some() = 0;
};

class FdByteSource : public ByteSource {
public:
    explicit FdByteSource(int fd) : fd_(fd) {}
    core::errors::Result<std::optional<std::string>> read_some() override;

private:
    int fd_;
};

class StreamByteSource : public ByteSource {
public:
    explicit StreamByteSource(std::istream& in) : in_(in) {}
    core::errors::Result<std::optional<std::string>> read_some() override;

private:
    std::istream& in_;
};

// Splits input on '\n'. A partial line is kept across reads and returned
// as the last line when input ends without a trailing newline.
class RequestReader {
public:
    explicit RequestReader(ByteSource& source) : source_(source) {}

    // nullopt once input is exhausted.
    core::errors::Result<std::optional<std::string>> next_line();

private:
    ByteSource& source_;
    std::string buffer_;
    bool eof_ = false;
};

// Outcome of decoding one trimmed input line. When failure is set the line
// never reaches the validator.
struct ParsedLine {
    protocol::ExecutionRequest request;
    std::optional<protocol::ExecutionFailure> failure;
};

// JSON object with a "code" field, or anything that is not JSON taken as
// literal code.
ParsedLine parse_request_line(const std::string& line);

std::string trim(const std::string& text);

class ResponseWriter {
public:
    explicit ResponseWriter(std::ostream& out) : out_(out) {}

    // One JSON object plus '\n', flushed before returning.
    core::errors::Result<bool> write(const protocol::ExecutionResult& result,
                                     const std::optional<std::string>& request_id);

private:
    std::ostream& out_;
};

struct LoopOptions {
    bool skip_blank_lines = false;
};

// Reader -> validator -> connection manager -> sandbox -> writer, one line
// at a time.
class WorkerLoop {
public:
    WorkerLoop(ConnectionManager& connection, const policy::CodePolicyGuard& guard,
               runtime::CodeSandbox& sandbox, ResponseWriter& writer, LoopOptions options = {});

    // Runs until input ends. Returns the process exit code.
    int run(RequestReader& reader);

    // Validates and executes one request.
    protocol::ExecutionResult process(const protocol::ExecutionRequest& request);
    // process(), with anything it throws reported as a sanitized
    // POOLED_EXECUTOR_ERROR failure.
    protocol::ExecutionResult process_guarded(const protocol::ExecutionRequest& request);

    std::size_t processed() const { return processed_; }

private:
    protocol::ExecutionResult handle_line(const std::string& line,
                                          std::optional<std::string>& request_id);
    void write_fatal(const std::string& message);
    protocol::ExecutionFailure unexpected_failure(const std::exception& e) const;

    ConnectionManager& connection_;
    const policy::CodePolicyGuard& guard_;
    runtime::CodeSandbox& sandbox_;
    ResponseWriter& writer_;
    LoopOptions options_;
    policy::ErrorSanitizer sanitizer_;
    std::size_t processed_ = 0;
};

}  // namespace toolbridge::session
