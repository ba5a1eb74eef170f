#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mcp::exec {

/// Outcome category of one command execution. Everything except None and
/// NonZeroExit/Signaled means the command could not run to completion.
enum class FailureKind {
    None,
    EmptyCommand,
    NotFound,
    TimedOut,
    PermissionDenied,
    LaunchFailed,
    NonZeroExit,
    Signaled,
};

const char* to_string(FailureKind kind);

struct Command {
    std::vector<std::string> argv;
    std::optional<std::string> input;
    std::chrono::seconds timeout{300};
};

struct ExecutionResult {
    bool success = false;
    std::string output;      // stdout and stderr, merged
    std::string error;
    int exit_code = -1;      // -1 when the process never ran or was killed
    FailureKind failure = FailureKind::None;
};

/// Seam between tool handlers and the operating system.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual bool is_available(const std::string& program) const = 0;
    virtual ExecutionResult run(const Command& command) = 0;
};

/**
 * Resolve a program name the way execvp would.
 *
 * Names containing '/' resolve when the file exists; bare names are searched
 * in $PATH and must be executable regular files.
 */
std::optional<std::string> resolve_program(const std::string& program);

class ProcessExecutor final : public CommandRunner {
public:
    static constexpr std::size_t kDefaultMaxOutput = 4 * 1024 * 1024;

    explicit ProcessExecutor(std::size_t max_output = kDefaultMaxOutput);

    bool is_available(const std::string& program) const override;

    /// Run to completion or until the deadline, killing the child's process group on timeout.
    ExecutionResult run(const Command& command) override;

private:
    std::size_t max_output_;
};

} // namespace mcp::exec
