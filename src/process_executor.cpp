#include "process_executor.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcp::exec {

namespace {

constexpr const char* kDefaultSearchPath = "/usr/local/bin:/usr/bin:/bin";
constexpr const char* kTruncatedMarker = "\n...[output truncated]";
constexpr int kMaxPollIntervalMs = 1000;

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

void open_pipe(Pipe& p, const char* what) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), what);
    }
    p.read_end.reset(fds[0]);
    p.write_end.reset(fds[1]);
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw std::system_error(errno, std::generic_category(), "fcntl");
    }
}

// Owns a spawned child until it has been reaped. Destruction kills the
// child's process group and reaps it, whatever path left run().
class ChildProcess {
public:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}

    ~ChildProcess() {
        if (pid_ > 0) {
            kill_group();
            wait();
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    void kill_group() const {
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
    }

    bool try_reap(int& status) {
        pid_t rc = ::waitpid(pid_, &status, WNOHANG);
        if (rc == pid_) {
            pid_ = -1;
            return true;
        }
        if (rc < 0 && errno != EINTR) {
            int err = errno;
            pid_ = -1;
            throw std::system_error(err, std::generic_category(), "waitpid");
        }
        return false;
    }

    int wait() {
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        pid_ = -1;
        return status;
    }

private:
    pid_t pid_;
};

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(const char* path, char* const* argv, int stdin_fd, int output_fd, int error_fd) {
    ::setpgid(0, 0);
    ::signal(SIGPIPE, SIG_DFL);

    if (::dup2(stdin_fd, STDIN_FILENO) >= 0 &&
        ::dup2(output_fd, STDOUT_FILENO) >= 0 &&
        ::dup2(output_fd, STDERR_FILENO) >= 0) {
        ::execv(path, argv);
    }

    int err = errno;
    ssize_t written = ::write(error_fd, &err, sizeof(err));
    (void)written;
    ::_exit(127);
}

// Reads whatever is available. Returns false once the pipe reached EOF.
bool drain_output(int fd, std::string& output, std::size_t max_output, bool& truncated) {
    std::array<char, 8192> buffer{};
    while (true) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            std::size_t room = output.size() < max_output ? max_output - output.size() : 0;
            std::size_t take = std::min(room, static_cast<std::size_t>(n));
            output.append(buffer.data(), take);
            if (take < static_cast<std::size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        return false;
    }
}

std::string describe(const std::vector<std::string>& argv) {
    std::ostringstream out;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            out << ' ';
        }
        out << argv[i];
    }
    return out.str();
}

ExecutionResult make_failure(FailureKind kind, std::string error) {
    ExecutionResult result;
    result.success = false;
    result.exit_code = -1;
    result.failure = kind;
    result.error = std::move(error);
    return result;
}

ExecutionResult classify_exec_errno(int err, const std::string& program) {
    switch (err) {
        case EACCES:
        case EPERM:
            return make_failure(FailureKind::PermissionDenied, "Permission denied: " + program);
        case ENOENT:
        case ENOTDIR:
            return make_failure(FailureKind::NotFound, "Command not found: " + program);
        default:
            return make_failure(FailureKind::LaunchFailed,
                                std::string("Error executing command: ") + std::strerror(err));
    }
}

bool is_regular_file(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

} // namespace

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::None: return "none";
        case FailureKind::EmptyCommand: return "empty_command";
        case FailureKind::NotFound: return "not_found";
        case FailureKind::TimedOut: return "timed_out";
        case FailureKind::PermissionDenied: return "permission_denied";
        case FailureKind::LaunchFailed: return "launch_failed";
        case FailureKind::NonZeroExit: return "non_zero_exit";
        case FailureKind::Signaled: return "signaled";
    }
    return "unknown";
}

std::optional<std::string> resolve_program(const std::string& program) {
    if (program.empty()) {
        return std::nullopt;
    }

    if (program.find('/') != std::string::npos) {
        if (is_regular_file(program)) {
            return program;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string path_str = (path_env && *path_env) ? path_env : kDefaultSearchPath;

    std::size_t start = 0;
    while (start <= path_str.size()) {
        std::size_t end = path_str.find(':', start);
        if (end == std::string::npos) {
            end = path_str.size();
        }

        std::string dir = path_str.substr(start, end - start);
        if (dir.empty()) {
            dir = ".";
        }

        std::string candidate = dir + "/" + program;
        if (is_regular_file(candidate) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }

    return std::nullopt;
}

ProcessExecutor::ProcessExecutor(std::size_t max_output) : max_output_(max_output) {
    // A child that exits before consuming its input must surface as EPIPE on
    // our side, not as a fatal signal.
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, []() { ::signal(SIGPIPE, SIG_IGN); });
}

bool ProcessExecutor::is_available(const std::string& program) const {
    return resolve_program(program).has_value();
}

ExecutionResult ProcessExecutor::run(const Command& command) {
    if (command.argv.empty() || command.argv.front().empty()) {
        return make_failure(FailureKind::EmptyCommand, "Empty command");
    }

    const std::string& program = command.argv.front();
    auto resolved = resolve_program(program);
    if (!resolved) {
        LOG4CPLUS_WARN(exec_logger(), "Command not found: " << program);
        return make_failure(FailureKind::NotFound, "Command not found: " + program);
    }

    LOG4CPLUS_DEBUG(exec_logger(), "Running [" << describe(command.argv) << "] timeout="
                                               << command.timeout.count() << "s");

    try {
        Pipe output_pipe;
        Pipe error_pipe;
        Pipe input_pipe;
        UniqueFd dev_null;

        open_pipe(output_pipe, "pipe(output)");
        open_pipe(error_pipe, "pipe(exec status)");
        if (command.input) {
            open_pipe(input_pipe, "pipe(input)");
        } else {
            dev_null.reset(::open("/dev/null", O_RDONLY | O_CLOEXEC));
            if (!dev_null.valid()) {
                throw std::system_error(errno, std::generic_category(), "open(/dev/null)");
            }
        }

        std::vector<char*> argv;
        argv.reserve(command.argv.size() + 1);
        for (const auto& arg : command.argv) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        const int child_stdin = command.input ? input_pipe.read_end.get() : dev_null.get();
        const auto started = std::chrono::steady_clock::now();

        pid_t pid = ::fork();
        if (pid < 0) {
            throw std::system_error(errno, std::generic_category(), "fork");
        }
        if (pid == 0) {
            exec_child(resolved->c_str(), argv.data(), child_stdin,
                       output_pipe.write_end.get(), error_pipe.write_end.get());
        }

        ChildProcess child(pid);
        output_pipe.write_end.reset();
        error_pipe.write_end.reset();
        input_pipe.read_end.reset();
        dev_null.reset();

        int exec_errno = 0;
        ssize_t n = 0;
        do {
            n = ::read(error_pipe.read_end.get(), &exec_errno, sizeof(exec_errno));
        } while (n < 0 && errno == EINTR);
        if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
            child.wait();
            auto failed = classify_exec_errno(exec_errno, program);
            LOG4CPLUS_WARN(exec_logger(), "exec " << *resolved << " failed (" << to_string(failed.failure)
                                                  << "): " << std::strerror(exec_errno));
            return failed;
        }

        set_nonblocking(output_pipe.read_end.get());
        if (input_pipe.write_end.valid()) {
            set_nonblocking(input_pipe.write_end.get());
        }

        const auto deadline = started + command.timeout;
        const std::string empty_input;
        const std::string& input = command.input ? *command.input : empty_input;
        std::size_t input_offset = 0;
        if (input_pipe.write_end.valid() && input.empty()) {
            input_pipe.write_end.reset();
        }

        ExecutionResult result;
        bool truncated = false;
        bool output_open = true;
        bool timed_out = false;
        int status = 0;

        while (true) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                timed_out = true;
                break;
            }

            if (!output_open) {
                if (child.try_reap(status)) {
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count() + 1;
            int wait_ms = static_cast<int>(std::min<long long>(remaining, kMaxPollIntervalMs));

            std::array<pollfd, 2> fds{};
            nfds_t nfds = 0;
            fds[nfds++] = pollfd{output_pipe.read_end.get(), POLLIN, 0};
            if (input_pipe.write_end.valid()) {
                fds[nfds++] = pollfd{input_pipe.write_end.get(), POLLOUT, 0};
            }

            int rc = ::poll(fds.data(), nfds, wait_ms);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::generic_category(), "poll");
            }
            if (rc == 0) {
                continue;
            }

            if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                output_open = drain_output(output_pipe.read_end.get(), result.output, max_output_, truncated);
            }

            if (nfds > 1 && (fds[1].revents & (POLLOUT | POLLHUP | POLLERR))) {
                ssize_t written = ::write(input_pipe.write_end.get(), input.data() + input_offset,
                                          input.size() - input_offset);
                if (written > 0) {
                    input_offset += static_cast<std::size_t>(written);
                }
                bool retry = written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR);
                if (input_offset >= input.size() || (written < 0 && !retry)) {
                    input_pipe.write_end.reset();
                }
            }
        }

        if (truncated) {
            result.output += kTruncatedMarker;
        }

        if (timed_out) {
            child.kill_group();
            child.wait();
            LOG4CPLUS_WARN(exec_logger(), program << " timed out after " << command.timeout.count() << "s, killed");
            result.success = false;
            result.exit_code = -1;
            result.failure = FailureKind::TimedOut;
            result.error = "Command timed out after " + std::to_string(command.timeout.count()) + " seconds";
            return result;
        }

        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
            result.success = result.exit_code == 0;
            if (!result.success) {
                result.failure = FailureKind::NonZeroExit;
                result.error = result.output.empty()
                    ? "Command exited with status " + std::to_string(result.exit_code)
                    : result.output;
            }
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
            result.success = false;
            result.failure = FailureKind::Signaled;
            result.error = "Command terminated by signal " + std::to_string(WTERMSIG(status));
        }

        LOG4CPLUS_INFO(exec_logger(), program << " finished: exit=" << result.exit_code
                                              << " failure=" << to_string(result.failure)
                                              << " output_bytes=" << result.output.size());
        return result;
    } catch (const std::system_error& exc) {
        LOG4CPLUS_ERROR(exec_logger(), "Failed to run " << program << ": " << exc.what());
        return make_failure(FailureKind::LaunchFailed, std::string("Error executing command: ") + exc.what());
    }
}

} // namespace mcp::exec
