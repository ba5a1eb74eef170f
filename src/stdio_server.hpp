#pragma once

#include "protocol.hpp"

#include <array>
#include <atomic>
#include <functional>
#include <istream>
#include <ostream>
#include <streambuf>
#include <string>

namespace mcp {

/**
 * Input buffer over a raw file descriptor that gives up once the interrupt
 * flag is set, even while no data arrives.
 *
 * Reads poll the descriptor in short slices and report end of input when the
 * flag is raised. Read errors other than EINTR throw std::system_error, which
 * leaves the owning stream in the bad state.
 */
class InterruptibleFdBuf : public std::streambuf {
public:
    static constexpr int kPollSliceMs = 100;

    InterruptibleFdBuf(int fd, const std::atomic<bool>& interrupted);

protected:
    int_type underflow() override;

private:
    int fd_;
    const std::atomic<bool>& interrupted_;
    std::array<char, 4096> buffer_{};
};

/// Installs SIGINT/SIGTERM handlers (without SA_RESTART) that raise the returned flag.
std::atomic<bool>& install_interrupt_handlers();

/**
 * Line-delimited request/response loop over a pair of streams.
 *
 * Each non-blank input line is decoded, handed to the request handler and
 * answered with exactly one line on the output stream, in input order.
 */
class StdioServer {
public:
    using RequestHandler = std::function<Response(const Request&)>;

    StdioServer(std::istream& in, std::ostream& out, RequestHandler handler, const std::atomic<bool>& interrupted);

    /// Blocks until end of input or interruption. Returns the process exit status.
    int run();

    /// Handle a single input line. Returns false for blank lines, which get no response.
    bool process_line(const std::string& line);

private:
    void write_response(const Response& response);

    std::istream& in_;
    std::ostream& out_;
    RequestHandler handler_;
    const std::atomic<bool>& interrupted_;
};

} // namespace mcp
