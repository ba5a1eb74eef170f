#include "stdio_server.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <cerrno>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace mcp {

namespace {

std::atomic<bool> g_interrupted{false};

void handle_interrupt(int) {
    g_interrupted.store(true);
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

InterruptibleFdBuf::InterruptibleFdBuf(int fd, const std::atomic<bool>& interrupted)
    : fd_(fd), interrupted_(interrupted) {
    setg(buffer_.data(), buffer_.data(), buffer_.data());
}

InterruptibleFdBuf::int_type InterruptibleFdBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    while (!interrupted_.load()) {
        pollfd pfd{fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, kPollSliceMs);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "poll(input)");
        }
        if (rc == 0) {
            continue;
        }

        ssize_t n = ::read(fd_, buffer_.data(), buffer_.size());
        if (n > 0) {
            setg(buffer_.data(), buffer_.data(), buffer_.data() + n);
            return traits_type::to_int_type(*gptr());
        }
        if (n == 0) {
            return traits_type::eof();
        }
        if (errno == EINTR || errno == EAGAIN) {
            continue;
        }
        throw std::system_error(errno, std::generic_category(), "read(input)");
    }
    return traits_type::eof();
}

std::atomic<bool>& install_interrupt_handlers() {
    struct sigaction sa {};
    sa.sa_handler = handle_interrupt;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    return g_interrupted;
}

StdioServer::StdioServer(std::istream& in, std::ostream& out, RequestHandler handler,
                         const std::atomic<bool>& interrupted)
    : in_(in), out_(out), handler_(std::move(handler)), interrupted_(interrupted) {}

int StdioServer::run() {
    LOG4CPLUS_INFO(core_logger(), "Waiting for requests on stdin");

    try {
        std::string line;
        while (!interrupted_.load()) {
            if (!std::getline(in_, line)) {
                if (in_.eof() || interrupted_.load()) {
                    break;
                }
                throw std::runtime_error("failed to read from input stream");
            }
            if (interrupted_.load()) {
                break;
            }
            process_line(line);
        }
    } catch (const std::exception& exc) {
        LOG4CPLUS_FATAL(core_logger(), "Fatal error: " << exc.what());
        write_response(codec::make_error(nullptr, ErrorCode::InternalError, std::string("Fatal error: ") + exc.what()));
        return 1;
    }

    if (interrupted_.load()) {
        LOG4CPLUS_INFO(core_logger(), "Interrupted, shutting down");
    } else {
        LOG4CPLUS_INFO(core_logger(), "End of input, shutting down");
    }
    return 0;
}

bool StdioServer::process_line(const std::string& line) {
    if (is_blank(line)) {
        return false;
    }

    Request request;
    try {
        request = codec::decode_request(line);
    } catch (const codec::DecodeError& exc) {
        LOG4CPLUS_WARN(core_logger(), "Parse error: " << exc.what());
        write_response(codec::make_error(nullptr, ErrorCode::ParseError, std::string("Parse error: ") + exc.what()));
        return true;
    }

    write_response(handler_(request));
    return true;
}

void StdioServer::write_response(const Response& response) {
    out_ << codec::encode_response(response) << '\n';
    out_.flush();
}

} // namespace mcp
