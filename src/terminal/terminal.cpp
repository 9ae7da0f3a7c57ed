#include "progviz/terminal/terminal.hpp"
#include "progviz/common/error_codes.hpp"
#include "progviz/common/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <termios.h>

namespace progviz {
namespace terminal {

namespace {

// Non-canonical, no-echo input for the lifetime of one cursor query.
class RawModeGuard {
public:
    explicit RawModeGuard(int fd) : fd_(fd) {
        if (tcgetattr(fd_, &old_) != 0) {
            common::ErrorContext ctx;
            ctx.component = "Terminal";
            ctx.details["error"] = std::strerror(errno);
            throw common::TerminalError(common::VisualizerErrorCode::TERMINAL_QUERY_FAILED,
                                        "Cannot read terminal attributes", ctx);
        }
        termios raw = old_;
        raw.c_lflag &= ~(ICANON | ECHO);
        raw.c_cc[VMIN] = 0;
        raw.c_cc[VTIME] = 0;
        active_ = tcsetattr(fd_, TCSANOW, &raw) == 0;
    }

    ~RawModeGuard() {
        if (active_) {
            tcsetattr(fd_, TCSANOW, &old_);
        }
    }

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

private:
    int fd_;
    termios old_{};
    bool active_ = false;
};

std::string printable(const std::string& raw) {
    std::string result;
    for (char c : raw) {
        if (c == '\033') {
            result += "\\e";
        } else {
            result += c;
        }
    }
    return result;
}

}

PosixTerminal::PosixTerminal() : PosixTerminal(std::cout) {}

PosixTerminal::PosixTerminal(std::ostream& out, PosixTerminalOptions options)
    : out_(out), options_(options) {
}

bool PosixTerminal::isInteractive() const {
    return ::isatty(options_.input_fd) == 1;
}

void PosixTerminal::write(const std::string& data) {
    out_ << data;
    if (!out_) {
        throw common::TerminalError(common::VisualizerErrorCode::TERMINAL_WRITE_FAILED);
    }
}

void PosixTerminal::flush() {
    out_.flush();
    if (!out_) {
        throw common::TerminalError(common::VisualizerErrorCode::TERMINAL_WRITE_FAILED);
    }
}

CursorPosition PosixTerminal::queryCursorPosition() {
    if (!isInteractive()) {
        common::ErrorContext ctx;
        ctx.component = "Terminal";
        ctx.details["fd"] = std::to_string(options_.input_fd);
        throw common::TerminalError(common::VisualizerErrorCode::TERMINAL_NOT_INTERACTIVE, ctx);
    }

    RawModeGuard raw_mode(options_.input_fd);

    int attempts = std::max(1, options_.query_attempts);
    std::string last_response;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        write(escape::queryCursor());
        flush();

        std::string response = readResponse();
        if (auto pos = parseCursorReport(response)) {
            return *pos;
        }

        if (!response.empty()) {
            last_response = response;
        }
        common::Logger::instance().warn("[Terminal] Cursor query unanswered | attempt={}/{} | bytes={}",
                                        attempt, attempts, response.size());
    }

    common::ErrorContext ctx;
    ctx.component = "Terminal";
    ctx.details["attempts"] = std::to_string(attempts);

    if (last_response.empty()) {
        ctx.details["timeout_ms"] = std::to_string(options_.response_timeout.count());
        throw common::TerminalError(common::VisualizerErrorCode::TERMINAL_QUERY_FAILED, ctx);
    }

    ctx.details["response"] = printable(last_response);
    throw common::TerminalError(common::VisualizerErrorCode::TERMINAL_RESPONSE_MALFORMED, ctx);
}

std::string PosixTerminal::readResponse() {
    std::string buffer;
    auto deadline = std::chrono::steady_clock::now() + options_.response_timeout;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        struct pollfd pfd{};
        pfd.fd = options_.input_fd;
        pfd.events = POLLIN;

        int rv = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rv < 0) {
            if (errno == EINTR) continue;
            common::ErrorContext ctx;
            ctx.component = "Terminal";
            ctx.details["error"] = std::strerror(errno);
            throw common::TerminalError(common::VisualizerErrorCode::TERMINAL_QUERY_FAILED,
                                        "Polling terminal input failed", ctx);
        }
        if (rv == 0 || !(pfd.revents & POLLIN)) {
            break;
        }

        char chunk[64];
        ssize_t n = ::read(options_.input_fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            common::ErrorContext ctx;
            ctx.component = "Terminal";
            ctx.details["error"] = std::strerror(errno);
            throw common::TerminalError(common::VisualizerErrorCode::TERMINAL_QUERY_FAILED,
                                        "Reading terminal input failed", ctx);
        }
        if (n == 0) {
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));
        if (buffer.find('R') != std::string::npos && parseCursorReport(buffer)) {
            break;
        }
    }

    return buffer;
}

}}
