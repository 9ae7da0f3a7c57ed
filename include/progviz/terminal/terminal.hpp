#pragma once

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>
#include <unistd.h>

namespace progviz {
namespace terminal {

struct CursorPosition {
    int row = 1;
    int col = 1;

    bool operator==(const CursorPosition& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const CursorPosition& other) const { return !(*this == other); }
};

namespace escape {

std::string queryCursor();
std::string moveTo(const CursorPosition& pos);
std::string clearLine();
std::string cursorToLineEnd();

}

// Accepts the last "ESC[row;colR" report in the buffer; anything before it is ignored.
std::optional<CursorPosition> parseCursorReport(const std::string& response);

class Terminal {
public:
    virtual ~Terminal() = default;

    virtual void write(const std::string& data) = 0;
    virtual void flush() = 0;
    virtual CursorPosition queryCursorPosition() = 0;
};

struct PosixTerminalOptions {
    int input_fd = STDIN_FILENO;
    std::chrono::milliseconds response_timeout{100};
    int query_attempts = 2;
};

class PosixTerminal : public Terminal {
public:
    PosixTerminal();
    explicit PosixTerminal(std::ostream& out, PosixTerminalOptions options = {});

    void write(const std::string& data) override;
    void flush() override;
    CursorPosition queryCursorPosition() override;

    bool isInteractive() const;

private:
    std::ostream& out_;
    PosixTerminalOptions options_;

    std::string readResponse();
};

}}
