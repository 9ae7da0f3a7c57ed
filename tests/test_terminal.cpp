#include "progviz/terminal/terminal.hpp"
#include "progviz/common/error_codes.hpp"
#include <gtest/gtest.h>
#include <pty.h>
#include <sstream>
#include <termios.h>
#include <unistd.h>

using namespace progviz;
using terminal::CursorPosition;

TEST(CursorReportTest, ParsesPlainReport) {
    auto pos = terminal::parseCursorReport("\x1b[12;40R");
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->row, 12);
    EXPECT_EQ(pos->col, 40);
}

TEST(CursorReportTest, IgnoresStrayInputBeforeReport) {
    auto pos = terminal::parseCursorReport("abc\x1b[3;4R");
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(*pos, (CursorPosition{3, 4}));

    auto last = terminal::parseCursorReport("\x1b[1;1R\x1b[7;9R");
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(*last, (CursorPosition{7, 9}));
}

TEST(CursorReportTest, RejectsMalformedReports) {
    EXPECT_FALSE(terminal::parseCursorReport("").has_value());
    EXPECT_FALSE(terminal::parseCursorReport("\x1b[12R").has_value());
    EXPECT_FALSE(terminal::parseCursorReport("\x1b[12;R").has_value());
    EXPECT_FALSE(terminal::parseCursorReport("[12;4R").has_value());
    EXPECT_FALSE(terminal::parseCursorReport("\x1b[0;5R").has_value());
    EXPECT_FALSE(terminal::parseCursorReport("\x1b[4;5").has_value());
}

TEST(EscapeTest, Sequences) {
    EXPECT_EQ(terminal::escape::queryCursor(), "\033[6n");
    EXPECT_EQ(terminal::escape::moveTo(CursorPosition{3, 7}), "\033[3;7H");
    EXPECT_EQ(terminal::escape::clearLine(), "\r\033[2K");
    EXPECT_EQ(terminal::escape::cursorToLineEnd(), "\033[999C");
}

TEST(PosixTerminalTest, WritesThroughOutputStream) {
    std::ostringstream out;
    terminal::PosixTerminal term(out);
    term.write("abc");
    term.write("\033[1;1H");
    term.flush();
    EXPECT_EQ(out.str(), "abc\033[1;1H");
}

TEST(PosixTerminalTest, FailedStreamRaisesWriteError) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    terminal::PosixTerminal term(out);
    try {
        term.write("x");
        FAIL() << "expected TerminalError";
    } catch (const common::TerminalError& e) {
        EXPECT_EQ(e.code(), common::VisualizerErrorCode::TERMINAL_WRITE_FAILED);
    }
}

TEST(PosixTerminalTest, QueryOnNonTerminalInputFailsWithoutOutput) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);

    std::ostringstream out;
    terminal::PosixTerminalOptions options;
    options.input_fd = fds[0];
    terminal::PosixTerminal term(out, options);

    EXPECT_FALSE(term.isInteractive());
    try {
        term.queryCursorPosition();
        FAIL() << "expected TerminalError";
    } catch (const common::TerminalError& e) {
        EXPECT_EQ(e.code(), common::VisualizerErrorCode::TERMINAL_NOT_INTERACTIVE);
    }
    EXPECT_TRUE(out.str().empty());

    close(fds[0]);
    close(fds[1]);
}

class PtyTerminalTest : public ::testing::Test {
protected:
    int master_ = -1;
    int slave_ = -1;
    std::ostringstream out_;

    void SetUp() override {
        ASSERT_EQ(openpty(&master_, &slave_, nullptr, nullptr, nullptr), 0);
    }

    void TearDown() override {
        if (master_ >= 0) close(master_);
        if (slave_ >= 0) close(slave_);
    }

    void makeSlaveRaw() {
        termios attrs{};
        ASSERT_EQ(tcgetattr(slave_, &attrs), 0);
        cfmakeraw(&attrs);
        ASSERT_EQ(tcsetattr(slave_, TCSANOW, &attrs), 0);
    }

    void reply(const std::string& bytes) {
        ASSERT_EQ(::write(master_, bytes.data(), bytes.size()), static_cast<ssize_t>(bytes.size()));
    }

    terminal::PosixTerminal makeTerminal(int attempts) {
        terminal::PosixTerminalOptions options;
        options.input_fd = slave_;
        options.response_timeout = std::chrono::milliseconds(30);
        options.query_attempts = attempts;
        return terminal::PosixTerminal(out_, options);
    }

    size_t queriesSent() const {
        std::string sent = out_.str();
        std::string query = terminal::escape::queryCursor();
        size_t count = 0;
        for (size_t pos = sent.find(query); pos != std::string::npos; pos = sent.find(query, pos + 1)) {
            ++count;
        }
        return count;
    }
};

TEST_F(PtyTerminalTest, ReadsReportAfterStrayKeystrokes) {
    makeSlaveRaw();
    reply("x\x1b[7;3R");

    auto term = makeTerminal(2);
    EXPECT_TRUE(term.isInteractive());
    EXPECT_EQ(term.queryCursorPosition(), (CursorPosition{7, 3}));
    EXPECT_EQ(queriesSent(), 1u);
}

TEST_F(PtyTerminalTest, SilentTerminalFailsAfterEveryAttempt) {
    makeSlaveRaw();

    auto term = makeTerminal(3);
    try {
        term.queryCursorPosition();
        FAIL() << "expected TerminalError";
    } catch (const common::TerminalError& e) {
        EXPECT_EQ(e.code(), common::VisualizerErrorCode::TERMINAL_QUERY_FAILED);
        EXPECT_EQ(e.context().details.at("attempts"), "3");
    }
    EXPECT_EQ(queriesSent(), 3u);
}

TEST_F(PtyTerminalTest, JunkReplyIsMalformedEvenIfLaterAttemptsAreSilent) {
    makeSlaveRaw();
    reply("junk");

    auto term = makeTerminal(2);
    try {
        term.queryCursorPosition();
        FAIL() << "expected TerminalError";
    } catch (const common::TerminalError& e) {
        EXPECT_EQ(e.code(), common::VisualizerErrorCode::TERMINAL_RESPONSE_MALFORMED);
        EXPECT_EQ(e.context().details.at("response"), "junk");
    }
    EXPECT_EQ(queriesSent(), 2u);
}

TEST_F(PtyTerminalTest, RestoresTerminalModeAfterQuery) {
    termios before{};
    ASSERT_EQ(tcgetattr(slave_, &before), 0);
    before.c_lflag |= ICANON | ECHO;
    ASSERT_EQ(tcsetattr(slave_, TCSANOW, &before), 0);

    auto term = makeTerminal(1);
    EXPECT_THROW(term.queryCursorPosition(), common::TerminalError);

    termios after{};
    ASSERT_EQ(tcgetattr(slave_, &after), 0);
    EXPECT_TRUE(after.c_lflag & ICANON);
    EXPECT_TRUE(after.c_lflag & ECHO);
}
