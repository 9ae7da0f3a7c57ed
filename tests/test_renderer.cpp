#include "progviz/render/progress_renderer.hpp"
#include "progviz/common/error_codes.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace progviz;
using render::BarConfig;
using render::ProgressRenderer;
using render::ProgressSnapshot;

namespace {

ProgressSnapshot snapshot(size_t current, size_t total, double elapsed_seconds) {
    ProgressSnapshot s;
    s.current = current;
    s.total = total;
    s.elapsed = std::chrono::duration<double>(elapsed_seconds);
    return s;
}

BarConfig tenWide() {
    BarConfig config;
    config.bar_length = 10;
    return config;
}

}

TEST(RendererTest, FillAlwaysSumsToBarLength) {
    for (int bar_length : {1, 7, 50}) {
        for (size_t total = 1; total <= 40; ++total) {
            for (size_t progress = 0; progress <= total; ++progress) {
                auto fill = render::computeFill(bar_length, progress, total);
                EXPECT_EQ(fill.filled + fill.pending, static_cast<size_t>(bar_length));
                auto expected = static_cast<size_t>(
                    std::floor(static_cast<double>(bar_length) * progress / static_cast<double>(total)));
                EXPECT_EQ(fill.filled, expected) << "progress=" << progress << " total=" << total;
            }
        }
    }
}

TEST(RendererTest, PercentageIsMonotonicAndEndsAtHundred) {
    for (size_t total : {1u, 3u, 7u, 101u}) {
        double previous = -1.0;
        for (size_t progress = 0; progress <= total; ++progress) {
            double pct = render::computePercentage(progress, total);
            EXPECT_GE(pct, previous);
            previous = pct;
        }
        EXPECT_DOUBLE_EQ(render::computePercentage(total, total), 100.0);
    }
    EXPECT_DOUBLE_EQ(render::computePercentage(1, 3), 33.33);
    EXPECT_DOUBLE_EQ(render::computePercentage(2, 3), 66.67);
}

TEST(RendererTest, InProgressLineLayout) {
    ProgressRenderer renderer(tenWide());
    std::string line = renderer.renderLine(snapshot(3, 10, 3.0), "Load", true);

    std::string expected = "\r\033[2K"
                           "Load: [\033[35m===       \033[0m] "
                           "\033[0m30.00%\033[0m "
                           "\033[0m(3/10)\033[0m "
                           "\033[0mETA: 7s\033[0m "
                           "\033[999C";
    EXPECT_EQ(line, expected);
}

TEST(RendererTest, CompletedLineSwitchesToDoneColorAndElapsed) {
    ProgressRenderer renderer(tenWide());
    std::string line = renderer.renderLine(snapshot(10, 10, 12.5), "Load", true);

    std::string expected = "\r\033[2K"
                           "Load: [\033[32m==========\033[0m] "
                           "\033[32m100.00%\033[0m "
                           "\033[32m(10/10)\033[0m "
                           "\033[32mElapsed: 12s\033[0m "
                           "\033[999C";
    EXPECT_EQ(line, expected);
    EXPECT_EQ(line.find("ETA"), std::string::npos);
}

TEST(RendererTest, TimeFieldOmittedWhenDisabled) {
    ProgressRenderer renderer(tenWide());
    std::string line = renderer.renderLine(snapshot(5, 10, 4.0), "Load", false);
    EXPECT_EQ(line.find("ETA"), std::string::npos);
    EXPECT_EQ(line.find("Elapsed"), std::string::npos);
}

TEST(RendererTest, NoEtaBeforeFirstItem) {
    ProgressRenderer renderer(tenWide());
    EXPECT_FALSE(render::estimateRemaining(snapshot(0, 10, 5.0)).has_value());
    EXPECT_EQ(renderer.renderTimeField(snapshot(0, 10, 5.0)), "");
    EXPECT_EQ(renderer.renderLine(snapshot(0, 10, 5.0), "Load", true).find("ETA"), std::string::npos);
}

TEST(RendererTest, EtaProjectsLinearly) {
    auto eta = render::estimateRemaining(snapshot(25, 100, 10.0));
    ASSERT_TRUE(eta.has_value());
    EXPECT_DOUBLE_EQ(eta->count(), 30.0);
}

TEST(RendererTest, CustomColorsAndMultiByteFill) {
    BarConfig config;
    config.bar_length = 4;
    config.done_color = terminal::ColorName::CYAN;
    config.progress_color = terminal::ColorName::YELLOW;
    config.fill_char = "\xe2\x96\x88";
    ProgressRenderer renderer(config);

    EXPECT_EQ(renderer.renderBar(snapshot(2, 4, 1.0)),
              "[\033[33m\xe2\x96\x88\xe2\x96\x88  \033[0m]");
    EXPECT_EQ(renderer.barColor(snapshot(4, 4, 1.0)), terminal::ColorName::CYAN);
    EXPECT_EQ(renderer.textColor(snapshot(3, 4, 1.0)), terminal::ColorName::RESET);
}

TEST(RendererTest, RejectsBadConfiguration) {
    BarConfig two_chars;
    two_chars.fill_char = "==";
    try {
        ProgressRenderer renderer(two_chars);
        FAIL() << "expected ConfigError";
    } catch (const common::ConfigError& e) {
        EXPECT_EQ(e.code(), common::VisualizerErrorCode::CONFIG_INVALID_FILL_CHAR);
    }

    BarConfig empty_fill;
    empty_fill.fill_char = "";
    EXPECT_THROW(ProgressRenderer{empty_fill}, common::ConfigError);

    BarConfig escape_fill;
    escape_fill.fill_char = "\033";
    EXPECT_THROW(ProgressRenderer{escape_fill}, common::ConfigError);

    BarConfig overlong_fill;
    overlong_fill.fill_char = "\xc0\x80";
    EXPECT_THROW(ProgressRenderer{overlong_fill}, common::ConfigError);

    BarConfig zero_length;
    zero_length.bar_length = 0;
    EXPECT_THROW(ProgressRenderer{zero_length}, common::ConfigError);
}
