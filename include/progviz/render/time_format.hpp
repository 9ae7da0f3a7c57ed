#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace progviz {
namespace render {

struct DurationBreakdown {
    int64_t years = 0;
    int64_t months = 0;
    int64_t weeks = 0;
    int64_t days = 0;
    int64_t hours = 0;
    int64_t minutes = 0;
    int64_t seconds = 0;
};

// Fixed display constants: 60s, 60m, 24h, 7d, 4w per month, 12mo per year.
DurationBreakdown breakDown(int64_t total_seconds);

std::string formatDuration(double seconds);
std::string formatDuration(std::chrono::duration<double> duration);

}}
