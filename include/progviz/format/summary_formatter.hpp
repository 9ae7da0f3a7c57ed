#pragma once

#include "progviz/core/run_controller.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace progviz {
namespace format {

enum class SummaryFormat {
    NONE,
    TEXT,
    JSON
};

std::optional<SummaryFormat> parseSummaryFormat(const std::string& name);

class SummaryFormatter {
public:
    static nlohmann::json toJson(const core::RunSummary& summary);
    static std::string toText(const core::RunSummary& summary);
    static std::string format(const core::RunSummary& summary, SummaryFormat format);
};

}}
