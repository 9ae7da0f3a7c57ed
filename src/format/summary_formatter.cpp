#include "progviz/format/summary_formatter.hpp"
#include "progviz/render/time_format.hpp"
#include <spdlog/fmt/fmt.h>

namespace progviz {
namespace format {

std::optional<SummaryFormat> parseSummaryFormat(const std::string& name) {
    if (name == "none") return SummaryFormat::NONE;
    if (name == "text") return SummaryFormat::TEXT;
    if (name == "json") return SummaryFormat::JSON;
    return std::nullopt;
}

nlohmann::json SummaryFormatter::toJson(const core::RunSummary& summary) {
    nlohmann::json json;
    json["items"] = summary.items;
    json["total"] = summary.total;
    json["renders"] = summary.renders;
    json["elapsed_ms"] = summary.elapsed.count();
    json["completed"] = summary.completed;
    return json;
}

std::string SummaryFormatter::toText(const core::RunSummary& summary) {
    std::chrono::duration<double> elapsed = summary.elapsed;
    return fmt::format("{} {}/{} items in {} ({} renders)",
                       summary.completed ? "Completed" : "Stopped",
                       summary.items, summary.total,
                       render::formatDuration(elapsed), summary.renders);
}

std::string SummaryFormatter::format(const core::RunSummary& summary, SummaryFormat format) {
    switch (format) {
        case SummaryFormat::TEXT: return toText(summary);
        case SummaryFormat::JSON: return toJson(summary).dump(2);
        case SummaryFormat::NONE: return "";
    }
    return "";
}

}}
