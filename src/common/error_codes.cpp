#include "progviz/common/error_codes.hpp"
#include <utility>

namespace progviz {
namespace common {

static std::string buildMessage(const std::string& message, const ErrorContext& context) {
    std::string result = message;
    std::string details = formatContext(context);
    if (!details.empty()) {
        result += " | " + details;
    }
    return result;
}

VisualizerError::VisualizerError(VisualizerErrorCode code, const std::string& message, ErrorContext context)
    : std::runtime_error(buildMessage(message, context)),
      code_(code),
      context_(std::move(context)) {
}

VisualizerError::VisualizerError(VisualizerErrorCode code, ErrorContext context)
    : VisualizerError(code, VisualizerErrorCodeHelper::getMessage(code), std::move(context)) {
}

}}
