#include "progviz/terminal/terminal.hpp"
#include <regex>

namespace progviz {
namespace terminal {

namespace escape {

std::string queryCursor() {
    return "\033[6n";
}

std::string moveTo(const CursorPosition& pos) {
    return "\033[" + std::to_string(pos.row) + ";" + std::to_string(pos.col) + "H";
}

std::string clearLine() {
    return "\r\033[2K";
}

std::string cursorToLineEnd() {
    return "\033[999C";
}

}

std::optional<CursorPosition> parseCursorReport(const std::string& response) {
    static const std::regex report_pattern("\x1b\\[(\\d{1,5});(\\d{1,5})R");

    std::optional<CursorPosition> result;
    auto begin = std::sregex_iterator(response.begin(), response.end(), report_pattern);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        CursorPosition pos;
        pos.row = std::stoi((*it)[1].str());
        pos.col = std::stoi((*it)[2].str());
        if (pos.row > 0 && pos.col > 0) {
            result = pos;
        }
    }
    return result;
}

}}
