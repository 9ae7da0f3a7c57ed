#include "progviz/common/text_utils.hpp"

namespace progviz {
namespace common {

static size_t sequenceLength(unsigned char lead) {
    if ((lead & 0x80) == 0) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

size_t countCodePoints(const std::string& text) {
    size_t count = 0;

    for (size_t i = 0; i < text.length(); ++count) {
        size_t utf8_len = sequenceLength(static_cast<unsigned char>(text[i]));

        bool valid = utf8_len > 0 && i + utf8_len <= text.length();
        for (size_t j = 1; valid && j < utf8_len; ++j) {
            if ((static_cast<unsigned char>(text[i + j]) & 0xC0) != 0x80) {
                valid = false;
            }
        }

        i += valid ? utf8_len : 1;
    }

    return count;
}

// Strict decode of the sequence at offset; returns its length, or 0 for overlong forms,
// surrogates, values past U+10FFFF and broken sequences.
static size_t decodeCodePoint(const std::string& text, size_t offset, char32_t& code_point) {
    unsigned char lead = static_cast<unsigned char>(text[offset]);
    size_t utf8_len = sequenceLength(lead);
    if (utf8_len == 0 || offset + utf8_len > text.length()) {
        return 0;
    }

    static const char32_t lead_masks[] = {0, 0x7F, 0x1F, 0x0F, 0x07};
    static const char32_t min_values[] = {0, 0, 0x80, 0x800, 0x10000};

    code_point = lead & lead_masks[utf8_len];
    for (size_t j = 1; j < utf8_len; ++j) {
        unsigned char next = static_cast<unsigned char>(text[offset + j]);
        if ((next & 0xC0) != 0x80) {
            return 0;
        }
        code_point = (code_point << 6) | (next & 0x3F);
    }

    if (code_point < min_values[utf8_len] || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return 0;
    }
    return utf8_len;
}

static bool isControl(char32_t code_point) {
    return code_point < 0x20 || (code_point >= 0x7F && code_point <= 0x9F);
}

bool isSingleCharacter(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    char32_t code_point = 0;
    size_t utf8_len = decodeCodePoint(text, 0, code_point);
    return utf8_len == text.length() && !isControl(code_point);
}

std::string repeat(const std::string& unit, size_t count) {
    std::string result;
    result.reserve(unit.size() * count);
    for (size_t i = 0; i < count; ++i) {
        result += unit;
    }
    return result;
}

}}
