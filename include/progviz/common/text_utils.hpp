#pragma once

#include <string>
#include <cstddef>

namespace progviz {
namespace common {

// Counts UTF-8 code points; bytes that do not start a valid sequence count as one each.
size_t countCodePoints(const std::string& text);

// Exactly one well-formed, printable code point: no controls, overlong forms or surrogates.
bool isSingleCharacter(const std::string& text);

std::string repeat(const std::string& unit, size_t count);

}}
