#pragma once

#include <cstdint>
#include <string>

namespace pfv {

// Shortest decimal text that reads back as the same double, in JavaScript
// number notation ("42.37", "2", "100000", "1e-7", "1e+21").
std::string formatNumber(double value);

// Quotes and escapes `value` as a JSON string literal.
std::string jsonString(const std::string& value);

std::string trim(const std::string& value);

// Whole-string decimal parsers; throw std::invalid_argument naming `what`.
std::uint64_t parseUnsigned(const std::string& text, const std::string& what);
double parseDecimal(const std::string& text, const std::string& what);

} // namespace pfv
