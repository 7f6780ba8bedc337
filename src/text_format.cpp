#include "text_format.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pfv {

namespace {

// Fixed notation inside this magnitude range, exponent notation outside it.
constexpr double kFixedNotationMin = 1e-6;
constexpr double kFixedNotationMax = 1e21;

// "1e-07" -> "1e-7", "1.5e+21" -> "1.5e+21".
std::string trimExponent(const std::string& text) {
    const auto ePos = text.find('e');
    if (ePos == std::string::npos || ePos + 2 >= text.size()) {
        return text;
    }
    std::string mantissa = text.substr(0, ePos + 2);
    std::string digits = text.substr(ePos + 2);
    const auto firstNonZero = digits.find_first_not_of('0');
    digits = firstNonZero == std::string::npos ? "0" : digits.substr(firstNonZero);
    return mantissa + digits;
}

} // namespace

std::string formatNumber(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("cannot format a non-finite number");
    }
    if (value == 0.0) {
        return "0";
    }

    const double magnitude = std::abs(value);
    const bool fixed = magnitude >= kFixedNotationMin && magnitude < kFixedNotationMax;

    std::array<char, 128> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(),
                                   buffer.data() + buffer.size(),
                                   value,
                                   fixed ? std::chars_format::fixed : std::chars_format::scientific);
    if (ec != std::errc()) {
        throw std::runtime_error("number formatting failed");
    }
    std::string text(buffer.data(), end);
    return fixed ? text : trimExponent(text);
}

std::string jsonString(const std::string& value) {
    std::ostringstream oss;
    oss << '"';
    for (unsigned char c : value) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\b':
            oss << "\\b";
            break;
        case '\f':
            oss << "\\f";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (c < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                    << std::dec << std::setfill(' ');
            } else {
                oss << static_cast<char>(c);
            }
        }
    }
    oss << '"';
    return oss.str();
}

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::uint64_t parseUnsigned(const std::string& text, const std::string& what) {
    const std::string value = trim(text);
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(what + " must be an unsigned integer, got \"" + text + "\"");
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(what + " is out of range: " + value);
    }
}

double parseDecimal(const std::string& text, const std::string& what) {
    const std::string value = trim(text);
    std::size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(what + " must be a number, got \"" + text + "\"");
    }
    if (consumed != value.size() || !std::isfinite(parsed)) {
        throw std::invalid_argument(what + " must be a finite number, got \"" + text + "\"");
    }
    return parsed;
}

} // namespace pfv
