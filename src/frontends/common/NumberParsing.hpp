//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/NumberParsing.hpp
// Purpose: Validation and conversion of decimal numeric literal spellings.
//
// The lexer collects a maximal numeric-looking run and hands it here; every
// rejection carries a short reason that becomes the diagnostic message.
//
// Accepted forms:
//   integer  := "0" | [1-9][0-9]*
//   float    := integer? "." [0-9]+ exponent? | integer exponent
//   exponent := [eE] [+-]? [0-9]+
//
//===----------------------------------------------------------------------===//
#pragma once

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>

#include "frontends/common/CharUtils.hpp"

namespace zaban::frontends::common::number_parsing
{

/// @brief Result of parsing a numeric literal.
struct ParsedNumber
{
    bool isFloat = false;    ///< True if number has decimal point or exponent
    int64_t intValue = 0;    ///< Integer value (valid when !isFloat)
    double floatValue = 0.0; ///< Float value (valid when isFloat)
    bool overflow = false;   ///< True if value does not fit the target type
    bool valid = true;       ///< True if parsing succeeded
    std::string error;       ///< Reason for rejection when !valid
};

/// @brief Check if a character is a valid exponent indicator.
[[nodiscard]] constexpr bool isExponentChar(char c) noexcept
{
    return c == 'e' || c == 'E';
}

/// @brief Check if a character is a sign for exponent.
[[nodiscard]] constexpr bool isSignChar(char c) noexcept
{
    return c == '+' || c == '-';
}

/// @brief Validate and convert a decimal literal spelling.
/// @param text The full run collected by the lexer.
/// @return ParsedNumber; when !valid, @c error names the first fault.
[[nodiscard]] inline ParsedNumber parseDecimalLiteral(std::string_view text)
{
    using char_utils::isDigit;

    ParsedNumber result;
    auto fail = [&result](std::string reason) {
        result.valid = false;
        result.error = std::move(reason);
        return result;
    };

    std::size_t i = 0;
    const std::size_t n = text.size();

    const std::size_t intStart = i;
    while (i < n && isDigit(text[i]))
        ++i;
    const std::size_t intDigits = i - intStart;
    if (intDigits > 1 && text[intStart] == '0')
        return fail("leading zeros are not allowed in numeric literal '" + std::string(text) +
                    "'");

    bool hasFraction = false;
    if (i < n && text[i] == '.')
    {
        ++i;
        const std::size_t fracStart = i;
        while (i < n && isDigit(text[i]))
            ++i;
        if (i == fracStart)
            return fail("expected digits after decimal point in '" + std::string(text) + "'");
        hasFraction = true;
    }
    if (intDigits == 0 && !hasFraction)
        return fail("malformed numeric literal '" + std::string(text) + "'");

    bool hasExponent = false;
    if (i < n && isExponentChar(text[i]))
    {
        ++i;
        if (i < n && isSignChar(text[i]))
            ++i;
        const std::size_t expStart = i;
        while (i < n && isDigit(text[i]))
            ++i;
        if (i == expStart)
            return fail("malformed exponent in numeric literal '" + std::string(text) + "'");
        hasExponent = true;
    }

    if (i < n)
    {
        if (text[i] == '.')
            return fail("too many decimal points in numeric literal '" + std::string(text) + "'");
        return fail("invalid character '" + std::string(1, text[i]) + "' in numeric literal '" +
                    std::string(text) + "'");
    }

    result.isFloat = hasFraction || hasExponent;
    if (result.isFloat)
    {
        std::string textStr(text);
        result.floatValue = std::strtod(textStr.c_str(), nullptr);
        if (std::isinf(result.floatValue))
        {
            result.overflow = true;
            return fail("float literal '" + textStr + "' is out of range");
        }
        return result;
    }

    uint64_t unsignedValue = 0;
    auto parseResult = std::from_chars(text.data(), text.data() + n, unsignedValue);
    if (parseResult.ec == std::errc::result_out_of_range ||
        unsignedValue > static_cast<uint64_t>(INT64_MAX))
    {
        result.overflow = true;
        return fail("integer literal '" + std::string(text) + "' does not fit in 64 bits");
    }
    if (parseResult.ec != std::errc{})
        return fail("malformed numeric literal '" + std::string(text) + "'");
    result.intValue = static_cast<int64_t>(unsignedValue);
    return result;
}

} // namespace zaban::frontends::common::number_parsing
