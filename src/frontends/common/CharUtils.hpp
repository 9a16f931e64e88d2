//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/CharUtils.hpp
// Purpose: ASCII character classification used by the lexer.
//
// The source language is ASCII-only; every byte outside these classes is an
// unknown character for the lexer to report.
//
//===----------------------------------------------------------------------===//
#pragma once

namespace zaban::frontends::common::char_utils
{

/// @brief Check if character is a decimal digit (0-9).
[[nodiscard]] constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Check if character is a hex digit (0-9, A-F, a-f).
[[nodiscard]] constexpr bool isHexDigit(char c) noexcept
{
    return isDigit(c) || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f');
}

/// @brief Identifiers start with an ASCII letter or underscore.
[[nodiscard]] constexpr bool isIdentifierStart(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

[[nodiscard]] constexpr bool isIdentifierContinue(char c) noexcept
{
    return isIdentifierStart(c) || isDigit(c);
}

/// @brief Space, tab, CR, LF, form feed or vertical tab.
[[nodiscard]] constexpr bool isWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

/// @brief Combine two hex digits, as in a `\xHH` escape, into one byte.
/// @pre isHexDigit(hi) && isHexDigit(lo)
[[nodiscard]] constexpr char hexByte(char hi, char lo) noexcept
{
    auto nibble = [](char c) -> int
    {
        if (isDigit(c))
            return c - '0';
        return (c | 0x20) - 'a' + 10;
    };
    return static_cast<char>(nibble(hi) * 16 + nibble(lo));
}

static_assert(hexByte('4', '1') == 'A');
static_assert(hexByte('0', 'a') == '\n' && hexByte('0', 'A') == '\n');

} // namespace zaban::frontends::common::char_utils
