//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/urdu/DiagnosticCodes.hpp
// Purpose: Diagnostic kinds and their stable codes.
// Key invariants: All codes are unique and follow Z#### format:
//                 Z1xxx lexical, Z2xxx syntax, Z9xxx warnings.
// Ownership/Lifetime: Static constants with program lifetime
// Links: docs/frontend.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <string_view>

namespace zaban::frontends::urdu
{

/// @brief Closed set of frontend diagnostic kinds.
enum class DiagKind
{
    // Lexical errors
    UnterminatedString,
    UnterminatedChar,
    InvalidEscapeSequence,
    InvalidNumberFormat,
    UnknownCharacter,

    // Syntax errors
    UnexpectedToken,
    MissingToken,
    UnexpectedEOF,
    NestingTooDeep,

    // Warnings
    EmptyStatement,
};

namespace diag
{
/// Lexical error codes (Z1000-Z1999)
constexpr std::string_view UnterminatedString = "Z1001";
constexpr std::string_view UnterminatedChar = "Z1002";
constexpr std::string_view InvalidEscapeSequence = "Z1003";
constexpr std::string_view InvalidNumberFormat = "Z1004";
constexpr std::string_view UnknownCharacter = "Z1005";

/// Syntax error codes (Z2000-Z2999)
constexpr std::string_view UnexpectedToken = "Z2001";
constexpr std::string_view MissingToken = "Z2002";
constexpr std::string_view UnexpectedEOF = "Z2003";
constexpr std::string_view NestingTooDeep = "Z2004";

/// Warning codes (Z9000-Z9999)
constexpr std::string_view EmptyStatement = "Z9001";
} // namespace diag

/// @brief Stable code for @p kind.
constexpr std::string_view diagCode(DiagKind kind)
{
    switch (kind)
    {
        case DiagKind::UnterminatedString:
            return diag::UnterminatedString;
        case DiagKind::UnterminatedChar:
            return diag::UnterminatedChar;
        case DiagKind::InvalidEscapeSequence:
            return diag::InvalidEscapeSequence;
        case DiagKind::InvalidNumberFormat:
            return diag::InvalidNumberFormat;
        case DiagKind::UnknownCharacter:
            return diag::UnknownCharacter;
        case DiagKind::UnexpectedToken:
            return diag::UnexpectedToken;
        case DiagKind::MissingToken:
            return diag::MissingToken;
        case DiagKind::UnexpectedEOF:
            return diag::UnexpectedEOF;
        case DiagKind::NestingTooDeep:
            return diag::NestingTooDeep;
        case DiagKind::EmptyStatement:
            return diag::EmptyStatement;
    }
    return "Z0000";
}

/// @brief Severity implied by @p kind.
constexpr support::Severity diagSeverity(DiagKind kind)
{
    return kind == DiagKind::EmptyStatement ? support::Severity::Warning
                                            : support::Severity::Error;
}

/// @brief True for diagnostics raised by the lexer.
constexpr bool isLexicalDiag(DiagKind kind)
{
    switch (kind)
    {
        case DiagKind::UnterminatedString:
        case DiagKind::UnterminatedChar:
        case DiagKind::InvalidEscapeSequence:
        case DiagKind::InvalidNumberFormat:
        case DiagKind::UnknownCharacter:
            return true;
        default:
            return false;
    }
}

/// @brief Enumerator name of @p kind, e.g. "MissingToken".
const char *diagKindName(DiagKind kind);

} // namespace zaban::frontends::urdu
