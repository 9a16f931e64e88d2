//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file defines the Token structure and TokenKind enumeration produced by
// the Urdu-keyword lexer.
//
// Token Categories:
// - Markers: Eof, Error (a lexeme the lexer already diagnosed)
// - Literals: Integer, Float, String, Char; true/false are keywords
// - Identifiers
// - Keywords: agr, varna, jabtak, tabtak, do, break, continue, return,
//   dikhao, likho and the type keywords int, float, bool, string, char
// - Operators and punctuation
//
// Design Notes:
// - Tokens are value types that own their lexeme and decoded literal value
// - The TokenKind enumeration is generated from TokenKinds.def
//
//===----------------------------------------------------------------------===//
#pragma once

#include "support/source_location.hpp"
#include <cstdint>
#include <string>

namespace zaban::frontends::urdu
{
/// @brief All token kinds recognized by the lexer.
enum class TokenKind
{
#define TOKEN(K, S) K,
#include "frontends/urdu/TokenKinds.def"
#undef TOKEN

    Count, ///< Total number of token kinds (sentinel, not a real token).
};

/// @brief A lexical token.
/// @invariant Literal kinds have their matching value field populated.
struct Token
{
    /// @brief Classification of this token.
    TokenKind kind = TokenKind::Eof;

    /// @brief Exact character sequence for this token, quotes included.
    std::string lexeme;

    /// @brief Source location of the first character.
    support::SourceLoc loc;

    /// @brief Value of IntegerLiteral tokens.
    int64_t intValue = 0;

    /// @brief Value of FloatLiteral tokens.
    double floatValue = 0.0;

    /// @brief Decoded contents of StringLiteral and CharLiteral tokens.
    std::string stringValue;

    [[nodiscard]] bool is(TokenKind k) const
    {
        return kind == k;
    }
};

/// @brief Diagnostic-facing description of @p k, e.g. "';'" or "identifier".
const char *tokenKindToString(TokenKind k);

/// @brief Enumerator name of @p k, e.g. "Semicolon"; used by token dumps.
const char *tokenKindName(TokenKind k);

/// @brief True for int, float, bool, string and char.
bool isTypeKeyword(TokenKind k);

/// @brief Describe the token for a "got ..." message, e.g. "identifier 'x'".
std::string describeToken(const Token &tok);

/// @brief Format one token dump line: "line:col<TAB>Kind<TAB>\"lexeme\"".
std::string formatToken(const Token &tok);

} // namespace zaban::frontends::urdu
