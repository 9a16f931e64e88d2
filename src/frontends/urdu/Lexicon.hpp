//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/urdu/Lexicon.hpp
// Purpose: Immutable spelling tables for keywords and operators.
// Key invariants: Tables are strictly sorted (checked at compile time) and
//                 never modified; lookups are exact and case-sensitive.
// Ownership/Lifetime: Static storage shared by every lexer instance.
// Links: docs/frontend.md
//
//===----------------------------------------------------------------------===//
#pragma once

#include "frontends/common/KeywordTable.hpp"
#include "frontends/urdu/Token.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace zaban::frontends::urdu
{

using LexiconEntry = common::keyword_table::KeywordEntry<TokenKind>;

/// @brief Keyword spellings, sorted.
inline constexpr std::array<LexiconEntry, 17> kKeywordTable{{
    {"agr", TokenKind::KwAgr},
    {"bool", TokenKind::KwBool},
    {"break", TokenKind::KwBreak},
    {"char", TokenKind::KwChar},
    {"continue", TokenKind::KwContinue},
    {"dikhao", TokenKind::KwDikhao},
    {"do", TokenKind::KwDo},
    {"false", TokenKind::KwFalse},
    {"float", TokenKind::KwFloat},
    {"int", TokenKind::KwInt},
    {"jabtak", TokenKind::KwJabtak},
    {"likho", TokenKind::KwLikho},
    {"return", TokenKind::KwReturn},
    {"string", TokenKind::KwString},
    {"tabtak", TokenKind::KwTabtak},
    {"true", TokenKind::KwTrue},
    {"varna", TokenKind::KwVarna},
}};

/// @brief Operator and punctuation spellings, sorted.
/// @details Lone '&' and '|' are deliberately absent.
inline constexpr std::array<LexiconEntry, 31> kOperatorTable{{
    {"!", TokenKind::Bang},
    {"!=", TokenKind::BangEqual},
    {"%", TokenKind::Percent},
    {"&&", TokenKind::AmpAmp},
    {"(", TokenKind::LParen},
    {")", TokenKind::RParen},
    {"*", TokenKind::Star},
    {"*=", TokenKind::StarAssign},
    {"+", TokenKind::Plus},
    {"++", TokenKind::PlusPlus},
    {"+=", TokenKind::PlusAssign},
    {",", TokenKind::Comma},
    {"-", TokenKind::Minus},
    {"--", TokenKind::MinusMinus},
    {"-=", TokenKind::MinusAssign},
    {"/", TokenKind::Slash},
    {"/=", TokenKind::SlashAssign},
    {":", TokenKind::Colon},
    {";", TokenKind::Semicolon},
    {"<", TokenKind::Less},
    {"<=", TokenKind::LessEqual},
    {"=", TokenKind::Assign},
    {"==", TokenKind::EqualEqual},
    {">", TokenKind::Greater},
    {">=", TokenKind::GreaterEqual},
    {"?", TokenKind::Question},
    {"[", TokenKind::LBracket},
    {"]", TokenKind::RBracket},
    {"{", TokenKind::LBrace},
    {"||", TokenKind::PipePipe},
    {"}", TokenKind::RBrace},
}};

static_assert(common::keyword_table::isKeywordTableSorted(kKeywordTable),
              "keyword table must be sorted");
static_assert(common::keyword_table::isKeywordTableSorted(kOperatorTable),
              "operator table must be sorted");

/// @brief Look up an exact keyword spelling.
[[nodiscard]] std::optional<TokenKind> lookupKeyword(std::string_view spelling);

/// @brief Look up an exact operator or punctuation spelling.
[[nodiscard]] std::optional<TokenKind> lookupOperator(std::string_view spelling);

/// @brief Characters that end unknown-character recovery: ; , ( ) { } [ ].
[[nodiscard]] bool isDelimiter(char c);

} // namespace zaban::frontends::urdu
