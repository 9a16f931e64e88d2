//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/KeywordTable.hpp
// Purpose: Sorted compile-time spelling tables with binary-search lookup.
//
// Key Features:
//   - constexpr verification of table sorting (use in static_assert)
//   - Exact, case-sensitive matching
//
//===----------------------------------------------------------------------===//
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace zaban::frontends::common::keyword_table
{

/// @brief A table entry mapping a spelling to a token kind.
/// @tparam TokenKind The token kind enum type.
template <typename TokenKind>
struct KeywordEntry
{
    std::string_view lexeme; ///< Exact spelling.
    TokenKind kind;          ///< Token kind produced for the spelling.
};

/// @brief Check that a table is strictly sorted by spelling.
/// @details Strict ordering also rules out duplicate spellings.
template <typename TokenKind, std::size_t N>
[[nodiscard]] constexpr bool isKeywordTableSorted(const std::array<KeywordEntry<TokenKind>, N> &table)
{
    for (std::size_t i = 1; i < N; ++i)
    {
        if (!(table[i - 1].lexeme < table[i].lexeme))
            return false;
    }
    return true;
}

/// @brief Binary search lookup in a sorted table.
/// @return The token kind if found, std::nullopt otherwise.
template <typename TokenKind, std::size_t N>
[[nodiscard]] constexpr std::optional<TokenKind> lookupKeywordBinary(
    const std::array<KeywordEntry<TokenKind>, N> &table, std::string_view lexeme)
{
    std::size_t first = 0;
    std::size_t last = N;

    while (first < last)
    {
        std::size_t mid = first + (last - first) / 2;
        if (table[mid].lexeme == lexeme)
            return table[mid].kind;
        if (table[mid].lexeme < lexeme)
            first = mid + 1;
        else
            last = mid;
    }

    return std::nullopt;
}

} // namespace zaban::frontends::common::keyword_table
