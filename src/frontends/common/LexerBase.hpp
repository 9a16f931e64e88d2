//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/LexerBase.hpp
// Purpose: Cursor management shared by hand-written lexers.
//
// Key Invariants:
//   - Position tracking maintains 1-based line and column numbers
//   - EOF is indicated by returning '\0' from peek operations
//   - Newlines increment line and reset column to 1
//   - A tab advances the column by kTabWidth
//
//===----------------------------------------------------------------------===//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace zaban::frontends::common::lexer_base
{

/// @brief Columns a tab character occupies in reported positions.
/// @details Diagnostics render tabs verbatim in snippets, so a width of one
///          keeps the caret aligned with the reported column.
inline constexpr uint32_t kTabWidth = 1;

/// @brief CRTP base class for lexer cursor management.
/// @details Derived class must provide source() returning std::string_view.
///
/// Usage:
///   class MyLexer : public LexerCursor<MyLexer> {
///       std::string_view source() const { return src_; }
///   };
template <typename Derived>
class LexerCursor
{
  public:
    explicit LexerCursor(uint32_t fileId) : fileId_(fileId) {}

    /// @brief Peek at the current character without consuming it.
    /// @return The current character, or '\0' if at end of source.
    [[nodiscard]] char peek() const
    {
        auto src = static_cast<const Derived *>(this)->source();
        return pos_ < src.size() ? src[pos_] : '\0';
    }

    /// @brief Peek @p offset characters ahead; '\0' beyond the end.
    [[nodiscard]] char peek(std::size_t offset) const
    {
        auto src = static_cast<const Derived *>(this)->source();
        std::size_t idx = pos_ + offset;
        return idx < src.size() ? src[idx] : '\0';
    }

    /// @brief Consume and return the current character.
    /// @return The consumed character, or '\0' if at end of source.
    char get()
    {
        auto src = static_cast<const Derived *>(this)->source();
        if (pos_ >= src.size())
            return '\0';
        char c = src[pos_++];
        if (c == '\n')
        {
            line_++;
            column_ = 1;
        }
        else if (c == '\t')
        {
            column_ += kTabWidth;
        }
        else
        {
            column_++;
        }
        return c;
    }

    [[nodiscard]] bool eof() const
    {
        return pos_ >= static_cast<const Derived *>(this)->source().size();
    }

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    [[nodiscard]] uint32_t line() const noexcept { return line_; }

    [[nodiscard]] uint32_t column() const noexcept { return column_; }

    [[nodiscard]] uint32_t fileId() const noexcept { return fileId_; }

  protected:
    std::size_t pos_{0};   ///< Current position in source.
    uint32_t line_{1};     ///< 1-based line number.
    uint32_t column_{1};   ///< 1-based column number.
    uint32_t fileId_;      ///< File identifier.
};

/// @brief Consume characters up to (not including) the next newline.
template <typename Lexer>
inline void skipToEndOfLine(Lexer &lex)
{
    while (!lex.eof() && lex.peek() != '\n')
        lex.get();
}

} // namespace zaban::frontends::common::lexer_base
