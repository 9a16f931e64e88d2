//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/urdu/DiagnosticEmitter.hpp
// Purpose: Wraps DiagnosticEngine to record structured lexical and syntax
//          diagnostics with codes, expected-sets and caret snippets.
// Key invariants: Stored diagnostics maintain emission order; the snippet is
//                 captured at emission time from the registered source.
// Ownership/Lifetime: Borrows DiagnosticEngine and SourceManager; owns source
//                     copies and records.
// Links: docs/frontend.md
//
//===----------------------------------------------------------------------===//
#pragma once

#include "frontends/urdu/DiagnosticCodes.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace zaban::frontends::urdu
{

/// @brief One structured diagnostic.
struct DiagnosticRecord
{
    support::Severity severity = support::Severity::Error;
    DiagKind kind = DiagKind::UnexpectedToken;
    std::string code;                  ///< Stable code, e.g. "Z2001".
    std::string message;               ///< Human-readable text.
    support::SourceLoc loc;            ///< Start of the offending construct.
    uint32_t length = 1;               ///< Characters to mark with carets.
    std::vector<std::string> expected; ///< Acceptable tokens (syntax errors only).
    std::string found;                 ///< Description of the offending token.
    /// Source line followed by a newline and the caret line; absent when the
    /// line is not available.
    std::optional<std::string> snippet;
};

/// @brief Print @p rec as "path:line:col: severity[code]: message" followed
///        by its snippet, if any.
void printDiagnosticRecord(const DiagnosticRecord &rec,
                           std::ostream &os,
                           const support::SourceManager *sm = nullptr);

/// @brief Records frontend diagnostics and renders them with source context.
class DiagnosticEmitter
{
  public:
    /// @param sm Optional source manager used for "path:" prefixes.
    explicit DiagnosticEmitter(support::DiagnosticEngine &de,
                               const support::SourceManager *sm = nullptr);

    /// @brief Register source text for a file id (0 for unregistered buffers).
    void addSource(uint32_t fileId, std::string source);

    /// @brief Record a diagnostic of @p kind at @p loc.
    /// @param length Number of characters to underline (0 -> 1 caret).
    void emit(DiagKind kind,
              support::SourceLoc loc,
              uint32_t length,
              std::string message,
              std::vector<std::string> expected = {},
              std::string found = {});

    /// @brief Diagnostics in emission order.
    const std::vector<DiagnosticRecord> &records() const
    {
        return records_;
    }

    /// @brief Print every diagnostic followed by its snippet.
    void printAll(std::ostream &os) const;

    /// @brief Print a single record in the same format as printAll().
    void print(const DiagnosticRecord &rec, std::ostream &os) const;

    size_t errorCount() const;

    size_t warningCount() const;

    /// @brief True when no error-severity diagnostic was recorded.
    bool wellFormed() const
    {
        return errorCount() == 0;
    }

    /// @brief Render the source line at @p loc and a caret line beneath it.
    /// @return std::nullopt when the line is unavailable.
    std::optional<std::string> renderSnippet(support::SourceLoc loc, uint32_t length) const;

  private:
    /// @brief Retrieve line @p line of @p fileId without trailing newline.
    std::optional<std::string> getLine(uint32_t fileId, uint32_t line) const;

    support::DiagnosticEngine &de_;
    const support::SourceManager *sm_;
    std::vector<DiagnosticRecord> records_;

    /// @brief Registered text with the offset of each line's first character.
    struct SourceText
    {
        std::string text;
        std::vector<size_t> lineStarts;
    };

    std::unordered_map<uint32_t, SourceText> sources_;
};

} // namespace zaban::frontends::urdu
