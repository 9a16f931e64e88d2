//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Frontend.hpp
/// @brief Entry points that run the lexer and parser over one buffer.
///
/// @details parse() wires a Lexer, DiagnosticEmitter and Parser together
/// and returns the Program with every diagnostic.  lex() runs the lexer
/// alone for token dumps.  Neither performs file I/O; callers load the text.
///
/// Setting the environment variable ZABAN_DEBUG_PARSE (or
/// ParseOptions::trace) prints phase markers to stderr.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/urdu/AST.hpp"
#include "frontends/urdu/DiagnosticEmitter.hpp"
#include "frontends/urdu/Options.hpp"
#include "frontends/urdu/Token.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace zaban::frontends::urdu
{

/// @brief One buffer to analyze.
struct ParseInput
{
    /// @brief Source text.
    std::string_view source;

    /// @brief Path used for diagnostics.
    std::string_view path{"<input>"};

    /// @brief Existing file id within the supplied source manager, if any.
    std::optional<uint32_t> fileId{};
};

/// @brief Outcome of parse().
struct ParseResult
{
    /// @brief Statements that parsed completely.
    Program program{};

    /// @brief Structured diagnostics in emission order.
    std::vector<DiagnosticRecord> diagnostics{};

    /// @brief Counting engine shared by lexer and parser.
    support::DiagnosticEngine engine{};

    /// @brief File identifier used for the buffer.
    uint32_t fileId{0};

    /// @brief True when the parse stopped early (nesting limit or halt).
    bool stoppedEarly{false};

    size_t errorCount() const
    {
        return engine.errorCount();
    }

    size_t warningCount() const
    {
        return engine.warningCount();
    }

    /// @brief Well-formed: no error-severity diagnostics.
    [[nodiscard]] bool succeeded() const
    {
        return errorCount() == 0;
    }
};

/// @brief Outcome of lex().
struct LexResult
{
    std::vector<Token> tokens{}; ///< Ends with exactly one Eof token.
    std::vector<DiagnosticRecord> diagnostics{};
    uint32_t fileId{0};

    [[nodiscard]] bool succeeded() const;
};

/// @brief Lex and parse @p input.
ParseResult parse(const ParseInput &input,
                  const ParseOptions &options,
                  support::SourceManager &sm);

/// @brief Lex @p input without parsing.
LexResult lex(const ParseInput &input, support::SourceManager &sm);

/// @brief Print every record of @p diagnostics with snippets.
void printDiagnostics(const std::vector<DiagnosticRecord> &diagnostics,
                      std::ostream &os,
                      const support::SourceManager *sm);

} // namespace zaban::frontends::urdu
