//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/urdu/Lexer.hpp
// Purpose: Declares the lexer that turns source text into tokens.
// Key invariants: Case-sensitive keywords; 1-based line/column tracking; one
//                 diagnostic per faulty lexeme, which becomes an Error token;
//                 the stream always ends with exactly one Eof token.
// Ownership/Lifetime: Lexer owns a copy of the source; the emitter is borrowed.
// Links: docs/frontend.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/common/LexerBase.hpp"
#include "frontends/urdu/DiagnosticEmitter.hpp"
#include "frontends/urdu/Token.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace zaban::frontends::urdu
{

/// @brief Tokenizes source text.
/// @details Call next() repeatedly until Eof is returned; further calls keep
///          returning Eof.  Lexical faults never stop the scan.
class Lexer : public common::lexer_base::LexerCursor<Lexer>
{
  public:
    /// @param fileId Identifier of the source file for locations (0 if none).
    /// @param diag Receives lexical diagnostics.
    Lexer(std::string source, uint32_t fileId, DiagnosticEmitter &diag);

    /// @brief Produce the next token.
    Token next();

    /// @brief Lex the remaining input, Eof token included.
    std::vector<Token> tokenize();

    /// @brief Source buffer accessed by the cursor base.
    std::string_view source() const
    {
        return source_;
    }

  private:
    /// @brief Pending escape fault, reported only if the literal closes.
    struct EscapeFault
    {
        support::SourceLoc loc;
        uint32_t length;
        std::string message;
    };

    void skipWhitespaceAndComments();

    support::SourceLoc currentLoc() const;

    Token lexNumber();

    Token lexIdentifierOrKeyword();

    Token lexString();

    Token lexChar();

    Token lexOperator();

    Token lexUnknown();

    /// @brief Decode one escape sequence after the backslash was consumed.
    /// @param escLoc Location of the backslash.
    /// @param lexeme Receives the raw characters consumed.
    /// @param value Receives the decoded character when valid.
    /// @param faults Receives the fault when the escape is invalid.
    void lexEscape(support::SourceLoc escLoc,
                   std::string &lexeme,
                   std::string &value,
                   std::vector<EscapeFault> &faults);

    void report(DiagKind kind, support::SourceLoc loc, uint32_t length, std::string message);

    std::string source_;      ///< Source code being tokenized.
    DiagnosticEmitter &diag_; ///< Diagnostic sink.
};

} // namespace zaban::frontends::urdu
