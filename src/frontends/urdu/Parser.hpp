//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.hpp
/// @brief Recursive-descent parser with precedence climbing and panic-mode
///        recovery.
///
/// @details One member function per non-terminal.  Tokens are pulled from the
/// lexer on demand into a buffer so the parser can look one token past an
/// identifier to tell an assignment from an expression statement.
///
/// ## Error recovery
///
/// A construct that cannot be completed is reported once and returns
/// nullptr; the statement-list loop then calls synchronize(), which discards
/// tokens up to a `;` (consumed), a `{`, a `}` closing an open block, a
/// statement keyword or end of input.  A single missing token is reported
/// as MissingToken; when the token actually present is itself one of those
/// synchronization points, the construct continues as if the token had been
/// there.  No syntax error is reported at an Error token (the lexer already
/// did) and at most one is reported per token position.
///
/// ## Nesting
///
/// Statements, parentheses, brackets, prefix operators and conditional
/// branches each add one level.  Exceeding ParseOptions::maxNestingDepth
/// reports NestingTooDeep once and stops the parse; the statements completed
/// so far are returned.
///
/// Ownership/Lifetime: Borrows the lexer and emitter; the returned Program
/// owns all nodes.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/urdu/AST.hpp"
#include "frontends/urdu/DiagnosticEmitter.hpp"
#include "frontends/urdu/Lexer.hpp"
#include "frontends/urdu/Options.hpp"

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace zaban::frontends::urdu
{

class Parser
{
  public:
    Parser(Lexer &lexer, DiagnosticEmitter &diag, const ParseOptions &opts = {});

    /// @brief Parse the whole input.
    /// @return Program holding every statement that parsed completely.
    Program parseProgram();

    /// @brief True when parsing stopped early (nesting limit or halt on error).
    bool stopped() const
    {
        return stopped_;
    }

  private:
    /// @brief RAII nesting counter.
    struct DepthGuard
    {
        Parser &parser;
        bool ok;

        explicit DepthGuard(Parser &p);
        ~DepthGuard();
        DepthGuard(const DepthGuard &) = delete;
        DepthGuard &operator=(const DepthGuard &) = delete;
    };

    //===------------------------------------------------------------------===//
    // Token handling (Parser_Tokens.cpp)
    //===------------------------------------------------------------------===//

    const Token &peek(size_t offset = 0);

    Token advance();

    bool check(TokenKind kind, size_t offset = 0);

    bool match(TokenKind kind, Token *out = nullptr);

    /// @brief Consume @p kind or report MissingToken.
    /// @return True when the construct may continue: the token was present,
    ///         or it was missing in front of a synchronization point.
    bool expect(TokenKind kind, Token *out = nullptr);

    /// @brief Report UnexpectedToken / UnexpectedEOF at the current token.
    void errorUnexpected(std::vector<std::string> expected);

    void warnEmptyStatement(SourceLoc loc);

    /// @brief Skip tokens until a synchronization point.
    void synchronize();

    /// @brief Token kinds that begin a statement (identifiers excluded).
    static bool isStatementStart(TokenKind kind);

    /// @brief Where a missing token may be assumed and parsing continue.
    bool isSyncPoint(TokenKind kind) const;

    /// @brief Update and return the stop flag.
    bool shouldStop();

    /// @brief Emit a syntax diagnostic unless one exists at this position.
    void reportSyntax(DiagKind kind,
                      const Token &at,
                      std::string message,
                      std::vector<std::string> expected,
                      std::string found);

    //===------------------------------------------------------------------===//
    // Statements (Parser_Stmt.cpp)
    //===------------------------------------------------------------------===//

    void parseStatementList(std::vector<StmtPtr> &out, bool inBlock);

    StmtPtr parseStatement();

    StmtPtr parseBlock();

    StmtPtr parseDeclaration();

    /// @brief `name op expr` without the trailing semicolon.
    StmtPtr parseAssignmentCore();

    StmtPtr parseIf();

    StmtPtr parseWhile();

    StmtPtr parseDoWhile();

    StmtPtr parseFor();

    /// @brief One for-loop update item.
    StmtPtr parseUpdateItem();

    StmtPtr parseJump();

    StmtPtr parseReturn();

    StmtPtr parsePrint();

    StmtPtr parseInput();

    StmtPtr parseExpressionStatement();

    /// @brief Parse `( expr )` after a control keyword.
    ExprPtr parseParenCondition();

    static bool isAssignOp(TokenKind kind);

    //===------------------------------------------------------------------===//
    // Expressions (Parser_Expr.cpp)
    //===------------------------------------------------------------------===//

    ExprPtr parseExpression();

    ExprPtr parseConditional();

    /// @brief Precedence climbing over all binary levels >= @p minPrec.
    ExprPtr parseBinary(int minPrec);

    ExprPtr parseUnary();

    ExprPtr parsePostfix();

    ExprPtr parsePrimary();

    /// @brief Parse `expr {, expr}` up to (not including) @p close.
    bool parseExpressionList(TokenKind close, std::vector<ExprPtr> &out);

    Lexer &lexer_;
    DiagnosticEmitter &diag_;
    ParseOptions opts_;

    std::deque<Token> tokens_; ///< Stable references across peek().
    size_t tokenPos_ = 0;

    size_t depth_ = 0;
    size_t blockDepth_ = 0;
    bool stopped_ = false;
    std::optional<size_t> lastErrorPos_;
};

/// @brief Binding strength of a binary operator token, 0 if not binary.
/// @details 1 `||`, 2 `&&`, 3 `== !=`, 4 `< > <= >=`, 5 `+ -`, 6 `* / %`.
int binaryPrecedence(TokenKind kind);

} // namespace zaban::frontends::urdu
