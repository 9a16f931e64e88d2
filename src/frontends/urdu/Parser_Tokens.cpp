//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Tokens.cpp
/// @brief Token buffering, error reporting and synchronization.
///
//===----------------------------------------------------------------------===//

#include "frontends/common/DiagnosticHelpers.hpp"
#include "frontends/urdu/Parser.hpp"

namespace zaban::frontends::urdu
{

using common::diag_helpers::formatExpectedGot;
using common::diag_helpers::formatExpectedSet;

Parser::Parser(Lexer &lexer, DiagnosticEmitter &diag, const ParseOptions &opts)
    : lexer_(lexer), diag_(diag), opts_(opts)
{
    tokens_.push_back(lexer_.next());
}

Parser::DepthGuard::DepthGuard(Parser &p) : parser(p), ok(true)
{
    ++parser.depth_;
    if (parser.depth_ > parser.opts_.maxNestingDepth)
    {
        ok = false;
        if (!parser.stopped_)
        {
            const Token &at = parser.peek();
            parser.diag_.emit(DiagKind::NestingTooDeep,
                              at.loc,
                              static_cast<uint32_t>(at.lexeme.size()),
                              "nesting too deep (limit: " +
                                  std::to_string(parser.opts_.maxNestingDepth) + ")");
        }
        parser.stopped_ = true;
    }
}

Parser::DepthGuard::~DepthGuard()
{
    --parser.depth_;
}

//===----------------------------------------------------------------------===//
// Token Handling
//===----------------------------------------------------------------------===//

const Token &Parser::peek(size_t offset)
{
    while (tokens_.size() <= tokenPos_ + offset)
    {
        if (!tokens_.empty() && tokens_.back().kind == TokenKind::Eof)
            return tokens_.back();
        tokens_.push_back(lexer_.next());
    }
    return tokens_[tokenPos_ + offset];
}

/// @brief Consume the current token; the position never moves past Eof.
Token Parser::advance()
{
    Token cur = peek();
    if (cur.kind != TokenKind::Eof)
        ++tokenPos_;
    return cur;
}

bool Parser::check(TokenKind kind, size_t offset)
{
    return peek(offset).kind == kind;
}

bool Parser::match(TokenKind kind, Token *out)
{
    if (check(kind))
    {
        Token tok = advance();
        if (out)
            *out = std::move(tok);
        return true;
    }
    return false;
}

bool Parser::expect(TokenKind kind, Token *out)
{
    if (check(kind))
    {
        Token tok = advance();
        if (out)
            *out = std::move(tok);
        return true;
    }

    const Token &cur = peek();
    if (cur.kind == TokenKind::Error)
        return false;

    std::string want = tokenKindToString(kind);
    if (cur.kind == TokenKind::Eof)
    {
        reportSyntax(DiagKind::UnexpectedEOF,
                     cur,
                     formatExpectedGot(want, describeToken(cur)),
                     {want},
                     describeToken(cur));
        return true;
    }

    reportSyntax(DiagKind::MissingToken,
                 cur,
                 formatExpectedGot(want, describeToken(cur)),
                 {want},
                 describeToken(cur));
    return isSyncPoint(cur.kind);
}

//===----------------------------------------------------------------------===//
// Error Handling
//===----------------------------------------------------------------------===//

void Parser::reportSyntax(DiagKind kind,
                          const Token &at,
                          std::string message,
                          std::vector<std::string> expected,
                          std::string found)
{
    if (lastErrorPos_ && *lastErrorPos_ == tokenPos_)
        return;
    lastErrorPos_ = tokenPos_;
    uint32_t length = at.kind == TokenKind::Eof ? 1 : static_cast<uint32_t>(at.lexeme.size());
    diag_.emit(kind, at.loc, length, std::move(message), std::move(expected), std::move(found));
}

void Parser::errorUnexpected(std::vector<std::string> expected)
{
    const Token &cur = peek();
    if (cur.kind == TokenKind::Error)
        return;
    DiagKind kind = cur.kind == TokenKind::Eof ? DiagKind::UnexpectedEOF : DiagKind::UnexpectedToken;
    std::string found = describeToken(cur);
    std::string message = formatExpectedGot(formatExpectedSet(expected), found);
    reportSyntax(kind, cur, std::move(message), std::move(expected), std::move(found));
}

void Parser::warnEmptyStatement(SourceLoc loc)
{
    diag_.emit(DiagKind::EmptyStatement, loc, 1, "empty statement");
}

bool Parser::isStatementStart(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::KwInt:
        case TokenKind::KwFloat:
        case TokenKind::KwBool:
        case TokenKind::KwString:
        case TokenKind::KwChar:
        case TokenKind::KwAgr:
        case TokenKind::KwJabtak:
        case TokenKind::KwTabtak:
        case TokenKind::KwDo:
        case TokenKind::KwBreak:
        case TokenKind::KwContinue:
        case TokenKind::KwReturn:
        case TokenKind::KwDikhao:
        case TokenKind::KwLikho:
        case TokenKind::LBrace:
            return true;
        default:
            return false;
    }
}

bool Parser::isSyncPoint(TokenKind kind) const
{
    switch (kind)
    {
        case TokenKind::Eof:
        case TokenKind::Semicolon:
        case TokenKind::LBrace:
        case TokenKind::RBrace:
            return true;
        default:
            return isStatementStart(kind);
    }
}

/// @brief Discard tokens up to the next synchronization point.
/// @details `;` is consumed.  A `}` stops recovery only inside a block;
///          at top level it can never be matched and is skipped.
void Parser::synchronize()
{
    while (true)
    {
        TokenKind kind = peek().kind;
        if (kind == TokenKind::Eof)
            return;
        if (kind == TokenKind::Semicolon)
        {
            advance();
            return;
        }
        if (kind == TokenKind::RBrace)
        {
            if (blockDepth_ > 0)
                return;
            advance();
            continue;
        }
        if (isStatementStart(kind))
            return;
        advance();
    }
}

bool Parser::shouldStop()
{
    if (!stopped_ && opts_.haltOnFirstError && diag_.errorCount() > 0)
        stopped_ = true;
    return stopped_;
}

} // namespace zaban::frontends::urdu
