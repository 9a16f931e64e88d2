//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Stmt.cpp
/// @brief Statement parsing and the statement-level recovery loop.
///
/// @details Dispatch is on the first token.  An identifier followed by `=`
/// or a compound assignment starts an assignment; any other identifier
/// starts an expression statement.  `varna` binds to the nearest `agr`
/// because parseIf() consumes it immediately after the then-branch.
///
//===----------------------------------------------------------------------===//

#include "frontends/urdu/Parser.hpp"

namespace zaban::frontends::urdu
{

namespace
{
TypeKeyword toTypeKeyword(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::KwFloat:
            return TypeKeyword::Float;
        case TokenKind::KwBool:
            return TypeKeyword::Bool;
        case TokenKind::KwString:
            return TypeKeyword::String;
        case TokenKind::KwChar:
            return TypeKeyword::Char;
        default:
            return TypeKeyword::Int;
    }
}

AssignOp toAssignOp(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::PlusAssign:
            return AssignOp::AddAssign;
        case TokenKind::MinusAssign:
            return AssignOp::SubAssign;
        case TokenKind::StarAssign:
            return AssignOp::MulAssign;
        case TokenKind::SlashAssign:
            return AssignOp::DivAssign;
        default:
            return AssignOp::Assign;
    }
}
} // namespace

bool Parser::isAssignOp(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Assign:
        case TokenKind::PlusAssign:
        case TokenKind::MinusAssign:
        case TokenKind::StarAssign:
        case TokenKind::SlashAssign:
            return true;
        default:
            return false;
    }
}

Program Parser::parseProgram()
{
    Program program;
    program.loc = {lexer_.fileId(), 1, 1};
    parseStatementList(program.statements, /*inBlock=*/false);
    return program;
}

/// @brief Parse statements until end of input (or `}` inside a block).
/// @details A failed statement triggers synchronize(); if that consumed
///          nothing, one token is skipped so the loop always progresses.
///          A stray `;` is a warning and yields no node.
void Parser::parseStatementList(std::vector<StmtPtr> &out, bool inBlock)
{
    while (!shouldStop() && !check(TokenKind::Eof))
    {
        if (inBlock && check(TokenKind::RBrace))
            break;

        if (check(TokenKind::Semicolon))
        {
            warnEmptyStatement(advance().loc);
            continue;
        }

        const size_t start = tokenPos_;
        StmtPtr stmt = parseStatement();
        if (stmt)
        {
            out.push_back(std::move(stmt));
            continue;
        }
        if (stopped_)
            break;

        synchronize();
        if (tokenPos_ == start)
            advance();
    }
}

StmtPtr Parser::parseStatement()
{
    DepthGuard guard(*this);
    if (!guard.ok || shouldStop())
        return nullptr;

    switch (peek().kind)
    {
        case TokenKind::KwInt:
        case TokenKind::KwFloat:
        case TokenKind::KwBool:
        case TokenKind::KwString:
        case TokenKind::KwChar:
            return parseDeclaration();
        case TokenKind::KwAgr:
            return parseIf();
        case TokenKind::KwJabtak:
            return parseWhile();
        case TokenKind::KwDo:
            return parseDoWhile();
        case TokenKind::KwTabtak:
            return parseFor();
        case TokenKind::KwBreak:
        case TokenKind::KwContinue:
            return parseJump();
        case TokenKind::KwReturn:
            return parseReturn();
        case TokenKind::KwDikhao:
            return parsePrint();
        case TokenKind::KwLikho:
            return parseInput();
        case TokenKind::LBrace:
            return parseBlock();
        case TokenKind::Semicolon:
        {
            // Empty body of a control statement, e.g. `jabtak (x) ;`.
            Token semi = advance();
            warnEmptyStatement(semi.loc);
            return std::make_unique<BlockStmt>(semi.loc, std::vector<StmtPtr>{});
        }
        case TokenKind::RBrace:
        case TokenKind::KwVarna:
            errorUnexpected({"statement"});
            return nullptr;
        case TokenKind::Identifier:
            if (isAssignOp(peek(1).kind))
            {
                StmtPtr stmt = parseAssignmentCore();
                if (!stmt || !expect(TokenKind::Semicolon))
                    return nullptr;
                return stmt;
            }
            return parseExpressionStatement();
        default:
            return parseExpressionStatement();
    }
}

StmtPtr Parser::parseBlock()
{
    Token open = advance(); // '{'
    std::vector<StmtPtr> statements;

    ++blockDepth_;
    parseStatementList(statements, /*inBlock=*/true);
    --blockDepth_;

    if (stopped_)
        return nullptr;
    if (!expect(TokenKind::RBrace))
        return nullptr;
    return std::make_unique<BlockStmt>(open.loc, std::move(statements));
}

/// @brief type identifier ( '=' expression )? ';'
StmtPtr Parser::parseDeclaration()
{
    Token typeTok = advance();

    Token name;
    if (!check(TokenKind::Identifier))
    {
        errorUnexpected({"identifier"});
        return nullptr;
    }
    name = advance();

    ExprPtr init;
    if (match(TokenKind::Assign))
    {
        init = parseExpression();
        if (!init)
            return nullptr;
    }
    if (!expect(TokenKind::Semicolon))
        return nullptr;

    return std::make_unique<DeclStmt>(
        typeTok.loc, toTypeKeyword(typeTok.kind), name.lexeme, std::move(init));
}

/// @brief identifier assign_op expression (no semicolon).
StmtPtr Parser::parseAssignmentCore()
{
    Token target = advance();
    Token opTok = advance();
    ExprPtr value = parseExpression();
    if (!value)
        return nullptr;
    return std::make_unique<AssignStmt>(
        target.loc, target.lexeme, toAssignOp(opTok.kind), std::move(value));
}

ExprPtr Parser::parseParenCondition()
{
    if (!check(TokenKind::LParen))
    {
        errorUnexpected({tokenKindToString(TokenKind::LParen)});
        return nullptr;
    }
    advance();
    ExprPtr cond = parseExpression();
    if (!cond)
        return nullptr;
    if (!expect(TokenKind::RParen))
        return nullptr;
    return cond;
}

/// @brief 'agr' '(' expr ')' statement ( 'varna' statement )?
StmtPtr Parser::parseIf()
{
    Token kw = advance();
    ExprPtr cond = parseParenCondition();
    if (!cond)
        return nullptr;
    StmtPtr thenBranch = parseStatement();
    if (!thenBranch)
        return nullptr;

    StmtPtr elseBranch;
    if (match(TokenKind::KwVarna))
    {
        elseBranch = parseStatement();
        if (!elseBranch)
            return nullptr;
    }
    return std::make_unique<IfStmt>(
        kw.loc, std::move(cond), std::move(thenBranch), std::move(elseBranch));
}

StmtPtr Parser::parseWhile()
{
    Token kw = advance();
    ExprPtr cond = parseParenCondition();
    if (!cond)
        return nullptr;
    StmtPtr body = parseStatement();
    if (!body)
        return nullptr;
    return std::make_unique<WhileStmt>(kw.loc, std::move(cond), std::move(body));
}

/// @brief 'do' statement 'jabtak' '(' expr ')' ';'
StmtPtr Parser::parseDoWhile()
{
    Token kw = advance();
    StmtPtr body = parseStatement();
    if (!body)
        return nullptr;
    if (!check(TokenKind::KwJabtak))
    {
        errorUnexpected({tokenKindToString(TokenKind::KwJabtak)});
        return nullptr;
    }
    advance();
    ExprPtr cond = parseParenCondition();
    if (!cond)
        return nullptr;
    if (!expect(TokenKind::Semicolon))
        return nullptr;
    return std::make_unique<DoWhileStmt>(kw.loc, std::move(body), std::move(cond));
}

/// @brief 'tabtak' '(' init? ';' expr? ';' update_list? ')' statement
/// @details The init slot takes a declaration (which brings its own `;`) or
///          an assignment; the update slot takes a comma-separated list of
///          assignments and increments/decrements.
StmtPtr Parser::parseFor()
{
    Token kw = advance();
    if (!check(TokenKind::LParen))
    {
        errorUnexpected({tokenKindToString(TokenKind::LParen)});
        return nullptr;
    }
    advance();

    StmtPtr init;
    if (isTypeKeyword(peek().kind))
    {
        init = parseDeclaration();
        if (!init)
            return nullptr;
    }
    else if (check(TokenKind::Identifier) && isAssignOp(peek(1).kind))
    {
        init = parseAssignmentCore();
        if (!init || !expect(TokenKind::Semicolon))
            return nullptr;
    }
    else if (!match(TokenKind::Semicolon))
    {
        errorUnexpected({"declaration", "assignment", tokenKindToString(TokenKind::Semicolon)});
        return nullptr;
    }

    ExprPtr cond;
    if (!check(TokenKind::Semicolon))
    {
        cond = parseExpression();
        if (!cond)
            return nullptr;
    }
    if (!expect(TokenKind::Semicolon))
        return nullptr;

    std::vector<StmtPtr> update;
    if (!check(TokenKind::RParen))
    {
        do
        {
            StmtPtr item = parseUpdateItem();
            if (!item)
                return nullptr;
            update.push_back(std::move(item));
        } while (match(TokenKind::Comma));
    }
    if (!expect(TokenKind::RParen))
        return nullptr;

    StmtPtr body = parseStatement();
    if (!body)
        return nullptr;
    return std::make_unique<ForStmt>(
        kw.loc, std::move(init), std::move(cond), std::move(update), std::move(body));
}

/// @brief assignment | identifier ('++'|'--') | ('++'|'--') identifier
StmtPtr Parser::parseUpdateItem()
{
    if (check(TokenKind::Identifier))
    {
        TokenKind next = peek(1).kind;
        if (isAssignOp(next))
            return parseAssignmentCore();
        if (next == TokenKind::PlusPlus || next == TokenKind::MinusMinus)
        {
            Token name = advance();
            advance();
            PostfixOp op = next == TokenKind::PlusPlus ? PostfixOp::Increment : PostfixOp::Decrement;
            auto expr = std::make_unique<PostfixExpr>(
                name.loc, op, std::make_unique<IdentifierExpr>(name.loc, name.lexeme));
            return std::make_unique<ExprStmt>(name.loc, std::move(expr));
        }
        advance();
        errorUnexpected({"assignment operator", tokenKindToString(TokenKind::PlusPlus),
                         tokenKindToString(TokenKind::MinusMinus)});
        return nullptr;
    }

    if ((check(TokenKind::PlusPlus) || check(TokenKind::MinusMinus)) &&
        check(TokenKind::Identifier, 1))
    {
        Token opTok = advance();
        Token name = advance();
        UnaryOp op =
            opTok.kind == TokenKind::PlusPlus ? UnaryOp::PreIncrement : UnaryOp::PreDecrement;
        auto expr = std::make_unique<UnaryExpr>(
            opTok.loc, op, std::make_unique<IdentifierExpr>(name.loc, name.lexeme));
        return std::make_unique<ExprStmt>(opTok.loc, std::move(expr));
    }

    errorUnexpected({"assignment", "increment", "decrement"});
    return nullptr;
}

/// @brief 'break' ';' | 'continue' ';'
StmtPtr Parser::parseJump()
{
    Token kw = advance();
    if (!expect(TokenKind::Semicolon))
        return nullptr;
    if (kw.kind == TokenKind::KwBreak)
        return std::make_unique<BreakStmt>(kw.loc);
    return std::make_unique<ContinueStmt>(kw.loc);
}

StmtPtr Parser::parseReturn()
{
    Token kw = advance();
    ExprPtr value;
    if (!check(TokenKind::Semicolon))
    {
        value = parseExpression();
        if (!value)
            return nullptr;
    }
    if (!expect(TokenKind::Semicolon))
        return nullptr;
    return std::make_unique<ReturnStmt>(kw.loc, std::move(value));
}

/// @brief 'dikhao' '(' ( expr ( ',' expr )* )? ')' ';'
StmtPtr Parser::parsePrint()
{
    Token kw = advance();
    if (!check(TokenKind::LParen))
    {
        errorUnexpected({tokenKindToString(TokenKind::LParen)});
        return nullptr;
    }
    advance();
    std::vector<ExprPtr> args;
    if (!parseExpressionList(TokenKind::RParen, args))
        return nullptr;
    if (!expect(TokenKind::RParen) || !expect(TokenKind::Semicolon))
        return nullptr;
    return std::make_unique<PrintStmt>(kw.loc, std::move(args));
}

/// @brief 'likho' '(' identifier ')' ';'
StmtPtr Parser::parseInput()
{
    Token kw = advance();
    if (!check(TokenKind::LParen))
    {
        errorUnexpected({tokenKindToString(TokenKind::LParen)});
        return nullptr;
    }
    advance();
    if (!check(TokenKind::Identifier))
    {
        errorUnexpected({"identifier"});
        return nullptr;
    }
    Token name = advance();
    if (!expect(TokenKind::RParen) || !expect(TokenKind::Semicolon))
        return nullptr;
    return std::make_unique<InputStmt>(kw.loc, name.lexeme);
}

StmtPtr Parser::parseExpressionStatement()
{
    SourceLoc loc = peek().loc;
    ExprPtr expr = parseExpression();
    if (!expr)
        return nullptr;
    if (!expect(TokenKind::Semicolon))
        return nullptr;
    return std::make_unique<ExprStmt>(loc, std::move(expr));
}

} // namespace zaban::frontends::urdu
