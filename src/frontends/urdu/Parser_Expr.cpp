//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Expr.cpp
/// @brief Expression parsing.
///
/// @details Precedence, loosest to tightest:
///   conditional `?:` (right-assoc) < `||` < `&&` < `== !=` <
///   `< > <= >=` < `+ -` < `* / %` < prefix `! - + ++ --` <
///   postfix `++ -- [i] (args)` < primary.
/// All binary levels are left-associative and handled by one
/// precedence-climbing loop driven by binaryPrecedence().
///
//===----------------------------------------------------------------------===//

#include "frontends/urdu/Parser.hpp"

namespace zaban::frontends::urdu
{

int binaryPrecedence(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::PipePipe:
            return 1;
        case TokenKind::AmpAmp:
            return 2;
        case TokenKind::EqualEqual:
        case TokenKind::BangEqual:
            return 3;
        case TokenKind::Less:
        case TokenKind::Greater:
        case TokenKind::LessEqual:
        case TokenKind::GreaterEqual:
            return 4;
        case TokenKind::Plus:
        case TokenKind::Minus:
            return 5;
        case TokenKind::Star:
        case TokenKind::Slash:
        case TokenKind::Percent:
            return 6;
        default:
            return 0;
    }
}

namespace
{
BinaryOp toBinaryOp(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::PipePipe:
            return BinaryOp::Or;
        case TokenKind::AmpAmp:
            return BinaryOp::And;
        case TokenKind::EqualEqual:
            return BinaryOp::Eq;
        case TokenKind::BangEqual:
            return BinaryOp::Ne;
        case TokenKind::Less:
            return BinaryOp::Lt;
        case TokenKind::Greater:
            return BinaryOp::Gt;
        case TokenKind::LessEqual:
            return BinaryOp::Le;
        case TokenKind::GreaterEqual:
            return BinaryOp::Ge;
        case TokenKind::Plus:
            return BinaryOp::Add;
        case TokenKind::Minus:
            return BinaryOp::Sub;
        case TokenKind::Star:
            return BinaryOp::Mul;
        case TokenKind::Slash:
            return BinaryOp::Div;
        default:
            return BinaryOp::Mod;
    }
}

std::optional<UnaryOp> toUnaryOp(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Bang:
            return UnaryOp::Not;
        case TokenKind::Minus:
            return UnaryOp::Neg;
        case TokenKind::Plus:
            return UnaryOp::Plus;
        case TokenKind::PlusPlus:
            return UnaryOp::PreIncrement;
        case TokenKind::MinusMinus:
            return UnaryOp::PreDecrement;
        default:
            return std::nullopt;
    }
}
} // namespace

ExprPtr Parser::parseExpression()
{
    return parseConditional();
}

/// @brief conditional := binary ( '?' expression ':' conditional )?
ExprPtr Parser::parseConditional()
{
    SourceLoc start = peek().loc;
    ExprPtr cond = parseBinary(1);
    if (!cond)
        return nullptr;
    if (!check(TokenKind::Question))
        return cond;

    advance();
    DepthGuard guard(*this);
    if (!guard.ok)
        return nullptr;

    ExprPtr thenExpr = parseExpression();
    if (!thenExpr)
        return nullptr;
    if (!expect(TokenKind::Colon))
        return nullptr;
    ExprPtr elseExpr = parseConditional();
    if (!elseExpr)
        return nullptr;

    return std::make_unique<ConditionalExpr>(
        start, std::move(cond), std::move(thenExpr), std::move(elseExpr));
}

/// @brief Precedence climbing.
/// @details Operators of the same level fold left in the loop; a tighter
///          right operand is obtained by recursing with prec + 1.  Every node
///          of the fold starts where the first operand starts, which may be
///          an opening parenthesis.
ExprPtr Parser::parseBinary(int minPrec)
{
    SourceLoc start = peek().loc;
    ExprPtr left = parseUnary();
    if (!left)
        return nullptr;

    while (true)
    {
        TokenKind kind = peek().kind;
        int prec = binaryPrecedence(kind);
        if (prec == 0 || prec < minPrec)
            break;
        advance();

        ExprPtr right = parseBinary(prec + 1);
        if (!right)
            return nullptr;

        left = std::make_unique<BinaryExpr>(start, toBinaryOp(kind), std::move(left), std::move(right));
    }
    return left;
}

ExprPtr Parser::parseUnary()
{
    auto op = toUnaryOp(peek().kind);
    if (!op)
        return parsePostfix();

    Token opTok = advance();
    DepthGuard guard(*this);
    if (!guard.ok)
        return nullptr;

    ExprPtr operand = parseUnary();
    if (!operand)
        return nullptr;
    return std::make_unique<UnaryExpr>(opTok.loc, *op, std::move(operand));
}

/// @brief Apply any number of postfix suffixes, left to right.
ExprPtr Parser::parsePostfix()
{
    SourceLoc loc = peek().loc;
    ExprPtr expr = parsePrimary();
    if (!expr)
        return nullptr;

    while (true)
    {
        if (check(TokenKind::PlusPlus) || check(TokenKind::MinusMinus))
        {
            PostfixOp op =
                advance().kind == TokenKind::PlusPlus ? PostfixOp::Increment : PostfixOp::Decrement;
            expr = std::make_unique<PostfixExpr>(loc, op, std::move(expr));
            continue;
        }
        if (check(TokenKind::LBracket))
        {
            advance();
            DepthGuard guard(*this);
            if (!guard.ok)
                return nullptr;
            ExprPtr index = parseExpression();
            if (!index)
                return nullptr;
            if (!expect(TokenKind::RBracket))
                return nullptr;
            auto node = std::make_unique<PostfixExpr>(loc, PostfixOp::Index, std::move(expr));
            node->index = std::move(index);
            expr = std::move(node);
            continue;
        }
        if (check(TokenKind::LParen))
        {
            advance();
            DepthGuard guard(*this);
            if (!guard.ok)
                return nullptr;
            std::vector<ExprPtr> args;
            if (!parseExpressionList(TokenKind::RParen, args))
                return nullptr;
            if (!expect(TokenKind::RParen))
                return nullptr;
            auto node = std::make_unique<PostfixExpr>(loc, PostfixOp::Call, std::move(expr));
            node->args = std::move(args);
            expr = std::move(node);
            continue;
        }
        break;
    }
    return expr;
}

ExprPtr Parser::parsePrimary()
{
    Token tok = peek();
    switch (tok.kind)
    {
        case TokenKind::IntegerLiteral:
        {
            advance();
            auto lit = std::make_unique<LiteralExpr>(tok.loc, LiteralKind::Integer, tok.lexeme);
            lit->intValue = tok.intValue;
            return lit;
        }
        case TokenKind::FloatLiteral:
        {
            advance();
            auto lit = std::make_unique<LiteralExpr>(tok.loc, LiteralKind::Float, tok.lexeme);
            lit->floatValue = tok.floatValue;
            return lit;
        }
        case TokenKind::KwTrue:
        case TokenKind::KwFalse:
        {
            advance();
            auto lit = std::make_unique<LiteralExpr>(tok.loc, LiteralKind::Boolean, tok.lexeme);
            lit->boolValue = tok.kind == TokenKind::KwTrue;
            return lit;
        }
        case TokenKind::StringLiteral:
        case TokenKind::CharLiteral:
        {
            advance();
            auto kind =
                tok.kind == TokenKind::StringLiteral ? LiteralKind::String : LiteralKind::Char;
            auto lit = std::make_unique<LiteralExpr>(tok.loc, kind, tok.lexeme);
            lit->stringValue = tok.stringValue;
            return lit;
        }
        case TokenKind::Identifier:
            advance();
            return std::make_unique<IdentifierExpr>(tok.loc, tok.lexeme);
        case TokenKind::LParen:
        {
            advance();
            DepthGuard guard(*this);
            if (!guard.ok)
                return nullptr;
            ExprPtr inner = parseExpression();
            if (!inner)
                return nullptr;
            if (!expect(TokenKind::RParen))
                return nullptr;
            return inner;
        }
        case TokenKind::LBracket:
        {
            advance();
            DepthGuard guard(*this);
            if (!guard.ok)
                return nullptr;
            std::vector<ExprPtr> elements;
            if (!parseExpressionList(TokenKind::RBracket, elements))
                return nullptr;
            if (!expect(TokenKind::RBracket))
                return nullptr;
            return std::make_unique<ArrayLiteralExpr>(tok.loc, std::move(elements));
        }
        default:
            errorUnexpected({"expression"});
            return nullptr;
    }
}

/// @brief Parse a possibly empty comma-separated list ending before @p close.
bool Parser::parseExpressionList(TokenKind close, std::vector<ExprPtr> &out)
{
    if (check(close))
        return true;
    do
    {
        ExprPtr item = parseExpression();
        if (!item)
            return false;
        out.push_back(std::move(item));
    } while (match(TokenKind::Comma));
    return true;
}

} // namespace zaban::frontends::urdu
