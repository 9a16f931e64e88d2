//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.hpp
/// @brief Expression and statement nodes produced by the parser.
///
/// @details The node set is closed: every production of the grammar has one
/// node type, tagged by ExprKind or StmtKind so consumers can switch over all
/// variants.  Nodes are only built for constructs that parsed completely; a
/// malformed construct is reported and left out of the tree.
///
/// @invariant Every node's `loc` is the position of its leftmost token,
///            including an opening parenthesis that encloses the left operand
///            of a binary, postfix or conditional expression.
///
/// Ownership/Lifetime: Children are owned by their parent through ExprPtr /
/// StmtPtr; the Program owns the whole tree.  A left fold of a long operator
/// chain is as deep as the chain is long, so nodes with children release them
/// through a worklist in their destructors, and equality and printing walk the
/// tree with explicit stacks.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace zaban::frontends::urdu
{

using SourceLoc = support::SourceLoc;

struct Expr;
struct Stmt;

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;

//===----------------------------------------------------------------------===//
// Operators and payload enums
//===----------------------------------------------------------------------===//

/// @brief Declared type of a variable.
enum class TypeKeyword
{
    Int,
    Float,
    Bool,
    String,
    Char,
};

/// @brief Binary operators, in no particular order.
enum class BinaryOp
{
    Or,  ///< `||`
    And, ///< `&&`
    Eq,  ///< `==`
    Ne,  ///< `!=`
    Lt,  ///< `<`
    Gt,  ///< `>`
    Le,  ///< `<=`
    Ge,  ///< `>=`
    Add, ///< `+`
    Sub, ///< `-`
    Mul, ///< `*`
    Div, ///< `/`
    Mod, ///< `%`
};

/// @brief Prefix operators.
enum class UnaryOp
{
    Not,          ///< `!a`
    Neg,          ///< `-a`
    Plus,         ///< `+a`
    PreIncrement, ///< `++a`
    PreDecrement, ///< `--a`
};

/// @brief Postfix suffixes.
enum class PostfixOp
{
    Increment, ///< `a++`
    Decrement, ///< `a--`
    Index,     ///< `a[i]`
    Call,      ///< `a(x, y)`
};

/// @brief Assignment operators; compound forms fold into AssignStmt.
enum class AssignOp
{
    Assign,    ///< `=`
    AddAssign, ///< `+=`
    SubAssign, ///< `-=`
    MulAssign, ///< `*=`
    DivAssign, ///< `/=`
};

/// @brief Literal categories.
enum class LiteralKind
{
    Integer,
    Float,
    Boolean,
    String,
    Char,
};

const char *typeKeywordSpelling(TypeKeyword t);
const char *binaryOpSpelling(BinaryOp op);
const char *unaryOpSpelling(UnaryOp op);
const char *postfixOpSpelling(PostfixOp op);
const char *assignOpSpelling(AssignOp op);

//===----------------------------------------------------------------------===//
// Expressions
//===----------------------------------------------------------------------===//

/// @brief Enumerates all kinds of expression nodes.
enum class ExprKind
{
    Conditional, ///< `c ? a : b`, see ConditionalExpr
    Binary,      ///< see BinaryExpr
    Unary,       ///< see UnaryExpr
    Postfix,     ///< see PostfixExpr
    Literal,     ///< see LiteralExpr
    Identifier,  ///< see IdentifierExpr
    ArrayLiteral ///< `[a, b]`, see ArrayLiteralExpr
};

/// @brief Base class for all expression nodes.
struct Expr
{
    /// @brief Identifies the concrete expression kind for downcasting.
    ExprKind kind;

    /// @brief Position of the leftmost token.
    SourceLoc loc;

    Expr(ExprKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Expr() = default;
};

/// @brief Right-associative conditional `cond ? thenExpr : elseExpr`.
struct ConditionalExpr : Expr
{
    ExprPtr cond;
    ExprPtr thenExpr;
    ExprPtr elseExpr;

    ConditionalExpr(SourceLoc l, ExprPtr c, ExprPtr t, ExprPtr e)
        : Expr(ExprKind::Conditional, l), cond(std::move(c)), thenExpr(std::move(t)),
          elseExpr(std::move(e))
    {
    }

    ~ConditionalExpr() override;
};

/// @brief Binary operation; all binary levels are left-associative.
struct BinaryExpr : Expr
{
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;

    BinaryExpr(SourceLoc l, BinaryOp o, ExprPtr lhs, ExprPtr rhs)
        : Expr(ExprKind::Binary, l), op(o), left(std::move(lhs)), right(std::move(rhs))
    {
    }

    ~BinaryExpr() override;
};

/// @brief Prefix operation.
struct UnaryExpr : Expr
{
    UnaryOp op;
    ExprPtr operand;
    /// @brief Always true for nodes built by the parser; postfix forms are
    ///        PostfixExpr.
    bool prefix = true;

    UnaryExpr(SourceLoc l, UnaryOp o, ExprPtr e)
        : Expr(ExprKind::Unary, l), op(o), operand(std::move(e))
    {
    }

    ~UnaryExpr() override;
};

/// @brief Postfix suffix applied to an operand.
/// @details `index` is set only for PostfixOp::Index, `args` is meaningful
///          only for PostfixOp::Call (possibly empty).
struct PostfixExpr : Expr
{
    PostfixOp op;
    ExprPtr operand;
    ExprPtr index;
    std::vector<ExprPtr> args;

    PostfixExpr(SourceLoc l, PostfixOp o, ExprPtr e)
        : Expr(ExprKind::Postfix, l), op(o), operand(std::move(e))
    {
    }

    ~PostfixExpr() override;
};

/// @brief Literal constant.
/// @details `text` keeps the source spelling; the value field matching
///          `literalKind` holds the decoded value.
struct LiteralExpr : Expr
{
    LiteralKind literalKind;
    std::string text;
    int64_t intValue = 0;
    double floatValue = 0.0;
    bool boolValue = false;
    std::string stringValue; ///< String contents, or the single character.

    LiteralExpr(SourceLoc l, LiteralKind k, std::string t)
        : Expr(ExprKind::Literal, l), literalKind(k), text(std::move(t))
    {
    }
};

struct IdentifierExpr : Expr
{
    std::string name;

    IdentifierExpr(SourceLoc l, std::string n) : Expr(ExprKind::Identifier, l), name(std::move(n))
    {
    }
};

struct ArrayLiteralExpr : Expr
{
    std::vector<ExprPtr> elements;

    ArrayLiteralExpr(SourceLoc l, std::vector<ExprPtr> e)
        : Expr(ExprKind::ArrayLiteral, l), elements(std::move(e))
    {
    }

    ~ArrayLiteralExpr() override;
};

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

/// @brief Enumerates all kinds of statement nodes.
enum class StmtKind
{
    Block,       ///< `{ ... }`
    Declaration, ///< `int x = 1;`
    Assignment,  ///< `x += 1;`
    If,          ///< `agr (c) s varna s`
    While,       ///< `jabtak (c) s`
    DoWhile,     ///< `do s jabtak (c);`
    For,         ///< `tabtak (init; cond; update) s`
    Break,
    Continue,
    Return,
    Print,       ///< `dikhao(a, b);`
    Input,       ///< `likho(x);`
    Expression,  ///< `f(x);`
};

/// @brief Base class for all statement nodes.
struct Stmt
{
    StmtKind kind;

    /// @brief Position of the leftmost token.
    SourceLoc loc;

    Stmt(StmtKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Stmt() = default;
};

struct BlockStmt : Stmt
{
    std::vector<StmtPtr> statements;

    BlockStmt(SourceLoc l, std::vector<StmtPtr> s)
        : Stmt(StmtKind::Block, l), statements(std::move(s))
    {
    }

    ~BlockStmt() override;
};

/// @brief Variable declaration with optional initializer.
struct DeclStmt : Stmt
{
    TypeKeyword type;
    std::string name;
    ExprPtr init; ///< May be null.

    DeclStmt(SourceLoc l, TypeKeyword t, std::string n, ExprPtr i)
        : Stmt(StmtKind::Declaration, l), type(t), name(std::move(n)), init(std::move(i))
    {
    }

    ~DeclStmt() override;
};

/// @brief Assignment to a named variable.
struct AssignStmt : Stmt
{
    std::string target;
    AssignOp op;
    ExprPtr value;

    AssignStmt(SourceLoc l, std::string t, AssignOp o, ExprPtr v)
        : Stmt(StmtKind::Assignment, l), target(std::move(t)), op(o), value(std::move(v))
    {
    }

    ~AssignStmt() override;
};

/// @brief Conditional; `elseBranch` binds to the nearest `agr`.
struct IfStmt : Stmt
{
    ExprPtr cond;
    StmtPtr thenBranch;
    StmtPtr elseBranch; ///< May be null.

    IfStmt(SourceLoc l, ExprPtr c, StmtPtr t, StmtPtr e)
        : Stmt(StmtKind::If, l), cond(std::move(c)), thenBranch(std::move(t)),
          elseBranch(std::move(e))
    {
    }

    ~IfStmt() override;
};

struct WhileStmt : Stmt
{
    ExprPtr cond;
    StmtPtr body;

    WhileStmt(SourceLoc l, ExprPtr c, StmtPtr b)
        : Stmt(StmtKind::While, l), cond(std::move(c)), body(std::move(b))
    {
    }

    ~WhileStmt() override;
};

struct DoWhileStmt : Stmt
{
    StmtPtr body;
    ExprPtr cond;

    DoWhileStmt(SourceLoc l, StmtPtr b, ExprPtr c)
        : Stmt(StmtKind::DoWhile, l), body(std::move(b)), cond(std::move(c))
    {
    }

    ~DoWhileStmt() override;
};

/// @brief `tabtak (init; cond; update, ...) body`.
/// @details `init` is a DeclStmt or AssignStmt, or null.  `cond` may be
///          null.  Each `update` item is an AssignStmt or an ExprStmt holding
///          a prefix/postfix `++`/`--`.
struct ForStmt : Stmt
{
    StmtPtr init;
    ExprPtr cond;
    std::vector<StmtPtr> update;
    StmtPtr body;

    ForStmt(SourceLoc l, StmtPtr i, ExprPtr c, std::vector<StmtPtr> u, StmtPtr b)
        : Stmt(StmtKind::For, l), init(std::move(i)), cond(std::move(c)), update(std::move(u)),
          body(std::move(b))
    {
    }

    ~ForStmt() override;
};

struct BreakStmt : Stmt
{
    explicit BreakStmt(SourceLoc l) : Stmt(StmtKind::Break, l) {}
};

struct ContinueStmt : Stmt
{
    explicit ContinueStmt(SourceLoc l) : Stmt(StmtKind::Continue, l) {}
};

struct ReturnStmt : Stmt
{
    ExprPtr value; ///< May be null.

    ReturnStmt(SourceLoc l, ExprPtr v) : Stmt(StmtKind::Return, l), value(std::move(v)) {}

    ~ReturnStmt() override;
};

/// @brief `dikhao(args...)`; an empty argument list is allowed.
struct PrintStmt : Stmt
{
    std::vector<ExprPtr> args;

    PrintStmt(SourceLoc l, std::vector<ExprPtr> a) : Stmt(StmtKind::Print, l), args(std::move(a))
    {
    }

    ~PrintStmt() override;
};

/// @brief `likho(name)`.
struct InputStmt : Stmt
{
    std::string name;

    InputStmt(SourceLoc l, std::string n) : Stmt(StmtKind::Input, l), name(std::move(n)) {}
};

struct ExprStmt : Stmt
{
    ExprPtr expr;

    ExprStmt(SourceLoc l, ExprPtr e) : Stmt(StmtKind::Expression, l), expr(std::move(e)) {}

    ~ExprStmt() override;
};

/// @brief Root of the tree.
struct Program
{
    SourceLoc loc;
    std::vector<StmtPtr> statements;
};

//===----------------------------------------------------------------------===//
// Structural equality
//===----------------------------------------------------------------------===//

/// @brief Compare kinds, payloads, positions and children; identity is
///        ignored.  Two null pointers compare equal.
bool exprEquals(const Expr *a, const Expr *b);

/// @copydoc exprEquals
bool stmtEquals(const Stmt *a, const Stmt *b);

bool programEquals(const Program &a, const Program &b);

} // namespace zaban::frontends::urdu
