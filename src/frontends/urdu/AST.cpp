//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Operator spellings, iterative teardown and structural equality for AST
// nodes.  Teardown and equality switch over every node kind, so adding a kind
// without extending them triggers -Wswitch.
//
//===----------------------------------------------------------------------===//

#include "frontends/urdu/AST.hpp"

#include <utility>

namespace zaban::frontends::urdu
{

const char *typeKeywordSpelling(TypeKeyword t)
{
    switch (t)
    {
        case TypeKeyword::Int:
            return "int";
        case TypeKeyword::Float:
            return "float";
        case TypeKeyword::Bool:
            return "bool";
        case TypeKeyword::String:
            return "string";
        case TypeKeyword::Char:
            return "char";
    }
    return "?";
}

const char *binaryOpSpelling(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Or:
            return "||";
        case BinaryOp::And:
            return "&&";
        case BinaryOp::Eq:
            return "==";
        case BinaryOp::Ne:
            return "!=";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Ge:
            return ">=";
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Mod:
            return "%";
    }
    return "?";
}

const char *unaryOpSpelling(UnaryOp op)
{
    switch (op)
    {
        case UnaryOp::Not:
            return "!";
        case UnaryOp::Neg:
            return "-";
        case UnaryOp::Plus:
            return "+";
        case UnaryOp::PreIncrement:
            return "++";
        case UnaryOp::PreDecrement:
            return "--";
    }
    return "?";
}

const char *postfixOpSpelling(PostfixOp op)
{
    switch (op)
    {
        case PostfixOp::Increment:
            return "++";
        case PostfixOp::Decrement:
            return "--";
        case PostfixOp::Index:
            return "[]";
        case PostfixOp::Call:
            return "()";
    }
    return "?";
}

const char *assignOpSpelling(AssignOp op)
{
    switch (op)
    {
        case AssignOp::Assign:
            return "=";
        case AssignOp::AddAssign:
            return "+=";
        case AssignOp::SubAssign:
            return "-=";
        case AssignOp::MulAssign:
            return "*=";
        case AssignOp::DivAssign:
            return "/=";
    }
    return "?";
}

namespace
{

/// @brief Frees a subtree with a loop instead of nested destructor calls.
/// @details Children are moved into the worklist before their parent dies, so
///          every node is destroyed with its own child pointers already empty.
class TreeReleaser
{
  public:
    void detach(Expr &expr)
    {
        switch (expr.kind)
        {
            case ExprKind::Conditional:
            {
                auto &e = static_cast<ConditionalExpr &>(expr);
                take(e.cond);
                take(e.thenExpr);
                take(e.elseExpr);
                break;
            }
            case ExprKind::Binary:
            {
                auto &e = static_cast<BinaryExpr &>(expr);
                take(e.left);
                take(e.right);
                break;
            }
            case ExprKind::Unary:
                take(static_cast<UnaryExpr &>(expr).operand);
                break;
            case ExprKind::Postfix:
            {
                auto &e = static_cast<PostfixExpr &>(expr);
                take(e.operand);
                take(e.index);
                take(e.args);
                break;
            }
            case ExprKind::ArrayLiteral:
                take(static_cast<ArrayLiteralExpr &>(expr).elements);
                break;
            case ExprKind::Literal:
            case ExprKind::Identifier:
                break;
        }
    }

    void detach(Stmt &stmt)
    {
        switch (stmt.kind)
        {
            case StmtKind::Block:
                take(static_cast<BlockStmt &>(stmt).statements);
                break;
            case StmtKind::Declaration:
                take(static_cast<DeclStmt &>(stmt).init);
                break;
            case StmtKind::Assignment:
                take(static_cast<AssignStmt &>(stmt).value);
                break;
            case StmtKind::If:
            {
                auto &s = static_cast<IfStmt &>(stmt);
                take(s.cond);
                take(s.thenBranch);
                take(s.elseBranch);
                break;
            }
            case StmtKind::While:
            {
                auto &s = static_cast<WhileStmt &>(stmt);
                take(s.cond);
                take(s.body);
                break;
            }
            case StmtKind::DoWhile:
            {
                auto &s = static_cast<DoWhileStmt &>(stmt);
                take(s.body);
                take(s.cond);
                break;
            }
            case StmtKind::For:
            {
                auto &s = static_cast<ForStmt &>(stmt);
                take(s.init);
                take(s.cond);
                take(s.update);
                take(s.body);
                break;
            }
            case StmtKind::Return:
                take(static_cast<ReturnStmt &>(stmt).value);
                break;
            case StmtKind::Print:
                take(static_cast<PrintStmt &>(stmt).args);
                break;
            case StmtKind::Expression:
                take(static_cast<ExprStmt &>(stmt).expr);
                break;
            case StmtKind::Break:
            case StmtKind::Continue:
            case StmtKind::Input:
                break;
        }
    }

    void drain()
    {
        while (!exprs_.empty() || !stmts_.empty())
        {
            if (!stmts_.empty())
            {
                StmtPtr stmt = std::move(stmts_.back());
                stmts_.pop_back();
                detach(*stmt);
                continue;
            }
            ExprPtr expr = std::move(exprs_.back());
            exprs_.pop_back();
            detach(*expr);
        }
    }

  private:
    void take(ExprPtr &child)
    {
        if (child)
            exprs_.push_back(std::move(child));
    }

    void take(StmtPtr &child)
    {
        if (child)
            stmts_.push_back(std::move(child));
    }

    void take(std::vector<ExprPtr> &children)
    {
        for (auto &child : children)
            take(child);
        children.clear();
    }

    void take(std::vector<StmtPtr> &children)
    {
        for (auto &child : children)
            take(child);
        children.clear();
    }

    std::vector<ExprPtr> exprs_;
    std::vector<StmtPtr> stmts_;
};

template <typename Node> void releaseChildren(Node &node)
{
    TreeReleaser releaser;
    releaser.detach(node);
    releaser.drain();
}

/// @brief Pairs of nodes still to be compared.
/// @details compare() checks the payload of one pair and queues its children,
///          so the walk needs no native recursion.
class TreeComparer
{
  public:
    void add(const Expr *a, const Expr *b)
    {
        exprs_.emplace_back(a, b);
    }

    void add(const Stmt *a, const Stmt *b)
    {
        stmts_.emplace_back(a, b);
    }

    bool addList(const std::vector<ExprPtr> &a, const std::vector<ExprPtr> &b)
    {
        if (a.size() != b.size())
            return false;
        for (size_t i = 0; i < a.size(); ++i)
            add(a[i].get(), b[i].get());
        return true;
    }

    bool addList(const std::vector<StmtPtr> &a, const std::vector<StmtPtr> &b)
    {
        if (a.size() != b.size())
            return false;
        for (size_t i = 0; i < a.size(); ++i)
            add(a[i].get(), b[i].get());
        return true;
    }

    bool run()
    {
        while (!exprs_.empty() || !stmts_.empty())
        {
            bool same;
            if (!stmts_.empty())
            {
                auto [a, b] = stmts_.back();
                stmts_.pop_back();
                same = compare(a, b);
            }
            else
            {
                auto [a, b] = exprs_.back();
                exprs_.pop_back();
                same = compare(a, b);
            }
            if (!same)
                return false;
        }
        return true;
    }

  private:
    bool compare(const Expr *a, const Expr *b)
    {
        if (a == nullptr || b == nullptr)
            return a == b;
        if (a->kind != b->kind || a->loc != b->loc)
            return false;

        switch (a->kind)
        {
            case ExprKind::Conditional:
            {
                auto &x = static_cast<const ConditionalExpr &>(*a);
                auto &y = static_cast<const ConditionalExpr &>(*b);
                add(x.cond.get(), y.cond.get());
                add(x.thenExpr.get(), y.thenExpr.get());
                add(x.elseExpr.get(), y.elseExpr.get());
                return true;
            }
            case ExprKind::Binary:
            {
                auto &x = static_cast<const BinaryExpr &>(*a);
                auto &y = static_cast<const BinaryExpr &>(*b);
                if (x.op != y.op)
                    return false;
                add(x.left.get(), y.left.get());
                add(x.right.get(), y.right.get());
                return true;
            }
            case ExprKind::Unary:
            {
                auto &x = static_cast<const UnaryExpr &>(*a);
                auto &y = static_cast<const UnaryExpr &>(*b);
                if (x.op != y.op || x.prefix != y.prefix)
                    return false;
                add(x.operand.get(), y.operand.get());
                return true;
            }
            case ExprKind::Postfix:
            {
                auto &x = static_cast<const PostfixExpr &>(*a);
                auto &y = static_cast<const PostfixExpr &>(*b);
                if (x.op != y.op)
                    return false;
                add(x.operand.get(), y.operand.get());
                add(x.index.get(), y.index.get());
                return addList(x.args, y.args);
            }
            case ExprKind::Literal:
            {
                auto &x = static_cast<const LiteralExpr &>(*a);
                auto &y = static_cast<const LiteralExpr &>(*b);
                return x.literalKind == y.literalKind && x.text == y.text &&
                       x.intValue == y.intValue && x.floatValue == y.floatValue &&
                       x.boolValue == y.boolValue && x.stringValue == y.stringValue;
            }
            case ExprKind::Identifier:
                return static_cast<const IdentifierExpr &>(*a).name ==
                       static_cast<const IdentifierExpr &>(*b).name;
            case ExprKind::ArrayLiteral:
                return addList(static_cast<const ArrayLiteralExpr &>(*a).elements,
                               static_cast<const ArrayLiteralExpr &>(*b).elements);
        }
        return false;
    }

    bool compare(const Stmt *a, const Stmt *b)
    {
        if (a == nullptr || b == nullptr)
            return a == b;
        if (a->kind != b->kind || a->loc != b->loc)
            return false;

        switch (a->kind)
        {
            case StmtKind::Block:
                return addList(static_cast<const BlockStmt &>(*a).statements,
                               static_cast<const BlockStmt &>(*b).statements);
            case StmtKind::Declaration:
            {
                auto &x = static_cast<const DeclStmt &>(*a);
                auto &y = static_cast<const DeclStmt &>(*b);
                if (x.type != y.type || x.name != y.name)
                    return false;
                add(x.init.get(), y.init.get());
                return true;
            }
            case StmtKind::Assignment:
            {
                auto &x = static_cast<const AssignStmt &>(*a);
                auto &y = static_cast<const AssignStmt &>(*b);
                if (x.target != y.target || x.op != y.op)
                    return false;
                add(x.value.get(), y.value.get());
                return true;
            }
            case StmtKind::If:
            {
                auto &x = static_cast<const IfStmt &>(*a);
                auto &y = static_cast<const IfStmt &>(*b);
                add(x.cond.get(), y.cond.get());
                add(x.thenBranch.get(), y.thenBranch.get());
                add(x.elseBranch.get(), y.elseBranch.get());
                return true;
            }
            case StmtKind::While:
            {
                auto &x = static_cast<const WhileStmt &>(*a);
                auto &y = static_cast<const WhileStmt &>(*b);
                add(x.cond.get(), y.cond.get());
                add(x.body.get(), y.body.get());
                return true;
            }
            case StmtKind::DoWhile:
            {
                auto &x = static_cast<const DoWhileStmt &>(*a);
                auto &y = static_cast<const DoWhileStmt &>(*b);
                add(x.body.get(), y.body.get());
                add(x.cond.get(), y.cond.get());
                return true;
            }
            case StmtKind::For:
            {
                auto &x = static_cast<const ForStmt &>(*a);
                auto &y = static_cast<const ForStmt &>(*b);
                add(x.init.get(), y.init.get());
                add(x.cond.get(), y.cond.get());
                add(x.body.get(), y.body.get());
                return addList(x.update, y.update);
            }
            case StmtKind::Break:
            case StmtKind::Continue:
                return true;
            case StmtKind::Return:
                add(static_cast<const ReturnStmt &>(*a).value.get(),
                    static_cast<const ReturnStmt &>(*b).value.get());
                return true;
            case StmtKind::Print:
                return addList(static_cast<const PrintStmt &>(*a).args,
                               static_cast<const PrintStmt &>(*b).args);
            case StmtKind::Input:
                return static_cast<const InputStmt &>(*a).name ==
                       static_cast<const InputStmt &>(*b).name;
            case StmtKind::Expression:
                add(static_cast<const ExprStmt &>(*a).expr.get(),
                    static_cast<const ExprStmt &>(*b).expr.get());
                return true;
        }
        return false;
    }

    std::vector<std::pair<const Expr *, const Expr *>> exprs_;
    std::vector<std::pair<const Stmt *, const Stmt *>> stmts_;
};

} // namespace

ConditionalExpr::~ConditionalExpr()
{
    releaseChildren(*this);
}

BinaryExpr::~BinaryExpr()
{
    releaseChildren(*this);
}

UnaryExpr::~UnaryExpr()
{
    releaseChildren(*this);
}

PostfixExpr::~PostfixExpr()
{
    releaseChildren(*this);
}

ArrayLiteralExpr::~ArrayLiteralExpr()
{
    releaseChildren(*this);
}

BlockStmt::~BlockStmt()
{
    releaseChildren(*this);
}

DeclStmt::~DeclStmt()
{
    releaseChildren(*this);
}

AssignStmt::~AssignStmt()
{
    releaseChildren(*this);
}

IfStmt::~IfStmt()
{
    releaseChildren(*this);
}

WhileStmt::~WhileStmt()
{
    releaseChildren(*this);
}

DoWhileStmt::~DoWhileStmt()
{
    releaseChildren(*this);
}

ForStmt::~ForStmt()
{
    releaseChildren(*this);
}

ReturnStmt::~ReturnStmt()
{
    releaseChildren(*this);
}

PrintStmt::~PrintStmt()
{
    releaseChildren(*this);
}

ExprStmt::~ExprStmt()
{
    releaseChildren(*this);
}

bool exprEquals(const Expr *a, const Expr *b)
{
    TreeComparer comparer;
    comparer.add(a, b);
    return comparer.run();
}

bool stmtEquals(const Stmt *a, const Stmt *b)
{
    TreeComparer comparer;
    comparer.add(a, b);
    return comparer.run();
}

bool programEquals(const Program &a, const Program &b)
{
    if (a.loc != b.loc)
        return false;
    TreeComparer comparer;
    return comparer.addList(a.statements, b.statements) && comparer.run();
}

} // namespace zaban::frontends::urdu
