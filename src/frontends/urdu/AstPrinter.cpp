//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.cpp
/// @brief Implements the tree dump and the S-expression renderer.
///
/// @details Both renderers expand nodes from an explicit work list rather
/// than recursing, so the depth of a left-folded operator chain is limited
/// only by memory.
///
//===----------------------------------------------------------------------===//

#include "frontends/urdu/AstPrinter.hpp"

#include <sstream>
#include <utility>
#include <vector>

namespace zaban::frontends::urdu
{

namespace
{

/// @brief A node still to be expanded, or literal text still to be written.
struct WorkItem
{
    const Expr *expr = nullptr;
    const Stmt *stmt = nullptr;
    std::string text;
    int indent = 0;
};

/// @brief Explicit stack shared by both renderers.
/// @details Items scheduled while one node is visited are collected in a
///          batch and moved onto the stack in reverse, so they pop in the
///          order they were scheduled.
class WorkList
{
  public:
    void schedule(WorkItem item)
    {
        batch_.push_back(std::move(item));
    }

    void commit()
    {
        for (auto it = batch_.rbegin(); it != batch_.rend(); ++it)
            stack_.push_back(std::move(*it));
        batch_.clear();
    }

    bool pop(WorkItem &out)
    {
        if (stack_.empty())
            return false;
        out = std::move(stack_.back());
        stack_.pop_back();
        return true;
    }

  private:
    std::vector<WorkItem> stack_;
    std::vector<WorkItem> batch_;
};

/// @brief Format a source location as "(line:col)".
std::string locStr(const SourceLoc &loc)
{
    std::ostringstream s;
    s << "(" << loc.line << ":" << loc.column << ")";
    return s.str();
}

const char *literalKindName(LiteralKind k)
{
    switch (k)
    {
        case LiteralKind::Integer:
            return "IntLiteral";
        case LiteralKind::Float:
            return "FloatLiteral";
        case LiteralKind::Boolean:
            return "BoolLiteral";
        case LiteralKind::String:
            return "StringLiteral";
        case LiteralKind::Char:
            return "CharLiteral";
    }
    return "Literal";
}

// ---------------------------------------------------------------------------
// Printer helper -- writes one line per node and schedules the children.
// ---------------------------------------------------------------------------

class Printer
{
  public:
    explicit Printer(std::ostream &os) : os_(os) {}

    void line(int indent, const std::string &text)
    {
        for (int i = 0; i < indent; ++i)
            os_ << "  ";
        os_ << text << '\n';
    }

    void print(const Stmt &root, int indent)
    {
        child(&root, indent);
        work_.commit();
        WorkItem item;
        while (work_.pop(item))
        {
            if (item.expr)
                visit(*item.expr, item.indent);
            else if (item.stmt)
                visit(*item.stmt, item.indent);
            else
                line(item.indent, item.text);
            work_.commit();
        }
    }

  private:
    void child(const Expr *expr, int indent)
    {
        work_.schedule({expr, nullptr, {}, indent});
    }

    void child(const Stmt *stmt, int indent)
    {
        work_.schedule({nullptr, stmt, {}, indent});
    }

    void text(int indent, std::string text)
    {
        work_.schedule({nullptr, nullptr, std::move(text), indent});
    }

    /// @brief Schedule an optional child under a label, or "<label>: <none>".
    template <typename Node> void labeled(int indent, const char *label, const Node *node)
    {
        if (!node)
        {
            text(indent, std::string(label) + ": <none>");
            return;
        }
        text(indent, std::string(label) + ":");
        child(node, indent + 1);
    }

    void visit(const Expr &expr, int indent);
    void visit(const Stmt &stmt, int indent);

    std::ostream &os_;
    WorkList work_;
};

// ---------------------------------------------------------------------------
// Expression printing
// ---------------------------------------------------------------------------

void Printer::visit(const Expr &expr, int indent)
{
    switch (expr.kind)
    {
        case ExprKind::Conditional:
        {
            const auto &e = static_cast<const ConditionalExpr &>(expr);
            line(indent, "ConditionalExpr " + locStr(e.loc));
            child(e.cond.get(), indent + 1);
            child(e.thenExpr.get(), indent + 1);
            child(e.elseExpr.get(), indent + 1);
            break;
        }
        case ExprKind::Binary:
        {
            const auto &e = static_cast<const BinaryExpr &>(expr);
            line(indent, std::string("BinaryExpr (") + binaryOpSpelling(e.op) + ") " + locStr(e.loc));
            child(e.left.get(), indent + 1);
            child(e.right.get(), indent + 1);
            break;
        }
        case ExprKind::Unary:
        {
            const auto &e = static_cast<const UnaryExpr &>(expr);
            line(indent, std::string("UnaryExpr (") + unaryOpSpelling(e.op) + ") " + locStr(e.loc));
            child(e.operand.get(), indent + 1);
            break;
        }
        case ExprKind::Postfix:
        {
            const auto &e = static_cast<const PostfixExpr &>(expr);
            line(indent,
                 std::string("PostfixExpr (") + postfixOpSpelling(e.op) + ") " + locStr(e.loc));
            child(e.operand.get(), indent + 1);
            if (e.op == PostfixOp::Index)
                labeled(indent + 1, "Index", e.index.get());
            if (e.op == PostfixOp::Call)
            {
                text(indent + 1, "Args: " + std::to_string(e.args.size()));
                for (const auto &arg : e.args)
                    child(arg.get(), indent + 2);
            }
            break;
        }
        case ExprKind::Literal:
        {
            const auto &e = static_cast<const LiteralExpr &>(expr);
            line(indent,
                 std::string(literalKindName(e.literalKind)) + " " + e.text + " " + locStr(e.loc));
            break;
        }
        case ExprKind::Identifier:
        {
            const auto &e = static_cast<const IdentifierExpr &>(expr);
            line(indent, "IdentExpr \"" + e.name + "\" " + locStr(e.loc));
            break;
        }
        case ExprKind::ArrayLiteral:
        {
            const auto &e = static_cast<const ArrayLiteralExpr &>(expr);
            line(indent, "ArrayLiteral [" + std::to_string(e.elements.size()) + "] " + locStr(e.loc));
            for (const auto &el : e.elements)
                child(el.get(), indent + 1);
            break;
        }
    }
}

// ---------------------------------------------------------------------------
// Statement printing
// ---------------------------------------------------------------------------

void Printer::visit(const Stmt &stmt, int indent)
{
    switch (stmt.kind)
    {
        case StmtKind::Block:
        {
            const auto &s = static_cast<const BlockStmt &>(stmt);
            line(indent, "BlockStmt " + locStr(s.loc));
            for (const auto &inner : s.statements)
                child(inner.get(), indent + 1);
            break;
        }
        case StmtKind::Declaration:
        {
            const auto &s = static_cast<const DeclStmt &>(stmt);
            line(indent, std::string("DeclStmt ") + typeKeywordSpelling(s.type) + " \"" + s.name +
                             "\" " + locStr(s.loc));
            if (s.init)
                child(s.init.get(), indent + 1);
            break;
        }
        case StmtKind::Assignment:
        {
            const auto &s = static_cast<const AssignStmt &>(stmt);
            line(indent, "AssignStmt \"" + s.target + "\" (" + assignOpSpelling(s.op) + ") " +
                             locStr(s.loc));
            child(s.value.get(), indent + 1);
            break;
        }
        case StmtKind::If:
        {
            const auto &s = static_cast<const IfStmt &>(stmt);
            line(indent, "IfStmt " + locStr(s.loc));
            labeled(indent + 1, "Cond", s.cond.get());
            labeled(indent + 1, "Then", s.thenBranch.get());
            if (s.elseBranch)
                labeled(indent + 1, "Else", s.elseBranch.get());
            break;
        }
        case StmtKind::While:
        {
            const auto &s = static_cast<const WhileStmt &>(stmt);
            line(indent, "WhileStmt " + locStr(s.loc));
            labeled(indent + 1, "Cond", s.cond.get());
            labeled(indent + 1, "Body", s.body.get());
            break;
        }
        case StmtKind::DoWhile:
        {
            const auto &s = static_cast<const DoWhileStmt &>(stmt);
            line(indent, "DoWhileStmt " + locStr(s.loc));
            labeled(indent + 1, "Body", s.body.get());
            labeled(indent + 1, "Cond", s.cond.get());
            break;
        }
        case StmtKind::For:
        {
            const auto &s = static_cast<const ForStmt &>(stmt);
            line(indent, "ForStmt " + locStr(s.loc));
            labeled(indent + 1, "Init", s.init.get());
            labeled(indent + 1, "Cond", s.cond.get());
            text(indent + 1, "Update: " + std::to_string(s.update.size()));
            for (const auto &u : s.update)
                child(u.get(), indent + 2);
            labeled(indent + 1, "Body", s.body.get());
            break;
        }
        case StmtKind::Break:
            line(indent, "BreakStmt " + locStr(stmt.loc));
            break;
        case StmtKind::Continue:
            line(indent, "ContinueStmt " + locStr(stmt.loc));
            break;
        case StmtKind::Return:
        {
            const auto &s = static_cast<const ReturnStmt &>(stmt);
            line(indent, "ReturnStmt " + locStr(s.loc));
            if (s.value)
                child(s.value.get(), indent + 1);
            break;
        }
        case StmtKind::Print:
        {
            const auto &s = static_cast<const PrintStmt &>(stmt);
            line(indent, "PrintStmt " + locStr(s.loc));
            for (const auto &arg : s.args)
                child(arg.get(), indent + 1);
            break;
        }
        case StmtKind::Input:
        {
            const auto &s = static_cast<const InputStmt &>(stmt);
            line(indent, "InputStmt \"" + s.name + "\" " + locStr(s.loc));
            break;
        }
        case StmtKind::Expression:
        {
            const auto &s = static_cast<const ExprStmt &>(stmt);
            line(indent, "ExprStmt " + locStr(s.loc));
            child(s.expr.get(), indent + 1);
            break;
        }
    }
}

// ---------------------------------------------------------------------------
// S-expressions
// ---------------------------------------------------------------------------

class SExprWriter
{
  public:
    std::string render(const Expr &root)
    {
        child(root);
        work_.commit();
        WorkItem item;
        while (work_.pop(item))
        {
            if (item.expr)
                visit(*item.expr);
            else
                out_ += item.text;
            work_.commit();
        }
        return std::move(out_);
    }

  private:
    void child(const Expr &expr)
    {
        work_.schedule({&expr, nullptr, {}, 0});
    }

    void text(std::string text)
    {
        work_.schedule({nullptr, nullptr, std::move(text), 0});
    }

    void list(const std::vector<ExprPtr> &items)
    {
        for (const auto &item : items)
        {
            text(" ");
            child(*item);
        }
    }

    void visit(const Expr &expr)
    {
        switch (expr.kind)
        {
            case ExprKind::Conditional:
            {
                const auto &e = static_cast<const ConditionalExpr &>(expr);
                out_ += "(?: ";
                child(*e.cond);
                text(" ");
                child(*e.thenExpr);
                text(" ");
                child(*e.elseExpr);
                text(")");
                break;
            }
            case ExprKind::Binary:
            {
                const auto &e = static_cast<const BinaryExpr &>(expr);
                out_ += '(';
                out_ += binaryOpSpelling(e.op);
                out_ += ' ';
                child(*e.left);
                text(" ");
                child(*e.right);
                text(")");
                break;
            }
            case ExprKind::Unary:
            {
                const auto &e = static_cast<const UnaryExpr &>(expr);
                out_ += '(';
                out_ += unaryOpSpelling(e.op);
                out_ += ' ';
                child(*e.operand);
                text(")");
                break;
            }
            case ExprKind::Postfix:
            {
                const auto &e = static_cast<const PostfixExpr &>(expr);
                switch (e.op)
                {
                    case PostfixOp::Increment:
                        out_ += "(post++ ";
                        child(*e.operand);
                        break;
                    case PostfixOp::Decrement:
                        out_ += "(post-- ";
                        child(*e.operand);
                        break;
                    case PostfixOp::Index:
                        out_ += "(index ";
                        child(*e.operand);
                        text(" ");
                        child(*e.index);
                        break;
                    case PostfixOp::Call:
                        out_ += "(call ";
                        child(*e.operand);
                        list(e.args);
                        break;
                }
                text(")");
                break;
            }
            case ExprKind::Literal:
                out_ += static_cast<const LiteralExpr &>(expr).text;
                break;
            case ExprKind::Identifier:
                out_ += static_cast<const IdentifierExpr &>(expr).name;
                break;
            case ExprKind::ArrayLiteral:
                out_ += "(array";
                list(static_cast<const ArrayLiteralExpr &>(expr).elements);
                text(")");
                break;
        }
    }

    std::string out_;
    WorkList work_;
};

} // namespace

std::string AstPrinter::dump(const Program &program)
{
    std::ostringstream os;
    Printer p{os};
    p.line(0, "Program " + locStr(program.loc));
    for (const auto &stmt : program.statements)
        p.print(*stmt, 1);
    return os.str();
}

std::string AstPrinter::dump(const Stmt &stmt)
{
    std::ostringstream os;
    Printer p{os};
    p.print(stmt, 0);
    return os.str();
}

std::string toSExpr(const Expr &expr)
{
    SExprWriter writer;
    return writer.render(expr);
}

} // namespace zaban::frontends::urdu
