// File: tests/unit/test_urdu_parser_stmt.cpp
// Purpose: Statement forms of the Urdu-keyword grammar: declarations,
//          assignments, control flow, jumps, print and input.
// Key invariants: Well-formed programs produce no diagnostics and one node
//                 per top-level statement.
// Ownership/Lifetime: Standalone unit test executable.
// Links: docs/frontend.md

#include <gtest/gtest.h>

#include "frontends/urdu/AstPrinter.hpp"
#include "frontends/urdu/Frontend.hpp"
#include "support/source_manager.hpp"

#include <iostream>
#include <sstream>
#include <string>

using namespace zaban::frontends::urdu;
using zaban::support::SourceManager;

namespace
{
struct Parsed
{
    SourceManager sm;
    ParseResult result;

    explicit Parsed(const std::string &src)
    {
        ParseInput input{src, "stmt.zb"};
        result = parse(input, {}, sm);
    }

    const Stmt &stmt(size_t i) const
    {
        return *result.program.statements.at(i);
    }

    size_t count() const
    {
        return result.program.statements.size();
    }
};

template <typename T> const T &as(const Stmt &s)
{
    return static_cast<const T &>(s);
}
} // namespace

TEST(UrduParserStmt, Declarations)
{
    Parsed p("int x = 5; float f; bool b = true; string s = \"hi\"; char c = 'c';");
    ASSERT_TRUE(p.result.succeeded());
    ASSERT_EQ(p.count(), 5u);

    const auto &x = as<DeclStmt>(p.stmt(0));
    EXPECT_EQ(x.type, TypeKeyword::Int);
    EXPECT_EQ(x.name, "x");
    ASSERT_NE(x.init.get(), nullptr);
    EXPECT_EQ(toSExpr(*x.init), "5");

    const auto &f = as<DeclStmt>(p.stmt(1));
    EXPECT_EQ(f.type, TypeKeyword::Float);
    EXPECT_EQ(f.init.get(), nullptr);

    EXPECT_EQ(as<DeclStmt>(p.stmt(2)).type, TypeKeyword::Bool);
    EXPECT_EQ(as<DeclStmt>(p.stmt(3)).type, TypeKeyword::String);
    EXPECT_EQ(as<DeclStmt>(p.stmt(4)).type, TypeKeyword::Char);
}

TEST(UrduParserStmt, AssignmentOperators)
{
    Parsed p("x = 1; x += 2; x -= 3; x *= 4; x /= 5;");
    ASSERT_TRUE(p.result.succeeded());
    ASSERT_EQ(p.count(), 5u);
    EXPECT_EQ(as<AssignStmt>(p.stmt(0)).op, AssignOp::Assign);
    EXPECT_EQ(as<AssignStmt>(p.stmt(1)).op, AssignOp::AddAssign);
    EXPECT_EQ(as<AssignStmt>(p.stmt(2)).op, AssignOp::SubAssign);
    EXPECT_EQ(as<AssignStmt>(p.stmt(3)).op, AssignOp::MulAssign);
    EXPECT_EQ(as<AssignStmt>(p.stmt(4)).op, AssignOp::DivAssign);
    EXPECT_EQ(as<AssignStmt>(p.stmt(0)).target, "x");
}

TEST(UrduParserStmt, ExpressionStatements)
{
    Parsed p("i++; f(1, 2); --j;");
    ASSERT_TRUE(p.result.succeeded());
    ASSERT_EQ(p.count(), 3u);
    for (size_t i = 0; i < 3; ++i)
        EXPECT_EQ(p.stmt(i).kind, StmtKind::Expression);
    EXPECT_EQ(toSExpr(*as<ExprStmt>(p.stmt(1)).expr), "(call f 1 2)");
}

TEST(UrduParserStmt, IfElse)
{
    Parsed p("agr (x > 0) { dikhao(x); } varna { dikhao(0); }");
    ASSERT_TRUE(p.result.succeeded());
    ASSERT_EQ(p.count(), 1u);
    const auto &s = as<IfStmt>(p.stmt(0));
    EXPECT_EQ(toSExpr(*s.cond), "(> x 0)");
    ASSERT_NE(s.thenBranch.get(), nullptr);
    EXPECT_EQ(s.thenBranch->kind, StmtKind::Block);
    ASSERT_NE(s.elseBranch.get(), nullptr);
    EXPECT_EQ(s.elseBranch->kind, StmtKind::Block);
}

TEST(UrduParserStmt, DanglingElseBindsToInnerIf)
{
    Parsed p("agr (a) agr (b) x = 1; varna x = 2;");
    ASSERT_TRUE(p.result.succeeded());
    ASSERT_EQ(p.count(), 1u);
    const auto &outer = as<IfStmt>(p.stmt(0));
    EXPECT_EQ(outer.elseBranch.get(), nullptr);
    ASSERT_EQ(outer.thenBranch->kind, StmtKind::If);
    const auto &inner = as<IfStmt>(*outer.thenBranch);
    ASSERT_NE(inner.elseBranch.get(), nullptr);
    EXPECT_EQ(inner.elseBranch->kind, StmtKind::Assignment);
}

TEST(UrduParserStmt, ElseIfChain)
{
    Parsed p("agr (a) x = 1; varna agr (b) x = 2; varna x = 3;");
    ASSERT_TRUE(p.result.succeeded());
    const auto &first = as<IfStmt>(p.stmt(0));
    ASSERT_NE(first.elseBranch.get(), nullptr);
    ASSERT_EQ(first.elseBranch->kind, StmtKind::If);
    EXPECT_NE(as<IfStmt>(*first.elseBranch).elseBranch.get(), nullptr);
}

TEST(UrduParserStmt, WhileAndDoWhile)
{
    Parsed p("jabtak (i < 10) i++; do { i--; } jabtak (i > 0);");
    ASSERT_TRUE(p.result.succeeded());
    ASSERT_EQ(p.count(), 2u);
    const auto &w = as<WhileStmt>(p.stmt(0));
    EXPECT_EQ(toSExpr(*w.cond), "(< i 10)");
    EXPECT_EQ(w.body->kind, StmtKind::Expression);
    const auto &d = as<DoWhileStmt>(p.stmt(1));
    EXPECT_EQ(d.body->kind, StmtKind::Block);
    EXPECT_EQ(toSExpr(*d.cond), "(> i 0)");
}

TEST(UrduParserStmt, ForWithDeclarationAndUpdates)
{
    Parsed p("tabtak (int i = 0; i < 10; i++, j += 2, --k) { dikhao(i); }");
    ASSERT_TRUE(p.result.succeeded());
    ASSERT_EQ(p.count(), 1u);
    const auto &f = as<ForStmt>(p.stmt(0));
    ASSERT_NE(f.init.get(), nullptr);
    EXPECT_EQ(f.init->kind, StmtKind::Declaration);
    ASSERT_NE(f.cond.get(), nullptr);
    EXPECT_EQ(toSExpr(*f.cond), "(< i 10)");
    ASSERT_EQ(f.update.size(), 3u);
    EXPECT_EQ(toSExpr(*as<ExprStmt>(*f.update[0]).expr), "(post++ i)");
    EXPECT_EQ(f.update[1]->kind, StmtKind::Assignment);
    EXPECT_EQ(toSExpr(*as<ExprStmt>(*f.update[2]).expr), "(-- k)");
    EXPECT_EQ(f.body->kind, StmtKind::Block);
}

TEST(UrduParserStmt, ForWithEmptyClauses)
{
    Parsed p("tabtak (; true; ) { break; }");
    ASSERT_TRUE(p.result.succeeded());
    const auto &f = as<ForStmt>(p.stmt(0));
    EXPECT_EQ(f.init.get(), nullptr);
    ASSERT_NE(f.cond.get(), nullptr);
    EXPECT_TRUE(f.update.empty());

    Parsed q("tabtak (i = 0; ; ) continue;");
    ASSERT_TRUE(q.result.succeeded());
    const auto &g = as<ForStmt>(q.stmt(0));
    ASSERT_NE(g.init.get(), nullptr);
    EXPECT_EQ(g.init->kind, StmtKind::Assignment);
    EXPECT_EQ(g.cond.get(), nullptr);
    EXPECT_EQ(g.body->kind, StmtKind::Continue);
}

TEST(UrduParserStmt, JumpsAndReturn)
{
    Parsed p("break; continue; return; return x + 1;");
    ASSERT_TRUE(p.result.succeeded());
    ASSERT_EQ(p.count(), 4u);
    EXPECT_EQ(p.stmt(0).kind, StmtKind::Break);
    EXPECT_EQ(p.stmt(1).kind, StmtKind::Continue);
    EXPECT_EQ(as<ReturnStmt>(p.stmt(2)).value.get(), nullptr);
    ASSERT_NE(as<ReturnStmt>(p.stmt(3)).value.get(), nullptr);
    EXPECT_EQ(toSExpr(*as<ReturnStmt>(p.stmt(3)).value), "(+ x 1)");
}

TEST(UrduParserStmt, PrintAndInput)
{
    Parsed p("dikhao(\"sum:\", a + b); dikhao(); likho(n);");
    ASSERT_TRUE(p.result.succeeded());
    ASSERT_EQ(p.count(), 3u);
    EXPECT_EQ(as<PrintStmt>(p.stmt(0)).args.size(), 2u);
    EXPECT_TRUE(as<PrintStmt>(p.stmt(1)).args.empty());
    EXPECT_EQ(as<InputStmt>(p.stmt(2)).name, "n");
}

TEST(UrduParserStmt, NestedBlocks)
{
    Parsed p("{ int x = 1; { x = 2; { } } }");
    ASSERT_TRUE(p.result.succeeded());
    ASSERT_EQ(p.count(), 1u);
    const auto &outer = as<BlockStmt>(p.stmt(0));
    ASSERT_EQ(outer.statements.size(), 2u);
    const auto &mid = as<BlockStmt>(*outer.statements[1]);
    ASSERT_EQ(mid.statements.size(), 2u);
    EXPECT_TRUE(as<BlockStmt>(*mid.statements[1]).statements.empty());
}

TEST(UrduParserStmt, StatementLocations)
{
    Parsed p("int x = 1;\n  agr (x) {\n    x = 2;\n  }");
    ASSERT_TRUE(p.result.succeeded());
    EXPECT_EQ(p.stmt(0).loc.line, 1u);
    EXPECT_EQ(p.stmt(0).loc.column, 1u);
    EXPECT_EQ(p.stmt(1).loc.line, 2u);
    EXPECT_EQ(p.stmt(1).loc.column, 3u);
    const auto &body = as<BlockStmt>(*as<IfStmt>(p.stmt(1)).thenBranch);
    EXPECT_EQ(body.loc.column, 11u);
    EXPECT_EQ(body.statements[0]->loc.line, 3u);
    EXPECT_EQ(body.statements[0]->loc.column, 5u);
}

TEST(UrduParserStmt, EmptyProgram)
{
    Parsed p("// nothing here\n");
    EXPECT_TRUE(p.result.succeeded());
    EXPECT_EQ(p.count(), 0u);
    EXPECT_TRUE(p.result.diagnostics.empty());
}

TEST(UrduParserStmt, StrayTopLevelSemicolonWarns)
{
    Parsed p("x = 1;; y = 2;");
    EXPECT_TRUE(p.result.succeeded());
    EXPECT_EQ(p.count(), 2u);
    ASSERT_EQ(p.result.warningCount(), 1u);
    EXPECT_EQ(p.result.diagnostics[0].kind, DiagKind::EmptyStatement);
    EXPECT_EQ(p.result.diagnostics[0].code, "Z9001");
    EXPECT_EQ(p.result.diagnostics[0].loc.column, 7u);
}

TEST(UrduParserStmt, EmptyLoopBodyBecomesEmptyBlock)
{
    Parsed p("jabtak (x) ;");
    EXPECT_TRUE(p.result.succeeded());
    EXPECT_EQ(p.result.warningCount(), 1u);
    const auto &w = as<WhileStmt>(p.stmt(0));
    ASSERT_EQ(w.body->kind, StmtKind::Block);
    EXPECT_TRUE(as<BlockStmt>(*w.body).statements.empty());
}

TEST(UrduParserStmt, TraceReportsOneCombinedPhase)
{
    SourceManager sm;
    std::string src = "int x = 1;\ndikhao(x);";
    ParseInput input{src, "trace.zb"};
    ParseOptions options;
    options.trace = true;

    std::ostringstream captured;
    auto *old = std::cerr.rdbuf(captured.rdbuf());
    ParseResult result = parse(input, options, sm);
    std::cerr.rdbuf(old);

    ASSERT_TRUE(result.succeeded());
    const std::string trace = captured.str();
    const auto begin = trace.find("[zaban] Phase 1: Lexing+Parsing");
    const auto done = trace.find("[zaban] Phase 1: Done");
    ASSERT_NE(begin, std::string::npos);
    ASSERT_NE(done, std::string::npos);
    EXPECT_LT(begin, done);
    EXPECT_EQ(trace.find("Phase 2"), std::string::npos);
    EXPECT_NE(trace.find("[zaban] 2 statement(s), 0 error(s), 0 warning(s)"), std::string::npos);
}
