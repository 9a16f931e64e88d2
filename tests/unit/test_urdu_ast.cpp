// File: tests/unit/test_urdu_ast.cpp
// Purpose: AST dump format, S-expression rendering, operator spellings,
//          structural equality, and teardown of very deep trees.
// Key invariants: Dumps list one node per line with its "(line:col)".
//                 Freeing, comparing and printing a left-folded chain does
//                 not recurse once per operand.
// Ownership/Lifetime: Standalone unit test executable.
// Links: docs/frontend.md

#include <gtest/gtest.h>

#include "frontends/urdu/AST.hpp"
#include "frontends/urdu/AstPrinter.hpp"
#include "frontends/urdu/Frontend.hpp"
#include "support/source_manager.hpp"

#include <string>

using namespace zaban::frontends::urdu;
using zaban::support::SourceManager;

namespace
{
ParseResult parseSource(const std::string &src, SourceManager &sm)
{
    ParseInput input{src, "ast.zb"};
    return parse(input, {}, sm);
}

std::string dumpOf(const std::string &src)
{
    SourceManager sm;
    auto result = parseSource(src, sm);
    EXPECT_TRUE(result.succeeded()) << src;
    AstPrinter printer;
    return printer.dump(result.program);
}
} // namespace

TEST(UrduAstPrinter, DeclarationWithBinaryInitializer)
{
    EXPECT_EQ(dumpOf("int x = 2 + 3;"),
              "Program (1:1)\n"
              "  DeclStmt int \"x\" (1:1)\n"
              "    BinaryExpr (+) (1:9)\n"
              "      IntLiteral 2 (1:9)\n"
              "      IntLiteral 3 (1:13)\n");
}

TEST(UrduAstPrinter, ForLoop)
{
    EXPECT_EQ(dumpOf("tabtak (int i = 0; i < 3; i++) dikhao(i);"),
              "Program (1:1)\n"
              "  ForStmt (1:1)\n"
              "    Init:\n"
              "      DeclStmt int \"i\" (1:9)\n"
              "        IntLiteral 0 (1:17)\n"
              "    Cond:\n"
              "      BinaryExpr (<) (1:20)\n"
              "        IdentExpr \"i\" (1:20)\n"
              "        IntLiteral 3 (1:24)\n"
              "    Update: 1\n"
              "      ExprStmt (1:27)\n"
              "        PostfixExpr (++) (1:27)\n"
              "          IdentExpr \"i\" (1:27)\n"
              "    Body:\n"
              "      PrintStmt (1:32)\n"
              "        IdentExpr \"i\" (1:39)\n");
}

TEST(UrduAstPrinter, IfWithoutElse)
{
    EXPECT_EQ(dumpOf("agr (x) y = 1;"),
              "Program (1:1)\n"
              "  IfStmt (1:1)\n"
              "    Cond:\n"
              "      IdentExpr \"x\" (1:6)\n"
              "    Then:\n"
              "      AssignStmt \"y\" (=) (1:9)\n"
              "        IntLiteral 1 (1:13)\n");
}

TEST(UrduAstPrinter, ForWithEmptyClauses)
{
    EXPECT_EQ(dumpOf("tabtak (;;) break;"),
              "Program (1:1)\n"
              "  ForStmt (1:1)\n"
              "    Init: <none>\n"
              "    Cond: <none>\n"
              "    Update: 0\n"
              "    Body:\n"
              "      BreakStmt (1:13)\n");
}

TEST(UrduAstPrinter, CallsIndexesAndLiterals)
{
    EXPECT_EQ(dumpOf("f(a[1], \"s\", 'c', true, 2.5);"),
              "Program (1:1)\n"
              "  ExprStmt (1:1)\n"
              "    PostfixExpr (()) (1:1)\n"
              "      IdentExpr \"f\" (1:1)\n"
              "      Args: 5\n"
              "        PostfixExpr ([]) (1:3)\n"
              "          IdentExpr \"a\" (1:3)\n"
              "          Index:\n"
              "            IntLiteral 1 (1:5)\n"
              "        StringLiteral \"s\" (1:9)\n"
              "        CharLiteral 'c' (1:14)\n"
              "        BoolLiteral true (1:19)\n"
              "        FloatLiteral 2.5 (1:25)\n");
}

TEST(UrduAstPrinter, SingleStatementDump)
{
    SourceManager sm;
    auto result = parseSource("{ likho(n); return; }", sm);
    ASSERT_TRUE(result.succeeded());
    AstPrinter printer;
    EXPECT_EQ(printer.dump(*result.program.statements[0]),
              "BlockStmt (1:1)\n"
              "  InputStmt \"n\" (1:3)\n"
              "  ReturnStmt (1:13)\n");
}

TEST(UrduAstSpelling, Operators)
{
    EXPECT_STREQ(binaryOpSpelling(BinaryOp::Le), "<=");
    EXPECT_STREQ(binaryOpSpelling(BinaryOp::Or), "||");
    EXPECT_STREQ(unaryOpSpelling(UnaryOp::Not), "!");
    EXPECT_STREQ(postfixOpSpelling(PostfixOp::Index), "[]");
    EXPECT_STREQ(assignOpSpelling(AssignOp::DivAssign), "/=");
    EXPECT_STREQ(typeKeywordSpelling(TypeKeyword::String), "string");
}

TEST(UrduAstEquality, SameSourceIsEqual)
{
    SourceManager sm;
    const std::string src = "int x = 1; agr (x > 0) { dikhao(x, [1, 2]); } varna x -= 1;";
    auto a = parseSource(src, sm);
    auto b = parseSource(src, sm);
    ASSERT_TRUE(a.succeeded());
    EXPECT_TRUE(programEquals(a.program, b.program));
}

TEST(UrduAstEquality, DifferencesAreDetected)
{
    SourceManager sm;
    auto base = parseSource("x = 1 + 2;", sm);
    auto value = parseSource("x = 1 + 3;", sm);
    auto op = parseSource("x = 1 - 2;", sm);
    auto spacing = parseSource("x =  1 + 2;", sm);
    EXPECT_FALSE(programEquals(base.program, value.program));
    EXPECT_FALSE(programEquals(base.program, op.program));
    // Locations are part of the structure.
    EXPECT_FALSE(programEquals(base.program, spacing.program));
}

TEST(UrduAstEquality, NullHandling)
{
    EXPECT_TRUE(exprEquals(nullptr, nullptr));
    EXPECT_TRUE(stmtEquals(nullptr, nullptr));
    IdentifierExpr x({0, 1, 1}, "x");
    EXPECT_FALSE(exprEquals(&x, nullptr));
    EXPECT_FALSE(exprEquals(nullptr, &x));
    IdentifierExpr y({0, 1, 1}, "y");
    EXPECT_FALSE(exprEquals(&x, &y));
    IdentifierExpr x2({0, 1, 1}, "x");
    EXPECT_TRUE(exprEquals(&x, &x2));
}

namespace
{
std::string repeat(const std::string &piece, size_t times)
{
    std::string out;
    out.reserve(piece.size() * times);
    for (size_t i = 0; i < times; ++i)
        out += piece;
    return out;
}
} // namespace

TEST(UrduAstDeepTrees, LongAdditionChain)
{
    constexpr size_t kTerms = 300000;
    const std::string src = "int x = 1" + repeat("+1", kTerms) + ";";
    {
        SourceManager sm;
        auto a = parseSource(src, sm);
        ASSERT_TRUE(a.succeeded());
        ASSERT_EQ(a.program.statements.size(), 1u);
        const auto &decl = static_cast<const DeclStmt &>(*a.program.statements[0]);
        ASSERT_EQ(decl.init->kind, ExprKind::Binary);
        const auto &top = static_cast<const BinaryExpr &>(*decl.init);
        EXPECT_EQ(top.loc.column, 9u);
        EXPECT_EQ(top.right->loc.column, 9u + 2 * kTerms);

        auto b = parseSource(src, sm);
        EXPECT_TRUE(programEquals(a.program, b.program));

        const std::string text = toSExpr(*decl.init);
        EXPECT_EQ(text.size(), 6 * kTerms + 1);
        EXPECT_EQ(text.compare(0, 6, "(+ (+ "), 0);
        EXPECT_EQ(text.compare(text.size() - 6, 6, " 1) 1)"), 0);
    }
    // Both programs were destroyed at the end of the block above.
    SUCCEED();
}

TEST(UrduAstDeepTrees, LongPostfixChainAndDifferingTail)
{
    constexpr size_t kSuffixes = 200000;
    SourceManager sm;
    auto a = parseSource("a" + repeat("++", kSuffixes) + ";", sm);
    ASSERT_TRUE(a.succeeded());
    const auto &stmt = static_cast<const ExprStmt &>(*a.program.statements[0]);
    ASSERT_EQ(stmt.expr->kind, ExprKind::Postfix);
    EXPECT_EQ(static_cast<const PostfixExpr &>(*stmt.expr).op, PostfixOp::Increment);

    // Same shape, different innermost operand: equality has to reach the
    // bottom of the chain to tell them apart.
    auto b = parseSource("b" + repeat("++", kSuffixes) + ";", sm);
    ASSERT_TRUE(b.succeeded());
    EXPECT_FALSE(programEquals(a.program, b.program));
}

TEST(UrduAstDeepTrees, DumpOfChainKeepsOrderAndIndentation)
{
    const std::string dump = dumpOf("x = 1 - 2 - 3;");
    EXPECT_EQ(dump,
              "Program (1:1)\n"
              "  AssignStmt \"x\" (=) (1:1)\n"
              "    BinaryExpr (-) (1:5)\n"
              "      BinaryExpr (-) (1:5)\n"
              "        IntLiteral 1 (1:5)\n"
              "        IntLiteral 2 (1:9)\n"
              "      IntLiteral 3 (1:13)\n");

    constexpr size_t kTerms = 2000;
    const std::string chain = dumpOf("x = 0" + repeat("*1", kTerms) + ";");
    size_t lines = 0;
    for (char c : chain)
        lines += c == '\n' ? 1 : 0;
    // Program, AssignStmt, kTerms binary nodes and kTerms + 1 literals.
    EXPECT_EQ(lines, 2 + kTerms + kTerms + 1);
    const std::string innermost =
        std::string(2 * (kTerms + 2), ' ') + "IntLiteral 0 (1:5)\n";
    EXPECT_NE(chain.find(innermost), std::string::npos);
    const std::string last = "\n      IntLiteral 1 (1:4005)\n";
    ASSERT_GT(chain.size(), last.size());
    EXPECT_EQ(chain.substr(chain.size() - last.size()), last);
}
