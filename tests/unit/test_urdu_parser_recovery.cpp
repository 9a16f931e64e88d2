// File: tests/unit/test_urdu_parser_recovery.cpp
// Purpose: Panic-mode recovery: one diagnostic per fault, no cascades, and
//          well-formed statements around a fault still reach the AST.
// Key invariants: The parser never reports a syntax error at a token the
//                 lexer already rejected; nesting beyond the limit stops the
//                 parse with a single diagnostic.
// Ownership/Lifetime: Standalone unit test executable.
// Links: docs/frontend.md

#include <gtest/gtest.h>

#include "frontends/urdu/Frontend.hpp"
#include "support/source_manager.hpp"

#include <string>

using namespace zaban::frontends::urdu;
using zaban::support::SourceManager;

namespace
{
struct Parsed
{
    SourceManager sm;
    ParseResult result;

    explicit Parsed(const std::string &src, const ParseOptions &opts = {})
    {
        ParseInput input{src, "recover.zb"};
        result = parse(input, opts, sm);
    }

    size_t count() const
    {
        return result.program.statements.size();
    }

    const DiagnosticRecord &diag(size_t i) const
    {
        return result.diagnostics.at(i);
    }
};
} // namespace

TEST(UrduParserRecovery, MissingSemicolonKeepsBothStatements)
{
    Parsed p("int x = 5\nint y = 6;");
    ASSERT_EQ(p.result.errorCount(), 1u);
    EXPECT_EQ(p.diag(0).kind, DiagKind::MissingToken);
    EXPECT_EQ(p.diag(0).code, "Z2002");
    EXPECT_EQ(p.diag(0).message, "expected ';', got 'int'");
    EXPECT_EQ(p.diag(0).loc.line, 2u);
    EXPECT_EQ(p.diag(0).loc.column, 1u);
    EXPECT_EQ(p.count(), 2u);
}

TEST(UrduParserRecovery, BadStatementBetweenGoodOnes)
{
    Parsed p("int a = 1;\nint = 2;\nint c = 3;");
    ASSERT_EQ(p.result.errorCount(), 1u);
    EXPECT_EQ(p.diag(0).kind, DiagKind::UnexpectedToken);
    EXPECT_EQ(p.diag(0).code, "Z2001");
    EXPECT_EQ(p.diag(0).message, "expected identifier, got '='");
    EXPECT_EQ(p.diag(0).loc.line, 2u);
    EXPECT_EQ(p.diag(0).loc.column, 5u);
    ASSERT_EQ(p.count(), 2u);
    EXPECT_EQ(static_cast<const DeclStmt &>(*p.result.program.statements[1]).name, "c");
}

TEST(UrduParserRecovery, LexicalErrorIsNotRepeatedBySyntax)
{
    Parsed p("dikhao(\"abc);\nint y = 1;");
    ASSERT_EQ(p.result.diagnostics.size(), 1u);
    EXPECT_EQ(p.diag(0).kind, DiagKind::UnterminatedString);
    ASSERT_EQ(p.count(), 1u);
    EXPECT_EQ(p.result.program.statements[0]->kind, StmtKind::Declaration);
}

TEST(UrduParserRecovery, UnknownCharacterInsideExpression)
{
    Parsed p("x = 1 @ 2;\ny = 3;");
    ASSERT_EQ(p.result.diagnostics.size(), 1u);
    EXPECT_EQ(p.diag(0).kind, DiagKind::UnknownCharacter);
    ASSERT_EQ(p.count(), 1u);
    EXPECT_EQ(static_cast<const AssignStmt &>(*p.result.program.statements[0]).target, "y");
}

TEST(UrduParserRecovery, EveryFaultIsReported)
{
    Parsed p("x = ;\ny = ;\nz = 1;");
    ASSERT_EQ(p.result.errorCount(), 2u);
    EXPECT_EQ(p.diag(0).loc.line, 1u);
    EXPECT_EQ(p.diag(1).loc.line, 2u);
    EXPECT_EQ(p.count(), 1u);
    EXPECT_FALSE(p.result.stoppedEarly);
}

TEST(UrduParserRecovery, NoCascadeAfterMissingSemicolon)
{
    Parsed p("int x = 5 6;\nx = 1;");
    ASSERT_EQ(p.result.errorCount(), 1u);
    EXPECT_EQ(p.diag(0).message, "expected ';', got integer literal '6'");
    EXPECT_EQ(p.count(), 1u);
}

TEST(UrduParserRecovery, MissingClosingBraceAtEndOfInput)
{
    Parsed p("agr (x) {\n  y = 1;\n");
    ASSERT_EQ(p.result.errorCount(), 1u);
    EXPECT_EQ(p.diag(0).kind, DiagKind::UnexpectedEOF);
    EXPECT_EQ(p.diag(0).code, "Z2003");
    EXPECT_EQ(p.diag(0).message, "expected '}', got end of input");
    ASSERT_EQ(p.count(), 1u);
    EXPECT_EQ(p.result.program.statements[0]->kind, StmtKind::If);
}

TEST(UrduParserRecovery, UnexpectedEndInsideExpression)
{
    Parsed p("x = 1 +");
    ASSERT_EQ(p.result.errorCount(), 1u);
    EXPECT_EQ(p.diag(0).kind, DiagKind::UnexpectedEOF);
    EXPECT_EQ(p.diag(0).message, "expected expression, got end of input");
}

TEST(UrduParserRecovery, StrayClosingBraceAtTopLevel)
{
    Parsed p("}\nint x = 1;");
    ASSERT_EQ(p.result.errorCount(), 1u);
    EXPECT_EQ(p.diag(0).message, "expected statement, got '}'");
    EXPECT_EQ(p.count(), 1u);
}

TEST(UrduParserRecovery, ElseWithoutIf)
{
    Parsed p("varna x = 1;\nint y;");
    ASSERT_EQ(p.result.errorCount(), 1u);
    EXPECT_EQ(p.diag(0).message, "expected statement, got 'varna'");
    ASSERT_EQ(p.count(), 1u);
    EXPECT_EQ(p.result.program.statements[0]->kind, StmtKind::Declaration);
}

TEST(UrduParserRecovery, MissingOpenParenAfterIf)
{
    Parsed p("agr x > 0) { y = 1; }");
    ASSERT_EQ(p.result.errorCount(), 1u);
    EXPECT_EQ(p.diag(0).message, "expected '(', got identifier 'x'");
    // Recovery resumes at the block, which parses on its own.
    ASSERT_EQ(p.count(), 1u);
    EXPECT_EQ(p.result.program.statements[0]->kind, StmtKind::Block);
}

TEST(UrduParserRecovery, MissingCloseParenBeforeBlockKeepsIf)
{
    Parsed p("agr (x > 0 { y = 1; }");
    ASSERT_EQ(p.result.errorCount(), 1u);
    EXPECT_EQ(p.diag(0).kind, DiagKind::MissingToken);
    EXPECT_EQ(p.diag(0).message, "expected ')', got '{'");
    ASSERT_EQ(p.count(), 1u);
    EXPECT_EQ(p.result.program.statements[0]->kind, StmtKind::If);
}

TEST(UrduParserRecovery, ErrorInsideBlockStaysInBlock)
{
    Parsed p("{ x = ; y = 1; }\nz = 2;");
    ASSERT_EQ(p.result.errorCount(), 1u);
    ASSERT_EQ(p.count(), 2u);
    const auto &block = static_cast<const BlockStmt &>(*p.result.program.statements[0]);
    EXPECT_EQ(block.statements.size(), 1u);
}

TEST(UrduParserRecovery, MissingSemicolonBeforeClosingBrace)
{
    Parsed p("{ x = 1 }");
    ASSERT_EQ(p.result.errorCount(), 1u);
    EXPECT_EQ(p.diag(0).message, "expected ';', got '}'");
    ASSERT_EQ(p.count(), 1u);
    const auto &block = static_cast<const BlockStmt &>(*p.result.program.statements[0]);
    EXPECT_EQ(block.statements.size(), 1u);
}

TEST(UrduParserRecovery, BadForUpdate)
{
    Parsed p("tabtak (i = 0; i < 3; 5) { }\nint k;");
    ASSERT_EQ(p.result.errorCount(), 1u);
    EXPECT_EQ(p.diag(0).message, "expected one of assignment, increment, decrement, got integer literal '5'");
    ASSERT_EQ(p.count(), 2u);
    EXPECT_EQ(p.result.program.statements[1]->kind, StmtKind::Declaration);
}

TEST(UrduParserRecovery, ExpectedSetIsRecorded)
{
    Parsed p("do x = 1; y;");
    ASSERT_EQ(p.result.errorCount(), 1u);
    EXPECT_EQ(p.diag(0).expected, std::vector<std::string>{"'jabtak'"});
    EXPECT_EQ(p.diag(0).found, "identifier 'y'");
}

TEST(UrduParserRecovery, DeepParenthesesHitNestingLimit)
{
    std::string src = "x = " + std::string(300, '(') + "1" + std::string(300, ')') + ";";
    Parsed p(src);
    ASSERT_EQ(p.result.diagnostics.size(), 1u);
    EXPECT_EQ(p.diag(0).kind, DiagKind::NestingTooDeep);
    EXPECT_EQ(p.diag(0).code, "Z2004");
    EXPECT_EQ(p.diag(0).message, "nesting too deep (limit: 256)");
    EXPECT_TRUE(p.result.stoppedEarly);
}

TEST(UrduParserRecovery, DeepBlocksHitNestingLimit)
{
    std::string src = std::string(300, '{') + std::string(300, '}');
    Parsed p(src);
    ASSERT_EQ(p.result.diagnostics.size(), 1u);
    EXPECT_EQ(p.diag(0).kind, DiagKind::NestingTooDeep);
    EXPECT_TRUE(p.result.stoppedEarly);
}

TEST(UrduParserRecovery, NestingLimitIsConfigurable)
{
    ParseOptions opts;
    opts.maxNestingDepth = 4;
    Parsed shallow("x = ((1));", opts);
    EXPECT_TRUE(shallow.result.succeeded());

    Parsed deep("x = ((((1))));", opts);
    ASSERT_EQ(deep.result.errorCount(), 1u);
    EXPECT_EQ(deep.diag(0).message, "nesting too deep (limit: 4)");
}

TEST(UrduParserRecovery, HaltOnFirstError)
{
    ParseOptions opts;
    opts.haltOnFirstError = true;
    Parsed p("x = ;\ny = ;\nz = 1;", opts);
    EXPECT_EQ(p.result.errorCount(), 1u);
    EXPECT_TRUE(p.result.stoppedEarly);
    EXPECT_EQ(p.count(), 0u);
}
