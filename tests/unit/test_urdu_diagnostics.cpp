// File: tests/unit/test_urdu_diagnostics.cpp
// Purpose: Diagnostic codes, caret snippets, printed format, and the support
//          layer underneath (SourceManager, DiagnosticEngine, Expected,
//          and the source loader's registration failure).
// Key invariants: Carets sit under the offending column, preserve tabs and
//                 never run past the end of the line.
// Ownership/Lifetime: Test owns all objects locally.
// Links: docs/frontend.md

#include <gtest/gtest.h>

#include "frontends/common/DiagnosticHelpers.hpp"
#include "frontends/urdu/DiagnosticCodes.hpp"
#include "frontends/urdu/DiagnosticEmitter.hpp"
#include "frontends/urdu/Frontend.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"
#include "tools/common/source_loader.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>

using namespace zaban::frontends::urdu;
using namespace zaban::support;

namespace zaban::support
{
struct SourceManagerTestAccess
{
    static void setNextFileId(SourceManager &sm, uint64_t next)
    {
        sm.next_file_id_ = next;
    }
};
} // namespace zaban::support

TEST(UrduDiagnosticCodes, StableCodesAndSeverities)
{
    EXPECT_EQ(diagCode(DiagKind::UnterminatedString), "Z1001");
    EXPECT_EQ(diagCode(DiagKind::UnterminatedChar), "Z1002");
    EXPECT_EQ(diagCode(DiagKind::InvalidEscapeSequence), "Z1003");
    EXPECT_EQ(diagCode(DiagKind::InvalidNumberFormat), "Z1004");
    EXPECT_EQ(diagCode(DiagKind::UnknownCharacter), "Z1005");
    EXPECT_EQ(diagCode(DiagKind::UnexpectedToken), "Z2001");
    EXPECT_EQ(diagCode(DiagKind::MissingToken), "Z2002");
    EXPECT_EQ(diagCode(DiagKind::UnexpectedEOF), "Z2003");
    EXPECT_EQ(diagCode(DiagKind::NestingTooDeep), "Z2004");
    EXPECT_EQ(diagCode(DiagKind::EmptyStatement), "Z9001");

    EXPECT_EQ(diagSeverity(DiagKind::EmptyStatement), Severity::Warning);
    EXPECT_EQ(diagSeverity(DiagKind::MissingToken), Severity::Error);
    EXPECT_TRUE(isLexicalDiag(DiagKind::UnknownCharacter));
    EXPECT_FALSE(isLexicalDiag(DiagKind::UnexpectedEOF));
    EXPECT_STREQ(diagKindName(DiagKind::NestingTooDeep), "NestingTooDeep");
}

TEST(UrduDiagnosticEmitter, CaretUnderlinesRange)
{
    DiagnosticEngine de;
    DiagnosticEmitter em(de);
    em.addSource(1, "int x = 12abc;\nx = 1;");
    em.emit(DiagKind::InvalidNumberFormat, {1, 1, 9}, 5, "bad number");

    ASSERT_EQ(em.records().size(), 1u);
    const auto &rec = em.records()[0];
    EXPECT_EQ(rec.code, "Z1004");
    EXPECT_EQ(rec.severity, Severity::Error);
    ASSERT_TRUE(rec.snippet.has_value());
    EXPECT_EQ(*rec.snippet, "int x = 12abc;\n        ^^^^^");
    EXPECT_EQ(em.errorCount(), 1u);
    EXPECT_FALSE(em.wellFormed());
}

TEST(UrduDiagnosticEmitter, TabsArePreservedInCaretLine)
{
    DiagnosticEngine de;
    DiagnosticEmitter em(de);
    em.addSource(1, "\tx = @;");
    auto snippet = em.renderSnippet({1, 1, 6}, 1);
    ASSERT_TRUE(snippet.has_value());
    EXPECT_EQ(*snippet, "\tx = @;\n\t    ^");
}

TEST(UrduDiagnosticEmitter, CaretsClampToLine)
{
    DiagnosticEngine de;
    DiagnosticEmitter em(de);
    em.addSource(1, "abc\r\ndef");
    EXPECT_EQ(em.renderSnippet({1, 1, 2}, 10).value_or(""), "abc\n ^^");
    // One past the end of the line (end of input) still gets one caret.
    EXPECT_EQ(em.renderSnippet({1, 2, 4}, 1).value_or(""), "def\n   ^");
    EXPECT_EQ(em.renderSnippet({1, 2, 1}, 0).value_or(""), "def\n^");
}

TEST(UrduDiagnosticEmitter, MissingLineHasNoSnippet)
{
    DiagnosticEngine de;
    DiagnosticEmitter em(de);
    em.addSource(1, "one line");
    EXPECT_FALSE(em.renderSnippet({1, 5, 1}, 1).has_value());
    EXPECT_FALSE(em.renderSnippet({2, 1, 1}, 1).has_value());
    EXPECT_FALSE(em.renderSnippet({1, 0, 0}, 1).has_value());
}

TEST(UrduDiagnosticEmitter, SnippetsFromManyLinesInAnyOrder)
{
    DiagnosticEngine de;
    DiagnosticEmitter em(de);
    std::string src;
    for (int i = 1; i <= 2000; ++i)
        src += "x" + std::to_string(i) + " = 1;\n";
    em.addSource(1, src);

    EXPECT_EQ(em.renderSnippet({1, 1500, 1}, 5).value_or(""), "x1500 = 1;\n^^^^^");
    EXPECT_EQ(em.renderSnippet({1, 7, 4}, 1).value_or(""), "x7 = 1;\n   ^");
    EXPECT_EQ(em.renderSnippet({1, 2000, 1}, 2).value_or(""), "x2000 = 1;\n^^");
    // The text ends with a newline, so an empty final line exists.
    EXPECT_EQ(em.renderSnippet({1, 2001, 1}, 1).value_or("<none>"), "\n^");
    EXPECT_FALSE(em.renderSnippet({1, 2002, 1}, 1).has_value());

    // Registering the id again replaces the text and its line index.
    em.addSource(1, "a\nb");
    EXPECT_EQ(em.renderSnippet({1, 2, 1}, 1).value_or(""), "b\n^");
    EXPECT_FALSE(em.renderSnippet({1, 3, 1}, 1).has_value());
}

TEST(UrduDiagnosticEmitter, PrintedFormat)
{
    SourceManager sm;
    uint32_t fid = sm.addFile("prog.zb");
    DiagnosticEngine de;
    DiagnosticEmitter em(de, &sm);
    em.addSource(fid, "x = 1;;\n");
    em.emit(DiagKind::EmptyStatement, {fid, 1, 7}, 1, "empty statement");
    em.emit(DiagKind::UnexpectedToken, {}, 1, "no location");

    std::ostringstream oss;
    em.printAll(oss);
    EXPECT_EQ(oss.str(),
              "prog.zb:1:7: warning[Z9001]: empty statement\n"
              "x = 1;;\n"
              "      ^\n"
              "error[Z2001]: no location\n");
    EXPECT_EQ(em.warningCount(), 1u);
    EXPECT_EQ(em.errorCount(), 1u);
}

TEST(UrduDiagnosticEmitter, ParseResultPrintsLikeEmitter)
{
    SourceManager sm;
    std::string src = "int x = 5\nint y = 6;";
    ParseInput input{src, "main.zb"};
    auto result = parse(input, {}, sm);

    std::ostringstream oss;
    printDiagnostics(result.diagnostics, oss, &sm);
    EXPECT_EQ(oss.str(),
              "main.zb:2:1: error[Z2002]: expected ';', got 'int'\n"
              "int y = 6;\n"
              "^^^\n");
}

TEST(DiagnosticHelpers, ExpectedSetFormatting)
{
    using zaban::frontends::common::diag_helpers::formatExpectedGot;
    using zaban::frontends::common::diag_helpers::formatExpectedSet;
    EXPECT_EQ(formatExpectedSet({"';'"}), "';'");
    EXPECT_EQ(formatExpectedSet({"a", "b"}), "a or b");
    EXPECT_EQ(formatExpectedSet({"a", "b", "c"}), "one of a, b, c");
    EXPECT_EQ(formatExpectedSet({"a", "b", "c", "d"}, 2), "one of a, b, ... (2 more)");
    EXPECT_EQ(formatExpectedGot("';'", "identifier 'x'"), "expected ';', got identifier 'x'");
}

TEST(SupportSourceManager, RegistersAndDeduplicatesPaths)
{
    SourceManager sm;
    uint32_t a = sm.addFile("dir/./a.zb");
    uint32_t b = sm.addFile("dir/b.zb");
    EXPECT_NE(a, 0u);
    EXPECT_NE(a, b);
    EXPECT_EQ(sm.addFile("dir/a.zb"), a);
    EXPECT_EQ(sm.getPath(a), "dir/a.zb");
    EXPECT_EQ(sm.fileCount(), 2u);
    EXPECT_TRUE(sm.getPath(0).empty());
    EXPECT_TRUE(sm.getPath(99).empty());
}

TEST(SupportSourceManager, OverflowReturnsZeroWithoutPrinting)
{
    SourceManager sm;
    SourceManagerTestAccess::setNextFileId(
        sm, static_cast<uint64_t>(std::numeric_limits<uint32_t>::max()) + 1);

    std::ostringstream captured;
    auto *old = std::cerr.rdbuf(captured.rdbuf());
    uint32_t id = sm.addFile("late.zb");
    std::cerr.rdbuf(old);

    EXPECT_EQ(id, 0u);
    EXPECT_EQ(sm.fileCount(), 0u);
    EXPECT_TRUE(captured.str().empty());
}

TEST(SupportSourceManager, LoaderReportsExhaustedIdsOnce)
{
    const auto path = std::filesystem::temp_directory_path() / "zaban-ids-exhausted.zb";
    {
        std::ofstream ofs(path, std::ios::binary);
        ofs << "int x = 1;\n";
    }

    SourceManager sm;
    SourceManagerTestAccess::setNextFileId(
        sm, static_cast<uint64_t>(std::numeric_limits<uint32_t>::max()) + 1);

    std::ostringstream captured;
    auto *old = std::cerr.rdbuf(captured.rdbuf());
    auto loaded = zaban::tools::common::loadSourceBuffer(path.string(), sm);
    std::cerr.rdbuf(old);

    std::error_code ec;
    std::filesystem::remove(path, ec);

    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().message, kSourceManagerFileIdOverflowMessage);
    EXPECT_TRUE(captured.str().empty());
}

TEST(SupportDiagnostics, EngineCountsBySeverity)
{
    DiagnosticEngine de;
    de.report({Severity::Error, "e1", {}, "Z2001"});
    de.report({Severity::Warning, "w1", {}, "Z9001"});
    de.report({Severity::Note, "n1", {}});
    EXPECT_EQ(de.errorCount(), 1u);
    EXPECT_EQ(de.warningCount(), 1u);
    EXPECT_EQ(de.diagnostics().size(), 3u);

    std::ostringstream oss;
    de.printAll(oss);
    EXPECT_EQ(oss.str(), "error[Z2001]: e1\nwarning[Z9001]: w1\nnote: n1\n");
}

TEST(SupportExpected, ValueAndError)
{
    Expected<int> ok = 42;
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);

    Expected<int> bad = makeError({0, 3, 4}, "broken");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "broken");

    std::ostringstream oss;
    printDiag(bad.error(), oss);
    EXPECT_EQ(oss.str(), "3:4: error: broken\n");

    SourceManager sm;
    uint32_t fid = sm.addFile("tool.zb");
    std::ostringstream located;
    printDiag(makeError({fid, 2, 0}, "nope"), located, &sm);
    EXPECT_EQ(located.str(), "tool.zb:2: error: nope\n");
}
