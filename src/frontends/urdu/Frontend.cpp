//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Frontend.cpp
/// @brief Lex/parse pipeline with optional tracing and dumps.
///
//===----------------------------------------------------------------------===//

#include "frontends/urdu/Frontend.hpp"

#include "frontends/urdu/AstPrinter.hpp"
#include "frontends/urdu/Lexer.hpp"
#include "frontends/urdu/Parser.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>

namespace zaban::frontends::urdu
{

namespace
{
uint32_t resolveFileId(const ParseInput &input, support::SourceManager &sm)
{
    if (input.fileId)
        return *input.fileId;
    return sm.addFile(std::string(input.path));
}

/// @brief Print the token stream to stderr using a scratch diagnostic sink so
///        lexical errors are not reported twice.
void dumpTokenStream(const std::string &source, uint32_t fileId)
{
    support::DiagnosticEngine scratch;
    DiagnosticEmitter emitter(scratch);
    Lexer lexer(source, fileId, emitter);
    for (const Token &tok : lexer.tokenize())
        std::cerr << formatToken(tok) << '\n';
}
} // namespace

bool LexResult::succeeded() const
{
    for (const auto &d : diagnostics)
    {
        if (d.severity == support::Severity::Error)
            return false;
    }
    return true;
}

ParseResult parse(const ParseInput &input, const ParseOptions &options, support::SourceManager &sm)
{
    ParseResult result;
    result.fileId = resolveFileId(input, sm);

    const bool trace = options.trace || std::getenv("ZABAN_DEBUG_PARSE") != nullptr;
    const auto start = std::chrono::steady_clock::now();
    auto debugTime = [&](const char *phase)
    {
        if (!trace)
            return;
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start);
        std::cerr << "[zaban] " << phase << " (+" << elapsed.count() << "us)" << std::endl;
    };

    std::string source(input.source);

    if (options.dumpTokens)
        dumpTokenStream(source, result.fileId);

    DiagnosticEmitter emitter(result.engine, &sm);
    emitter.addSource(result.fileId, source);

    // The parser pulls tokens on demand, so lexing and parsing share a phase.
    debugTime("Phase 1: Lexing+Parsing");
    Lexer lexer(source, result.fileId, emitter);
    Parser parser(lexer, emitter, options);
    result.program = parser.parseProgram();
    result.stoppedEarly = parser.stopped();
    debugTime("Phase 1: Done");

    if (trace)
    {
        std::cerr << "[zaban] " << result.program.statements.size() << " statement(s), "
                  << emitter.errorCount() << " error(s), " << emitter.warningCount()
                  << " warning(s)" << std::endl;
    }

    if (options.dumpAst)
    {
        AstPrinter printer;
        std::cerr << printer.dump(result.program);
    }

    result.diagnostics = emitter.records();
    return result;
}

LexResult lex(const ParseInput &input, support::SourceManager &sm)
{
    LexResult result;
    result.fileId = resolveFileId(input, sm);

    support::DiagnosticEngine engine;
    DiagnosticEmitter emitter(engine, &sm);
    std::string source(input.source);
    emitter.addSource(result.fileId, source);

    Lexer lexer(source, result.fileId, emitter);
    result.tokens = lexer.tokenize();
    result.diagnostics = emitter.records();
    return result;
}

void printDiagnostics(const std::vector<DiagnosticRecord> &diagnostics,
                      std::ostream &os,
                      const support::SourceManager *sm)
{
    for (const auto &rec : diagnostics)
        printDiagnosticRecord(rec, os, sm);
}

} // namespace zaban::frontends::urdu
