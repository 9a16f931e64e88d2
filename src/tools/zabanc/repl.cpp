//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the zabanc interactive mode.
//
//===----------------------------------------------------------------------===//

#include "repl.hpp"

#include "frontends/urdu/AstPrinter.hpp"
#include "frontends/urdu/Frontend.hpp"
#include "support/source_manager.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

using namespace zaban;
using namespace zaban::frontends::urdu;

namespace zabanc
{
namespace
{

constexpr const char *kPrompt = "> ";
constexpr const char *kContinuation = "... ";
constexpr const char *kPath = "<stdin>";

std::string trim(const std::string &s)
{
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(begin, end - begin);
}

std::string lower(std::string s)
{
    std::transform(s.begin(),
                   s.end(),
                   s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool endsEntry(const std::string &line)
{
    return !line.empty() && (line.back() == ';' || line.back() == '}');
}

void printHelp(std::ostream &out)
{
    out << "Commands:\n"
        << "  exit, quit  leave interactive mode\n"
        << "  help        show this help\n"
        << "  tokens      show tokens for the last input\n"
        << "  ast         show the AST for the last valid input\n";
}

} // namespace

int runInteractive(std::istream &in, std::ostream &out, const ParseOptions &options)
{
    ParseOptions opts = options;
    opts.haltOnFirstError = true;

    support::SourceManager sm;
    std::optional<std::string> lastSource;
    std::optional<Program> lastProgram;

    out << "Zaban interactive mode\n"
        << "Enter statements ('help' for commands, 'exit' to quit)\n";

    std::string raw;
    while (true)
    {
        out << kPrompt << std::flush;
        if (!std::getline(in, raw))
        {
            out << "\n";
            return 0;
        }

        std::string line = trim(raw);
        std::string command = lower(line);
        if (command == "exit" || command == "quit")
            return 0;
        if (command == "help")
        {
            printHelp(out);
            continue;
        }
        if (command == "tokens")
        {
            if (!lastSource)
            {
                out << "no previous input\n";
                continue;
            }
            ParseInput input;
            input.source = *lastSource;
            input.path = kPath;
            LexResult lexed = lex(input, sm);
            for (const Token &tok : lexed.tokens)
                out << formatToken(tok) << "\n";
            continue;
        }
        if (command == "ast")
        {
            if (!lastProgram)
            {
                out << "no AST available; parse some code first\n";
                continue;
            }
            AstPrinter printer;
            out << printer.dump(*lastProgram);
            continue;
        }
        if (line.empty())
            continue;

        std::string source = line;
        if (!endsEntry(line))
        {
            while (true)
            {
                out << kContinuation << std::flush;
                if (!std::getline(in, raw))
                    break;
                std::string next = trim(raw);
                if (next.empty())
                    break;
                source += "\n" + next;
                if (endsEntry(next))
                    break;
            }
        }

        lastSource = source;
        ParseInput input;
        input.source = source;
        input.path = kPath;
        ParseResult result = parse(input, opts, sm);

        auto firstError = std::find_if(result.diagnostics.begin(),
                                       result.diagnostics.end(),
                                       [](const DiagnosticRecord &rec)
                                       { return rec.severity == support::Severity::Error; });
        if (firstError != result.diagnostics.end())
        {
            printDiagnosticRecord(*firstError, out, &sm);
            lastProgram.reset();
            continue;
        }

        printDiagnostics(result.diagnostics, out, &sm);
        out << "ok: syntactically correct\n";
        lastProgram = std::move(result.program);
    }
}

} // namespace zabanc
