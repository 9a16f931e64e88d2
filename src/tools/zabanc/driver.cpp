//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements argument parsing and the batch modes of zabanc.
//
//===----------------------------------------------------------------------===//

#include "driver.hpp"

#include "frontends/urdu/AstPrinter.hpp"
#include "frontends/urdu/Frontend.hpp"
#include "support/source_manager.hpp"
#include "tools/common/source_loader.hpp"

#include <charconv>
#include <cstdlib>

using namespace zaban;
using namespace zaban::frontends::urdu;

namespace zabanc
{
namespace
{

support::Diagnostic usageError(std::string msg)
{
    return support::makeError({}, std::move(msg));
}

bool parseDepth(const std::string &text, size_t &out)
{
    size_t value = 0;
    const char *first = text.data();
    const char *last = first + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || value == 0)
        return false;
    out = value;
    return true;
}

void printSummary(std::ostream &os, size_t errors, size_t warnings)
{
    os << errors << " error" << (errors == 1 ? "" : "s");
    if (warnings > 0)
        os << ", " << warnings << " warning" << (warnings == 1 ? "" : "s");
    os << " generated.\n";
}

} // namespace

support::Expected<DriverConfig> parseArgs(const std::vector<std::string> &args)
{
    DriverConfig config;
    bool modeSet = false;

    auto setMode = [&](Mode mode) -> bool
    {
        if (modeSet && config.mode != mode)
            return false;
        config.mode = mode;
        modeSet = true;
        return true;
    };

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string &arg = args[i];
        if (arg == "-h" || arg == "--help")
        {
            config.showHelp = true;
        }
        else if (arg == "--version")
        {
            config.showVersion = true;
        }
        else if (arg == "--tokens" || arg == "--ast" || arg == "--interactive")
        {
            Mode mode = arg == "--tokens" ? Mode::Tokens
                        : arg == "--ast"  ? Mode::Ast
                                          : Mode::Interactive;
            if (!setMode(mode))
                return usageError("conflicting mode flag " + arg);
        }
        else if (arg == "--trace")
        {
            config.parse.trace = true;
        }
        else if (arg == "--max-depth" || arg.starts_with("--max-depth="))
        {
            std::string value;
            if (arg == "--max-depth")
            {
                if (i + 1 >= args.size())
                    return usageError("--max-depth requires a value");
                value = args[++i];
            }
            else
            {
                value = arg.substr(std::string("--max-depth=").size());
            }
            if (!parseDepth(value, config.parse.maxNestingDepth))
                return usageError("invalid --max-depth value '" + value + "'");
        }
        else if (arg.starts_with("-") && arg != "-")
        {
            return usageError("unknown option " + arg);
        }
        else
        {
            if (!config.sourcePath.empty())
                return usageError("multiple input files: '" + config.sourcePath + "' and '" +
                                  arg + "'");
            config.sourcePath = arg;
        }
    }

    if (config.showHelp || config.showVersion)
        return config;

    if (config.mode == Mode::Interactive)
    {
        if (!config.sourcePath.empty())
            return usageError("--interactive does not take an input file");
        config.parse.haltOnFirstError = true;
        return config;
    }

    if (config.sourcePath.empty())
        return usageError("no input file");

    return config;
}

int runDriver(const DriverConfig &config, std::ostream &out, std::ostream &err)
{
    support::SourceManager sm;
    auto loaded = tools::common::loadSourceBuffer(config.sourcePath, sm);
    if (!loaded)
    {
        support::printDiag(loaded.error(), err);
        return 1;
    }

    ParseInput input;
    input.source = loaded.value().buffer;
    input.path = config.sourcePath;
    input.fileId = loaded.value().fileId;

    if (config.mode == Mode::Tokens)
    {
        LexResult lexed = lex(input, sm);
        for (const Token &tok : lexed.tokens)
            out << formatToken(tok) << "\n";
        printDiagnostics(lexed.diagnostics, err, &sm);
        return lexed.succeeded() ? 0 : 1;
    }

    ParseResult result = parse(input, config.parse, sm);
    printDiagnostics(result.diagnostics, err, &sm);

    if (!result.succeeded())
    {
        printSummary(err, result.errorCount(), result.warningCount());
        return 1;
    }

    if (config.mode == Mode::Ast)
    {
        AstPrinter printer;
        out << printer.dump(result.program);
    }
    else
    {
        out << config.sourcePath << ": ok (" << result.program.statements.size()
            << " statement" << (result.program.statements.size() == 1 ? "" : "s") << ")\n";
    }

    if (result.warningCount() > 0)
        printSummary(err, 0, result.warningCount());
    return 0;
}

} // namespace zabanc
