//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements help text and version information for zabanc.
//
//===----------------------------------------------------------------------===//

#include "usage.hpp"

#ifndef ZABAN_VERSION_STR
#define ZABAN_VERSION_STR "0.0.0"
#endif

namespace zabanc
{

void printVersion(std::ostream &os)
{
    os << "zabanc v" << ZABAN_VERSION_STR << "\n";
    os << "Zaban syntax analyzer\n";
}

void printUsage(std::ostream &os)
{
    os << "zabanc v" << ZABAN_VERSION_STR << " - Zaban syntax analyzer\n"
       << "\n"
       << "Usage: zabanc [options] <file>\n"
       << "       zabanc --interactive\n"
       << "\n"
       << "Usage Modes:\n"
       << "  zabanc program.zb                Check syntax, report all diagnostics\n"
       << "  zabanc --tokens program.zb       Print the token stream\n"
       << "  zabanc --ast program.zb          Check syntax and print the AST\n"
       << "  zabanc --interactive             Read statements from stdin\n"
       << "\n"
       << "Options:\n"
       << "  --max-depth N                  Nesting limit (default 256)\n"
       << "  --trace                        Print phase markers to stderr\n"
       << "  -h, --help                     Show this help message\n"
       << "  --version                      Show version information\n"
       << "\n"
       << "Language Notes:\n"
       << "  - Keywords: agr (if), varna (else), jabtak (while), tabtak (for),\n"
       << "    do, break, continue, return, dikhao (print), likho (input)\n"
       << "  - Types: int, float, bool, string, char\n"
       << "  - Comments start with // and run to the end of the line\n"
       << "\n"
       << "Setting ZABAN_DEBUG_PARSE=1 also enables --trace.\n";
}

} // namespace zabanc
