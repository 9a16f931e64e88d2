//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements makeError and the one-line diagnostic printer.  The frontend's
// DiagnosticEmitter builds on the same prefix format and adds source snippets.
//
//===----------------------------------------------------------------------===//

#include "diag_expected.hpp"

namespace zaban::support
{
namespace
{
const char *severityName(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace

Diagnostic makeError(SourceLoc loc, std::string msg)
{
    return Diagnostic{Severity::Error, std::move(msg), loc};
}

void printDiag(const Diagnostic &diag, std::ostream &os, const SourceManager *sm)
{
    std::string_view path;
    if (sm && diag.loc.file_id != 0)
        path = sm->getPath(diag.loc.file_id);

    os << path;
    if (diag.loc.hasLine())
    {
        os << (path.empty() ? "" : ":") << diag.loc.line;
        if (diag.loc.hasColumn())
            os << ':' << diag.loc.column;
    }
    if (!path.empty() || diag.loc.hasLine())
        os << ": ";
    os << severityName(diag.severity);
    if (!diag.code.empty())
        os << '[' << diag.code << ']';
    os << ": " << diag.message << '\n';
}

} // namespace zaban::support
