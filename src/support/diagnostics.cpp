//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic engine.  The lexer and parser report into one
// engine per parse; the engine keeps records in emission order and maintains
// the severity counters that decide whether a program is well formed.
//
//===----------------------------------------------------------------------===//

#include "diagnostics.hpp"
#include "diag_expected.hpp"
#include "source_manager.hpp"

namespace zaban::support
{
/// @brief Append @p d and bump the matching severity counter.
///
/// Notes are stored but not counted.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/// @brief Print every stored diagnostic through printDiag().
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}
} // namespace zaban::support
