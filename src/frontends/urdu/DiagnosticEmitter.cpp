//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the frontend diagnostic emitter.  Every record is forwarded to
// the shared DiagnosticEngine for counting and kept locally with its
// structured payload so tests and tools can inspect kinds, expected-sets and
// snippets without parsing printed text.
//
//===----------------------------------------------------------------------===//

#include "frontends/urdu/DiagnosticEmitter.hpp"

#include "support/diag_expected.hpp"

#include <algorithm>

namespace zaban::frontends::urdu
{

const char *diagKindName(DiagKind kind)
{
    switch (kind)
    {
        case DiagKind::UnterminatedString:
            return "UnterminatedString";
        case DiagKind::UnterminatedChar:
            return "UnterminatedChar";
        case DiagKind::InvalidEscapeSequence:
            return "InvalidEscapeSequence";
        case DiagKind::InvalidNumberFormat:
            return "InvalidNumberFormat";
        case DiagKind::UnknownCharacter:
            return "UnknownCharacter";
        case DiagKind::UnexpectedToken:
            return "UnexpectedToken";
        case DiagKind::MissingToken:
            return "MissingToken";
        case DiagKind::UnexpectedEOF:
            return "UnexpectedEOF";
        case DiagKind::NestingTooDeep:
            return "NestingTooDeep";
        case DiagKind::EmptyStatement:
            return "EmptyStatement";
    }
    return "?";
}

DiagnosticEmitter::DiagnosticEmitter(support::DiagnosticEngine &de,
                                     const support::SourceManager *sm)
    : de_(de), sm_(sm)
{
}

/// @details Line starts are indexed once here so each snippet is a lookup.
void DiagnosticEmitter::addSource(uint32_t fileId, std::string source)
{
    SourceText entry;
    entry.lineStarts.push_back(0);
    for (size_t pos = source.find('\n'); pos != std::string::npos;
         pos = source.find('\n', pos + 1))
        entry.lineStarts.push_back(pos + 1);
    entry.text = std::move(source);
    sources_[fileId] = std::move(entry);
}

/// @brief Report a diagnostic and store it for later printing.
/// @details Severity and code follow from @p kind.  The snippet is rendered
///          now so records remain self-contained after the source goes away.
void DiagnosticEmitter::emit(DiagKind kind,
                             support::SourceLoc loc,
                             uint32_t length,
                             std::string message,
                             std::vector<std::string> expected,
                             std::string found)
{
    DiagnosticRecord rec;
    rec.severity = diagSeverity(kind);
    rec.kind = kind;
    rec.code = std::string(diagCode(kind));
    rec.message = std::move(message);
    rec.loc = loc;
    rec.length = length == 0 ? 1 : length;
    rec.expected = std::move(expected);
    rec.found = std::move(found);
    rec.snippet = renderSnippet(loc, rec.length);

    de_.report({rec.severity, rec.message, rec.loc, rec.code});
    records_.push_back(std::move(rec));
}

std::optional<std::string> DiagnosticEmitter::getLine(uint32_t fileId, uint32_t line) const
{
    if (line == 0)
        return std::nullopt;

    auto it = sources_.find(fileId);
    if (it == sources_.end())
        return std::nullopt;
    const SourceText &entry = it->second;
    if (line > entry.lineStarts.size())
        return std::nullopt;
    const std::string &src = entry.text;
    const size_t start = entry.lineStarts[line - 1];
    size_t end = src.find('\n', start);
    if (end == std::string::npos)
        end = src.size();
    if (end > start && src[end - 1] == '\r')
        --end;
    return src.substr(start, end - start);
}

/// @brief Build "line\ncaret" for @p loc.
/// @details Tabs before the column are copied into the caret line so the
///          caret lands under the offending character whatever tab stops the
///          terminal uses.  Carets never run past the end of the line, but a
///          location just past the end (end of input) still gets one caret.
std::optional<std::string> DiagnosticEmitter::renderSnippet(support::SourceLoc loc,
                                                            uint32_t length) const
{
    auto line = getLine(loc.file_id, loc.line);
    if (!line)
        return std::nullopt;

    const size_t indent = loc.column > 0 ? loc.column - 1 : 0;
    std::string caret;
    caret.reserve(indent + length);
    for (size_t i = 0; i < indent; ++i)
        caret += (i < line->size() && (*line)[i] == '\t') ? '\t' : ' ';

    size_t available = line->size() > indent ? line->size() - indent : 0;
    size_t count = std::max<size_t>(1, std::min<size_t>(length, available));
    caret.append(count, '^');

    return *line + "\n" + caret;
}

void printDiagnosticRecord(const DiagnosticRecord &rec,
                           std::ostream &os,
                           const support::SourceManager *sm)
{
    support::printDiag({rec.severity, rec.message, rec.loc, rec.code}, os, sm);
    if (rec.snippet)
        os << *rec.snippet << '\n';
}

void DiagnosticEmitter::print(const DiagnosticRecord &rec, std::ostream &os) const
{
    printDiagnosticRecord(rec, os, sm_);
}

void DiagnosticEmitter::printAll(std::ostream &os) const
{
    for (const auto &rec : records_)
        print(rec, os);
}

size_t DiagnosticEmitter::errorCount() const
{
    return de_.errorCount();
}

size_t DiagnosticEmitter::warningCount() const
{
    return de_.warningCount();
}

} // namespace zaban::frontends::urdu
