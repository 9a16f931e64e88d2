//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic engine that collects errors and warnings.
// Key invariants: Counts reflect reported diagnostics; storage preserves
//                 emission order.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: docs/frontend.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace zaban::support
{

class SourceManager;

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
    SourceLoc loc;       ///< Optional source location
    std::string code{};  ///< Stable code such as "Z2001"; empty for tool errors
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    /// @param sm Optional source manager for location info.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    /// @brief Diagnostics in emission order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};
} // namespace zaban::support
