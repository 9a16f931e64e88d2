//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides an Expected container carrying a Diagnostic on failure and
//          the single-line diagnostic printer shared by the tools.
// Key invariants: Exactly one of value or diagnostic is present.
// Ownership/Lifetime: Expected owns its value or diagnostic.
// Links: docs/frontend.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace zaban::support
{

/// @brief Result of a tool-level operation: a value, or the Diagnostic that
///        explains why there is none.
template <class T> class Expected
{
  public:
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diagnostic>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    Expected(Diagnostic diag) : error_(std::move(diag)) {}

    explicit operator bool() const
    {
        return value_.has_value();
    }

    /// @brief Access the stored value; requires a successful result.
    T &value()
    {
        return *value_;
    }

    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the diagnostic; requires a failed result.
    const Diagnostic &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diagnostic> error_;
};

/// @brief Create an error diagnostic with location and message.
Diagnostic makeError(SourceLoc loc, std::string msg);

/// @brief Print a single diagnostic as "path:line:col: severity[code]: msg".
/// @details Each prefix part is printed only when known: the path when @p sm
///          resolves the file id, then line and column.
void printDiag(const Diagnostic &diag, std::ostream &os, const SourceManager *sm = nullptr);

} // namespace zaban::support
