//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the source position value type carried by tokens, AST
//          nodes and diagnostics.
// Key invariants: line/column are 1-based when known; 0 means unknown.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: docs/frontend.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace zaban::support
{

/// @brief Position of a character within a registered source buffer.
/// @invariant file_id == 0 marks a buffer that was never registered with a
///            SourceManager (for example an interactive line).
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 when not registered.
    uint32_t file_id = 0;

    /// @brief One-based line number; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number; 0 when unknown.
    uint32_t column = 0;

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }

    /// @brief Compare all three coordinates.
    friend bool operator==(const SourceLoc &, const SourceLoc &) = default;
};

} // namespace zaban::support
