//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Options.hpp
/// @brief Options controlling a single parse.
///
/// @details Populated from command-line flags by zabanc and passed to
/// parse().  Defaults describe batch mode: every diagnostic is collected.
///
/// Ownership/Lifetime: Value type passed by const reference.
///
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>

namespace zaban::frontends::urdu
{

/// @brief Default bound on statement and expression nesting.
inline constexpr size_t kDefaultMaxNestingDepth = 256;

/// @brief Options controlling lexing and parsing.
struct ParseOptions
{
    /// @brief Maximum nesting of statements, parentheses, brackets, prefix
    ///        operators and conditional branches.
    size_t maxNestingDepth{kDefaultMaxNestingDepth};

    /// @brief Stop at the first statement boundary after an error
    ///        (interactive mode).
    bool haltOnFirstError{false};

    /// @brief Print phase markers to stderr.
    bool trace{false};

    /// @brief Dump the token stream to stderr before parsing.
    bool dumpTokens{false};

    /// @brief Dump the AST to stderr after parsing.
    bool dumpAst{false};
};

} // namespace zaban::frontends::urdu
