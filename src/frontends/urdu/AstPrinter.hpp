//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.hpp
/// @brief Human-readable dumps of the AST.
///
/// @details dump() produces an indentation-based tree with one node per line
/// and its position.  toSExpr() renders one expression as a compact
/// S-expression, which is what tests and the interactive mode compare
/// against.
///
/// Example output:
/// @code
///   Program (1:1)
///     DeclStmt int "x" (1:1)
///       BinaryExpr (+) (1:9)
///         IntLiteral 2 (1:9)
///         BinaryExpr (*) (1:13)
///           IntLiteral 3 (1:13)
///           IntLiteral 4 (1:17)
/// @endcode
///
/// S-expression forms: `(+ 2 (* 3 4))`, `(- x)` for prefix minus,
/// `(post++ i)`, `(index a 0)`, `(call f x y)`, `(?: c a b)`,
/// `(array 1 2)`.
///
/// @invariant Printing never mutates the AST.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/urdu/AST.hpp"
#include <string>

namespace zaban::frontends::urdu
{

/// @brief Produces a human-readable dump of a program.
class AstPrinter
{
  public:
    /// @brief Dump the whole program tree.
    std::string dump(const Program &program);

    /// @brief Dump a single statement subtree.
    std::string dump(const Stmt &stmt);
};

/// @brief Render @p expr as a compact S-expression.
std::string toSExpr(const Expr &expr);

} // namespace zaban::frontends::urdu
