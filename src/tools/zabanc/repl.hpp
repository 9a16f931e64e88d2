//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/zabanc/repl.hpp
// Purpose: Line-oriented interactive mode for zabanc.
// Key invariants: Each entry is parsed independently and halts at its first
//                 error.
// Ownership/Lifetime: Streams are borrowed for the duration of the call.
// Links: docs/frontend.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/urdu/Options.hpp"

#include <istream>
#include <ostream>

namespace zabanc
{

/// @brief Prompt on @p out and analyze statements read from @p in.
/// @details Commands: exit, quit, help, tokens (last entry), ast (last
///          successful entry).  An entry continues on "... " lines until a
///          line ends with ';' or '}' or a blank line is entered.
/// @return 0 when the session ends normally.
int runInteractive(std::istream &in,
                   std::ostream &out,
                   const zaban::frontends::urdu::ParseOptions &options);

} // namespace zabanc
