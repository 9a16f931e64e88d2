//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/zabanc/usage.hpp
// Purpose: Declarations for zabanc help and version text.
// Key invariants: None.
// Ownership/Lifetime: N/A.
// Links: docs/frontend.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>

namespace zabanc
{

/// @brief Print synopsis, modes and options.
void printUsage(std::ostream &os);

/// @brief Print version information.
void printVersion(std::ostream &os);

} // namespace zabanc
