//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/zabanc/driver.hpp
// Purpose: Command-line parsing and batch execution for zabanc.
// Key invariants: parseArgs never touches the filesystem.
// Ownership/Lifetime: DriverConfig is a value type.
// Links: docs/frontend.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/urdu/Options.hpp"
#include "support/diag_expected.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace zabanc
{

/// @brief What zabanc does with its input.
enum class Mode
{
    Analyze,     ///< Report diagnostics only.
    Tokens,      ///< Print the token stream.
    Ast,         ///< Report diagnostics, then print the AST on success.
    Interactive, ///< Read statements from standard input.
};

/// @brief Parsed command line.
struct DriverConfig
{
    Mode mode{Mode::Analyze};
    std::string sourcePath{};
    zaban::frontends::urdu::ParseOptions parse{};
    bool showHelp{false};
    bool showVersion{false};
};

/// @brief Parse command-line arguments (excluding argv[0]).
/// @return The configuration, or a diagnostic describing the misuse.
zaban::support::Expected<DriverConfig> parseArgs(const std::vector<std::string> &args);

/// @brief Run a batch mode (Analyze, Tokens or Ast) for @p config.
/// @param out Receives token and AST dumps plus the summary line.
/// @param err Receives diagnostics.
/// @return 0 when the input is well formed, 1 otherwise.
int runDriver(const DriverConfig &config, std::ostream &out, std::ostream &err);

} // namespace zabanc
