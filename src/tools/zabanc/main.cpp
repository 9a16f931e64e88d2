//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/zabanc/main.cpp
// Purpose: Command-line entry point for the Zaban syntax analyzer.
// Key invariants: Exit code is 0 only for well-formed input.
// Ownership/Lifetime: N/A.
// Links: docs/frontend.md
//
//===----------------------------------------------------------------------===//

#include "driver.hpp"
#include "repl.hpp"
#include "usage.hpp"

#include "support/diag_expected.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        zabanc::printUsage(std::cerr);
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    auto config = zabanc::parseArgs(args);
    if (!config)
    {
        zaban::support::printDiag(config.error(), std::cerr);
        zabanc::printUsage(std::cerr);
        return 1;
    }

    if (config.value().showHelp)
    {
        zabanc::printUsage(std::cout);
        return 0;
    }
    if (config.value().showVersion)
    {
        zabanc::printVersion(std::cout);
        return 0;
    }

    if (config.value().mode == zabanc::Mode::Interactive)
        return zabanc::runInteractive(std::cin, std::cout, config.value().parse);

    return zabanc::runDriver(config.value(), std::cout, std::cerr);
}
