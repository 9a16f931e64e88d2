//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Loads source files for the command-line tools.
// Key invariants: LoadedSource holds the complete file contents and the id
//                 the SourceManager assigned to the path.
// Ownership/Lifetime: The caller owns the returned LoadedSource.
// Links: docs/frontend.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <string>

namespace zaban::tools::common
{

/// @brief Largest source file the tools accept.
inline constexpr unsigned long long kMaxSourceBytes = 256ULL * 1024 * 1024;

struct LoadedSource
{
    std::string buffer; ///< Full contents of the source file.
    uint32_t fileId{0}; ///< Identifier assigned by SourceManager.
};

/// @brief Read @p path and register it with @p sm.
/// @return The contents, or a diagnostic when the file cannot be opened, is
///         larger than kMaxSourceBytes, or cannot be registered.
zaban::support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                        zaban::support::SourceManager &sm);

} // namespace zaban::tools::common
