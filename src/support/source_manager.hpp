//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the registry that maps file identifiers to paths.
// Key invariants: File ID 0 is invalid; a path registered twice keeps its id.
// Ownership/Lifetime: Manager owns the normalized path strings.
// Links: docs/frontend.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace zaban::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

/// Maintains the mapping between numeric file identifiers and their
/// filesystem paths so diagnostics can print "path:line:col".
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @return The id already assigned to the normalized path, a new id, or 0
    ///         once the 32-bit id space is exhausted (nothing is inserted).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id, or an empty view when unknown.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Number of registered files.
    size_t fileCount() const
    {
        return files_.size();
    }

  private:
    friend struct SourceManagerTestAccess;

    /// Index i holds the path of file id i + 1; deque keeps views stable.
    std::deque<std::string> files_;

    /// Stored as 64-bit to detect overflow of the 32-bit id space.
    uint64_t next_file_id_ = 1;

    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace zaban::support
