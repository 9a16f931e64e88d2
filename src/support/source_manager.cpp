//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager.  "./a.zb" and "a.zb" share one identifier, and
// pseudo-paths such as "<stdin>" pass through unchanged.  The manager reports
// nothing itself; a 0 id is for the caller to turn into a diagnostic.
//
//===----------------------------------------------------------------------===//

#include "source_manager.hpp"

#include <filesystem>
#include <limits>

namespace zaban::support
{

uint32_t SourceManager::addFile(std::string path)
{
    std::string key = std::filesystem::path(std::move(path)).lexically_normal().generic_string();

    if (auto it = path_to_id_.find(key); it != path_to_id_.end())
        return it->second;
    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
        return 0;

    const auto file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(key));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}

} // namespace zaban::support
