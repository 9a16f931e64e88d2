//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.cpp
// Purpose: File loading for zabanc.  The lexer and parser never touch the
//          filesystem; every failure to read input is reported from here.
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace zaban::tools::common
{

using zaban::support::Diagnostic;
using zaban::support::Expected;
using zaban::support::Severity;

Expected<LoadedSource> loadSourceBuffer(const std::string &path, zaban::support::SourceManager &sm)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Expected<LoadedSource>(Diagnostic{Severity::Error, "unable to open " + path, {}});

    // Check the size first so a huge file fails fast instead of exhausting memory.
    in.seekg(0, std::ios::end);
    auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    constexpr auto kLimit = static_cast<std::streamoff>(kMaxSourceBytes);
    if (fileSize < 0 || fileSize > kLimit)
    {
        return Expected<LoadedSource>(Diagnostic{
            Severity::Error, "source file too large: " + path + " (limit: 256 MB)", {}});
    }

    std::string contents;
    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        contents = ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return Expected<LoadedSource>(
            Diagnostic{Severity::Error, "out of memory reading " + path, {}});
    }

    const uint32_t fileId = sm.addFile(path);
    if (fileId == 0)
    {
        return Expected<LoadedSource>(zaban::support::makeError(
            {}, std::string{zaban::support::kSourceManagerFileIdOverflowMessage}));
    }

    LoadedSource source{};
    source.buffer = std::move(contents);
    source.fileId = fileId;
    return Expected<LoadedSource>(std::move(source));
}

} // namespace zaban::tools::common
