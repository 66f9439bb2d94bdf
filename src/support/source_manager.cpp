//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager used by rexta-asm to attach file names to
// assembler diagnostics.  Paths are normalized so that "./a.s" and "a.s"
// resolve to the same identifier.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Backing store for the file identifiers carried by SourceLoc.

#include "support/source_manager.hpp"

#include <filesystem>
#include <limits>

namespace rexta::support
{
namespace
{
std::string normalizePath(std::string path)
{
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}
} // namespace

/// @brief Register a file path and assign it a stable identifier.
///
/// @details Identifiers start at one, leaving zero for in-memory sources.
///          Registering the same normalized path twice returns the original
///          identifier.
///
/// @param path Filesystem path to normalize and store.
/// @return Identifier (>0), or 0 when the identifier space is exhausted.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));

    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
        return 0;

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

/// @brief Retrieve the normalized path associated with a file identifier.
/// @param file_id 1-based identifier previously returned by addFile().
/// @return Stored path, or empty view if @p file_id is unknown.
std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}

} // namespace rexta::support
