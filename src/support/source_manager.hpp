//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the registry mapping assembler source files to numeric ids.
// Key invariants: File ID 0 is invalid; identical normalized paths share an id.
// Ownership/Lifetime: Manager owns file path strings.
// Links: support/source_location.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rexta::support
{

/// Maintains the mapping between numeric file identifiers and their
/// filesystem paths so diagnostics can name the file they point into.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @param path File system path.
    /// @return File identifier (>0 on success, 0 when the id space is exhausted).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id.
    /// @return File path view, or an empty view for unknown ids.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Number of registered files.
    [[nodiscard]] size_t fileCount() const
    {
        return files_.size();
    }

  private:
    /// Stored file paths; index + 1 is the file identifier. std::deque keeps
    /// string references stable as new files are added.
    std::deque<std::string> files_;

    /// Next identifier to assign; 64-bit so overflow is detectable.
    uint64_t next_file_id_ = 1;

    /// Lookup from normalized path to previously assigned identifier.
    std::unordered_map<std::string, uint32_t> path_to_id_;
};

} // namespace rexta::support
