//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the source location value attached to assembler diagnostics.
// Key invariants: line/column are 1-based when known; 0 means unknown.
//                 file_id == 0 means the text did not come from a registered file.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: support/source_manager.hpp, asm/Assembler.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace rexta::support
{

/// @brief Position of a token inside assembler source text.
/// @invariant A location may carry a line without a file (in-memory sources).
/// @ownership Value type with no owned resources.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 for in-memory text.
    uint32_t file_id = 0;

    /// @brief One-based line number; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number within the line; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location points at a line of source text.
    [[nodiscard]] bool isValid() const;

    /// @brief Determine whether a concrete file identifier is attached.
    [[nodiscard]] bool hasFile() const
    {
        return file_id != 0;
    }

    /// @brief Determine whether a 1-based column number is available.
    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

/// @brief Build a location for @p line / @p column inside file @p fileId.
[[nodiscard]] SourceLoc makeLoc(uint32_t fileId, uint32_t line, uint32_t column);

} // namespace rexta::support
