//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line helpers for the SourceLoc value type.  The assembler produces
// locations for sources read from disk (with a file id) and for sources handed
// over as in-memory strings (file id zero), so validity is keyed on the line
// number rather than on the file id.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements validity queries and construction for `SourceLoc`.

#include "support/source_location.hpp"

namespace rexta::support
{

/// @brief Determine whether the location names a real line of source.
///
/// @details Diagnostics raised before any line was read (for instance an I/O
///          failure) carry a default-constructed location.  Every location
///          produced while scanning source text has a non-zero line, even when
///          the text never came from a file.
///
/// @return True when a 1-based line number is present.
bool SourceLoc::isValid() const
{
    return line != 0;
}

/// @brief Assemble a location triple.
/// @param fileId Identifier from SourceManager or 0 for in-memory text.
/// @param line One-based line number.
/// @param column One-based column number, or 0 when the whole line is meant.
/// @return Populated location value.
SourceLoc makeLoc(uint32_t fileId, uint32_t line, uint32_t column)
{
    SourceLoc loc;
    loc.file_id = fileId;
    loc.line = line;
    loc.column = column;
    return loc;
}

} // namespace rexta::support
