//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/file_io.hpp
// Purpose: Standardise how command-line tools read sources and read/write
//          binary images.
// Key invariants: Loaded buffers hold the complete file contents.  A failed
//                 write leaves no partially written output file behind.
// Ownership/Lifetime: Returned buffers are owned by the caller.
// Links: support/diag_expected.hpp, support/source_manager.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "isa/Isa.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <string>

namespace rexta::tools::common
{

/// @brief Result of loading a source file into memory.
struct LoadedSource
{
    std::string buffer; ///< Full contents of the source file.
    uint32_t fileId{0}; ///< Identifier assigned by SourceManager (0 indicates failure).
};

/// @brief Read @p path and register it with @p sm for diagnostics.
/// @return Loaded source, or a diagnostic describing the I/O failure or
///         SourceManager overflow.
support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                 support::SourceManager &sm);

/// @brief Read a binary image from @p path.
/// @return Image bytes, or a diagnostic when the file cannot be read or is
///         larger than the CPU memory.
support::Expected<isa::BinaryImage> loadBinaryImage(const std::string &path);

/// @brief Write @p image to @p path, replacing any existing file.
support::Expected<void> writeBinaryImage(const std::string &path, const isa::BinaryImage &image);

/// @brief Default output path for an assembled source: @p input with its
///        extension replaced by ".bin".
std::string defaultImagePath(const std::string &input);

} // namespace rexta::tools::common
