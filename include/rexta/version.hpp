//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/rexta/version.hpp
// Purpose: Project version strings reported by --version.
//
//===----------------------------------------------------------------------===//

#pragma once

#define REXTA_VERSION_MAJOR 0
#define REXTA_VERSION_MINOR 1
#define REXTA_VERSION_PATCH 0
#define REXTA_VERSION_STR "0.1.0"

/// Binary image format revision; bumped when an opcode or layout changes.
#define REXTA_IMAGE_FORMAT_STR "1"
