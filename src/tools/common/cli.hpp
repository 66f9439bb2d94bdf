//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/cli.hpp
// Purpose: Command-line option structures and parsers for rexta-asm and
//          rexta-sim.
// Key invariants: Parsers never print; malformed input is reported as a
//                 diagnostic so the caller decides how to show usage.
// Ownership/Lifetime: Option structures own copies of all strings.
// Links: tools/common/ArgvView.hpp, sim/Cpu.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "isa/Variant.hpp"
#include "sim/Cpu.hpp"
#include "support/diag_expected.hpp"
#include "tools/common/ArgvView.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rexta::tools
{

/// @brief Options accepted by rexta-asm.
struct AsmCliOptions
{
    std::string inputPath;  ///< Source file to assemble.
    std::string outputPath; ///< Image path; derived from inputPath when empty.
    bool listing = false;   ///< Print "0xADDR: 0xBYTE" lines for the image.
};

/// @brief Options accepted by rexta-sim.
struct SimCliOptions
{
    std::string imagePath;                ///< Binary image to run.
    std::optional<isa::Address> inspect;  ///< Memory address to report after the run.
    sim::RunConfig run;                   ///< Load base, step budget and tracing.
    bool dumpRegs = false;                ///< Print registers, SP, PC and flags.
    bool count = false;                   ///< Print executed instruction count.
};

/// @brief Parse an address written in hexadecimal, with or without "0x".
std::optional<isa::Address> parseHexAddress(std::string_view text);

/// @brief Parse a decimal or 0x-hexadecimal address.
std::optional<isa::Address> parseAddress(std::string_view text);

/// @brief Parse rexta-asm arguments (program name already removed).
support::Expected<AsmCliOptions> parseAsmCommandLine(ArgvView args);

/// @brief Parse rexta-sim arguments (program name already removed).
support::Expected<SimCliOptions> parseSimCommandLine(ArgvView args);

} // namespace rexta::tools
