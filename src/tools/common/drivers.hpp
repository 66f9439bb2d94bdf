//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/drivers.hpp
// Purpose: Tool bodies behind rexta-asm, rexta-sim and rexta-demo, separated
//          from main() so they can run against in-memory streams.
// Key invariants: Each driver returns the process exit code and writes
//                 results to @p out and diagnostics to @p err only.
// Ownership/Lifetime: Streams are borrowed for the duration of the call.
// Links: tools/common/cli.hpp, tools/common/file_io.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "isa/Isa.hpp"
#include "sim/Cpu.hpp"
#include "tools/common/cli.hpp"

#include <ostream>
#include <string_view>

namespace rexta::tools
{

/// @brief Exit codes shared by the tools.
enum ExitCode : int
{
    kExitOk = 0,            ///< Success.
    kExitFailure = 1,       ///< I/O, usage, assembly error, or CPU fault.
    kExitBudgetExceeded = 2 ///< rexta-sim stopped on --max-steps.
};

/// @brief Print one "0xADDR: 0xBYTE" line per image byte, starting at @p base.
void writeListing(const isa::BinaryImage &image, std::ostream &out, isa::Address base = 0);

/// @brief Print register, SP, PC and flag state of @p cpu.
void writeRegisterDump(const sim::Cpu &cpu, std::ostream &out);

/// @brief Assemble the source named by @p opts and write its image.
int runAssembler(const AsmCliOptions &opts, std::ostream &out, std::ostream &err);

/// @brief Load, run and report the image named by @p opts.
int runSimulator(const SimCliOptions &opts, std::ostream &out, std::ostream &err);

/// @brief Run already-loaded @p image under @p opts and report the outcome.
int runImage(const isa::BinaryImage &image,
             const SimCliOptions &opts,
             std::ostream &out,
             std::ostream &err);

/// @brief Source text of the built-in demo program.
std::string_view demoProgramSource();

/// @brief Assemble and run the demo program, reporting the value at 0x2000.
int runDemo(std::ostream &out, std::ostream &err);

} // namespace rexta::tools
