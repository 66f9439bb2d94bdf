//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/sim/Cpu.hpp
// Purpose: Register, flag and memory model of the Rexta CPU with its
//          fetch-decode-execute loop.
// Key invariants: A faulting instruction commits no state change; PC keeps
//                 the faulting instruction's address.  Halted and Faulted are
//                 terminal states.
// Ownership: Each Cpu owns its 64 KiB memory; CPUs share nothing but the
//            immutable encoding table.
// Lifetime: Created fresh per run; load() places the program.
// Links: isa/Isa.hpp, sim/Fault.hpp, sim/Trace.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "isa/Isa.hpp"
#include "sim/Fault.hpp"
#include "sim/Trace.hpp"
#include "support/diag_expected.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace rexta::sim
{

/// @brief Execution state of a CPU.
enum class CpuState
{
    Running, ///< Instructions may be stepped.
    Halted,  ///< HLT executed.
    Faulted  ///< A fault stopped execution; see Cpu::fault().
};

/// @brief Aggregate status reported by Cpu::run.
enum class RunStatus
{
    Halted,            ///< Program executed HLT.
    Faulted,           ///< A fault stopped the program.
    StepBudgetExceeded ///< Step limit reached; the CPU is still Running.
};

/// @brief Parameters for one simulator run.
struct RunConfig
{
    isa::Address baseAddress = 0; ///< Load address and initial PC.
    uint64_t maxSteps = 0;        ///< Instruction budget; 0 = unlimited.
    TraceConfig trace;            ///< Instruction tracing.
};

/// @brief Canonical name of a CPU state.
const char *toString(CpuState state);

/// @brief Canonical name of a run status.
const char *toString(RunStatus status);

/// @brief Rexta CPU: 8 general registers, PC, SP, CARRY/ZERO and 64 KiB RAM.
/// @details Typical use:
/// @code
///   Cpu cpu;
///   if (auto ok = cpu.load(image, 0); !ok) ...
///   switch (cpu.run()) ...
/// @endcode
class Cpu
{
  public:
    /// @brief Power-on state: registers and flags zero, SP at the stack top,
    ///        memory zero-filled, PC 0, Running.
    Cpu();

    /// @brief Copy @p image into memory at @p base and set PC to @p base.
    /// @return Error diagnostic, with no state change, when the image does not
    ///         fit between @p base and the end of memory.
    support::Expected<void> load(const isa::BinaryImage &image, isa::Address base = 0);

    /// @brief Execute exactly one instruction.
    /// @return True when the CPU is no longer Running afterwards.
    /// @throws std::logic_error If the CPU is already Halted or Faulted.
    bool step();

    /// @brief Step until HLT, a fault, or @p maxSteps instructions (0 = no limit).
    /// @throws std::logic_error If the CPU is already Halted or Faulted.
    RunStatus run(uint64_t maxSteps = 0);

    /// @brief Route trace output according to @p cfg.
    void setTrace(TraceConfig cfg);

    CpuState state() const
    {
        return state_;
    }

    /// @brief Last fault; kind is None unless state() is Faulted.
    const Fault &fault() const
    {
        return fault_;
    }

    /// @brief Value of register @p index.
    /// @throws std::out_of_range If @p index >= isa::kRegisterCount.
    uint8_t reg(uint32_t index) const;

    /// @brief Overwrite register @p index; used by harnesses to seed state.
    /// @throws std::out_of_range If @p index >= isa::kRegisterCount.
    void setReg(uint32_t index, uint8_t value);

    /// @brief Address of the next instruction to fetch.
    /// @details One past the last memory byte when the previous instruction
    ///          ended exactly at the end of memory.
    uint32_t pc() const
    {
        return pc_;
    }

    isa::Address sp() const
    {
        return sp_;
    }

    bool carry() const
    {
        return carry_;
    }

    bool zero() const
    {
        return zero_;
    }

    uint8_t readMem(isa::Address addr) const
    {
        return mem_[addr];
    }

    void writeMem(isa::Address addr, uint8_t value)
    {
        mem_[addr] = value;
    }

    /// @brief Number of instructions that completed successfully.
    uint64_t instrCount() const
    {
        return instrCount_;
    }

  private:
    void raiseFault(FaultKind kind, uint8_t opcode, uint32_t address);

    std::array<uint8_t, isa::kRegisterCount> regs_{}; ///< General registers.
    uint32_t pc_ = 0;                                 ///< Program counter.
    isa::Address sp_ = isa::kStackTop;                ///< Stack pointer.
    bool carry_ = false;                              ///< CARRY flag.
    bool zero_ = false;                               ///< ZERO flag.
    std::vector<uint8_t> mem_;                        ///< Main memory.
    CpuState state_ = CpuState::Running;              ///< Execution state.
    Fault fault_;                                     ///< Most recent fault.
    uint64_t instrCount_ = 0;                         ///< Completed instructions.
    TraceSink tracer_;                                ///< Instruction trace output.
};

} // namespace rexta::sim
