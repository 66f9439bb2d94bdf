// File: src/sim/Fault.hpp
// Purpose: Classification and record of fatal simulator conditions.
// Key invariants: A fault is terminal; FaultKind::None means no fault occurred.
// Ownership/Lifetime: Plain value types.
// Links: sim/Cpu.hpp
#pragma once

#include "isa/Variant.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace rexta::sim
{

/// @brief Categorises the conditions that stop the CPU abnormally.
enum class FaultKind : int32_t
{
    None = 0,          ///< No fault recorded.
    InvalidOpcode = 1, ///< Fetched byte is not an opcode, or names a missing register.
    MemoryFault = 2,   ///< Instruction bytes extend past the end of memory.
    StackFault = 3,    ///< JSR with no room to push, or RTS with an empty stack.
};

/// @brief Snapshot describing the instruction that faulted.
struct Fault
{
    FaultKind kind = FaultKind::None; ///< Fault classification.
    uint32_t pc = 0;                  ///< Address of the faulting instruction.
    uint8_t opcode = 0;               ///< Byte fetched at @ref pc.
    uint32_t address = 0;             ///< Offending address (memory) or SP (stack).
};

/// @brief Convert fault kind to its canonical name.
constexpr std::string_view toString(FaultKind kind) noexcept
{
    switch (kind)
    {
        case FaultKind::None:
            return "None";
        case FaultKind::InvalidOpcode:
            return "InvalidOpcode";
        case FaultKind::MemoryFault:
            return "MemoryFault";
        case FaultKind::StackFault:
            return "StackFault";
    }
    return "None";
}

/// @brief Render @p fault as a single line, e.g.
///        "InvalidOpcode at 0x0004: opcode 0xFF".
std::string formatFault(const Fault &fault);

} // namespace rexta::sim
