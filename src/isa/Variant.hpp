//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/isa/Variant.hpp
// Purpose: Fixed machine parameters of the Rexta CPU variant.
// Key invariants: Assembler and simulator read these constants and nothing else
//                 to size registers, addresses, memory and the stack.
// Ownership: Header-only constants.
// Links: isa/Isa.hpp, sim/Cpu.hpp, asm/Assembler.hpp
//
//===----------------------------------------------------------------------===//
//
// The variant is 8 x 8-bit registers, 16-bit big-endian addressing, 64 KiB of
// flat memory and a downward-growing call stack whose first slot sits just
// below the top of memory.

#pragma once

#include <cstdint>

namespace rexta::isa
{

/// @brief Machine address (PC, SP and address operands).
using Address = uint16_t;

/// @brief Number of general-purpose registers (R0..R7).
constexpr uint32_t kRegisterCount = 8;

/// @brief Width in bytes of an encoded address operand.
constexpr uint32_t kAddressBytes = 2;

/// @brief Total addressable memory in bytes.
constexpr uint32_t kMemorySize = 0x10000;

/// @brief Highest valid address.
constexpr uint32_t kMaxAddress = kMemorySize - 1;

/// @brief Largest value an immediate operand may hold.
constexpr uint32_t kImmediateMax = 0xFF;

/// @brief Initial stack pointer; the stack is empty while SP == kStackTop.
/// @details A push stores the return address at [SP-1, SP] and moves SP down by
///          kAddressBytes, so the first slot occupies 0xFFFD..0xFFFE.
constexpr Address kStackTop = 0xFFFE;

static_assert(kMemorySize == (1u << (8 * kAddressBytes)), "address width must span memory");
static_assert(kRegisterCount <= 16, "register indices must fit in a nibble");

} // namespace rexta::isa
