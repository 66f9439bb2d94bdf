//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/isa/Isa.hpp
// Purpose: Instruction encoding table and operand layout helpers shared by the
//          assembler and the simulator.
// Key invariants: Each opcode byte and each mnemonic appears in kIsaTable once.
//                 encodedLength(shape) == bytes written by encodeInstr and
//                 bytes consumed by decodeInstr for that shape.
// Ownership: Table is immutable constant data; helpers are stateless.
// Lifetime: Static; lookups return pointers into kIsaTable.
// Links: isa/Variant.hpp, asm/Assembler.hpp, sim/Cpu.hpp
//
//===----------------------------------------------------------------------===//
//
// Instruction Encoding:
// - One opcode byte; its high nibble names the operand shape group.
// - RegOnly:      [op][rd]
// - RegReg:       [op][rs:4|rd:4]            source high nibble, destination low
// - RegImmediate: [op][rd][imm]
// - RegAddress:   [op][rd][addr hi][addr lo]
// - AddressOnly:  [op][addr hi][addr lo]
// - None:         [op]

#pragma once

#include "isa/Variant.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace rexta::isa
{

/// @brief Flat, headerless program image as produced by the assembler.
using BinaryImage = std::vector<uint8_t>;

/// @brief Opcode byte values of the Rexta instruction set.
/// @details Grouped by operand shape:
///          - 0x0_  no operands
///          - 0x1_  single register
///          - 0x2_  register pair
///          - 0x3_  register + immediate
///          - 0x4_  register + address
///          - 0x5_  address
///          Byte 0x00 is deliberately unassigned so that zero-filled memory
///          faults instead of executing.
enum class Opcode : uint8_t
{
    RTS = 0x01,   ///< Return from subroutine.
    HLT = 0x02,   ///< Halt the CPU.
    NOT = 0x10,   ///< Rd <- ~Rd.
    ADD = 0x20,   ///< Rd <- Rd + Rs.
    SUB = 0x21,   ///< Rd <- Rd - Rs.
    AND = 0x22,   ///< Rd <- Rd & Rs.
    OR = 0x23,    ///< Rd <- Rd | Rs.
    XOR = 0x24,   ///< Rd <- Rd ^ Rs.
    LOADI = 0x30, ///< Rd <- imm.
    ADDI = 0x31,  ///< Rd <- Rd + imm.
    LOAD = 0x40,  ///< Rd <- mem[addr].
    STORE = 0x41, ///< mem[addr] <- Rd.
    JMP = 0x50,   ///< PC <- addr.
    JZ = 0x51,    ///< PC <- addr when ZERO is set.
    JC = 0x52,    ///< PC <- addr when CARRY is set.
    JSR = 0x53,   ///< Push return address, PC <- addr.
};

/// @brief Layout of the operand bytes following an opcode.
enum class OperandShape : uint8_t
{
    None,
    RegOnly,
    RegReg,
    RegImmediate,
    RegAddress,
    AddressOnly
};

/// @brief One row of the encoding table.
struct IsaEntry
{
    std::string_view mnemonic; ///< Canonical upper-case mnemonic.
    Opcode opcode;             ///< Opcode byte.
    OperandShape shape;        ///< Operand layout.
};

/// @brief The encoding table; the single source of truth for both components.
inline constexpr std::array<IsaEntry, 16> kIsaTable = {{
    {"RTS", Opcode::RTS, OperandShape::None},
    {"HLT", Opcode::HLT, OperandShape::None},
    {"NOT", Opcode::NOT, OperandShape::RegOnly},
    {"ADD", Opcode::ADD, OperandShape::RegReg},
    {"SUB", Opcode::SUB, OperandShape::RegReg},
    {"AND", Opcode::AND, OperandShape::RegReg},
    {"OR", Opcode::OR, OperandShape::RegReg},
    {"XOR", Opcode::XOR, OperandShape::RegReg},
    {"LOADI", Opcode::LOADI, OperandShape::RegImmediate},
    {"ADDI", Opcode::ADDI, OperandShape::RegImmediate},
    {"LOAD", Opcode::LOAD, OperandShape::RegAddress},
    {"STORE", Opcode::STORE, OperandShape::RegAddress},
    {"JMP", Opcode::JMP, OperandShape::AddressOnly},
    {"JZ", Opcode::JZ, OperandShape::AddressOnly},
    {"JC", Opcode::JC, OperandShape::AddressOnly},
    {"JSR", Opcode::JSR, OperandShape::AddressOnly},
}};

/// @brief Number of operand bytes that follow the opcode for @p shape.
constexpr uint32_t operandBytes(OperandShape shape) noexcept
{
    switch (shape)
    {
        case OperandShape::None:
            return 0;
        case OperandShape::RegOnly:
        case OperandShape::RegReg:
            return 1;
        case OperandShape::RegImmediate:
            return 2;
        case OperandShape::RegAddress:
            return 1 + kAddressBytes;
        case OperandShape::AddressOnly:
            return kAddressBytes;
    }
    return 0;
}

/// @brief Total encoded size of an instruction with operand layout @p shape.
constexpr uint32_t encodedLength(OperandShape shape) noexcept
{
    return 1 + operandBytes(shape);
}

/// @brief Number of register operands written in source for @p shape.
constexpr uint32_t registerOperandCount(OperandShape shape) noexcept
{
    switch (shape)
    {
        case OperandShape::RegReg:
            return 2;
        case OperandShape::RegOnly:
        case OperandShape::RegImmediate:
        case OperandShape::RegAddress:
            return 1;
        case OperandShape::None:
        case OperandShape::AddressOnly:
            return 0;
    }
    return 0;
}

/// @brief Number of operands written in source for @p shape.
constexpr uint32_t sourceOperandCount(OperandShape shape) noexcept
{
    switch (shape)
    {
        case OperandShape::None:
            return 0;
        case OperandShape::RegOnly:
        case OperandShape::AddressOnly:
            return 1;
        case OperandShape::RegReg:
        case OperandShape::RegImmediate:
        case OperandShape::RegAddress:
            return 2;
    }
    return 0;
}

/// @brief Longest encoding of any instruction.
constexpr uint32_t kMaxInstrLength = encodedLength(OperandShape::RegAddress);

/// @brief Find the table entry for @p name (case-insensitive).
/// @return Entry pointer, or nullptr when the mnemonic is unknown.
const IsaEntry *lookupByMnemonic(std::string_view name);

/// @brief Find the table entry for opcode byte @p byte.
/// @return Entry pointer, or nullptr when the byte is not an opcode.
const IsaEntry *lookupByOpcode(uint8_t byte);

/// @brief Canonical mnemonic for @p op, or "???" for a value outside the table.
const char *mnemonicOf(Opcode op);

/// @brief Pack destination @p rd and source @p rs into one RegReg operand byte.
constexpr uint8_t packRegPair(uint8_t rd, uint8_t rs) noexcept
{
    return static_cast<uint8_t>(((rs & 0x0F) << 4) | (rd & 0x0F));
}

/// @brief Destination register of a packed RegReg byte.
constexpr uint8_t regPairDest(uint8_t packed) noexcept
{
    return packed & 0x0F;
}

/// @brief Source register of a packed RegReg byte.
constexpr uint8_t regPairSource(uint8_t packed) noexcept
{
    return static_cast<uint8_t>(packed >> 4);
}

/// @brief Store @p addr at @p out in big-endian order (kAddressBytes bytes).
void writeAddress(uint8_t *out, Address addr);

/// @brief Read a big-endian address of kAddressBytes bytes from @p in.
Address readAddress(const uint8_t *in);

/// @brief Operand-level view of a single instruction.
/// @details Fields not used by the opcode's shape stay zero, which keeps
///          equality meaningful for encode/decode comparisons.
struct DecodedInstr
{
    Opcode opcode = Opcode::HLT; ///< Operation.
    uint8_t rd = 0;              ///< Destination (or only) register.
    uint8_t rs = 0;              ///< Source register (RegReg only).
    uint8_t imm = 0;             ///< Immediate byte (RegImmediate only).
    Address addr = 0;            ///< Address operand (RegAddress/AddressOnly).

    bool operator==(const DecodedInstr &) const = default;
};

/// @brief Result classification for decodeInstr.
enum class DecodeStatus
{
    Ok,              ///< Instruction decoded.
    InvalidOpcode,   ///< Leading byte is not in the table.
    InvalidRegister, ///< A register field names a register that does not exist.
    Truncated        ///< Fewer bytes available than the shape requires.
};

/// @brief Append the encoding of @p instr to @p out.
/// @throws std::logic_error When the opcode is not in the table or a register
///         index is out of range; callers validate operands first.
void encodeInstr(const DecodedInstr &instr, std::vector<uint8_t> &out);

/// @brief Decode the instruction starting at @p bytes.
/// @param bytes First byte of the instruction.
/// @param available Number of readable bytes starting at @p bytes.
/// @param out Receives the decoded instruction when the status is Ok.
/// @param entry Optional; receives the table entry when the opcode is known.
/// @return Decode status; @p out is untouched unless Ok.
DecodeStatus decodeInstr(const uint8_t *bytes,
                         size_t available,
                         DecodedInstr &out,
                         const IsaEntry **entry = nullptr);

} // namespace rexta::isa
