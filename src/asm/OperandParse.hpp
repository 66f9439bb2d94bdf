//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/asm/OperandParse.hpp
// Purpose: Per-kind operand parsers used by the emission pass.
// Key invariants: Each parser either returns a value in range for its operand
//                 slot or a diagnostic tagged with an AsmErrc.
// Ownership/Lifetime: Operates on caller-owned tokens and symbol tables.
// Links: asm/Assembler.hpp, asm/AsmErrors.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "asm/AsmLexer.hpp"
#include "asm/SymbolTable.hpp"
#include "isa/Variant.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>

namespace rexta::assembler
{

/// @brief Location context shared by the operand parsers of one line.
struct OperandContext
{
    uint32_t fileId = 0; ///< SourceManager id of the source text.
    uint32_t lineNo = 0; ///< 1-based line of the instruction.
};

/// @brief Parse a register operand `R0`..`R7` (either case).
/// @return Register index, InvalidRegister for `R<n>` with n out of range, or
///         MalformedOperand when the token is not register-shaped.
support::Expected<uint8_t> parseRegisterOperand(const AsmToken &tok, const OperandContext &ctx);

/// @brief Parse an 8-bit immediate operand.
/// @return The byte value, MalformedOperand for non-numeric text, or
///         ValueOutOfRange when the value lies outside 0..255.
support::Expected<uint8_t> parseImmediateOperand(const AsmToken &tok, const OperandContext &ctx);

/// @brief Parse an address operand: a numeric literal or a label reference.
/// @return The address, ValueOutOfRange for literals outside memory,
///         UndefinedLabel for unknown labels, or MalformedOperand otherwise.
support::Expected<isa::Address> parseAddressOperand(const AsmToken &tok,
                                                    const SymbolTable &symbols,
                                                    const OperandContext &ctx);

} // namespace rexta::assembler
