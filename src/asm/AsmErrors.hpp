//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/asm/AsmErrors.hpp
// Purpose: Classification of assembler failures carried inside diagnostics.
// Key invariants: AsmErrc values are stored in Diag::code; 0 means "not an
//                 assembler error".
// Ownership/Lifetime: Not applicable.
// Links: support/diag_expected.hpp, asm/Assembler.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace rexta::assembler
{

/// @brief Reasons an assembly can be rejected.
enum class AsmErrc : uint32_t
{
    None = 0,             ///< Not an assembler diagnostic.
    UnknownMnemonic = 1,  ///< Mnemonic has no encoding table entry.
    InvalidRegister = 2,  ///< Register index outside R0..R7.
    ValueOutOfRange = 3,  ///< Immediate or address literal does not fit.
    UndefinedLabel = 4,   ///< Address operand names a label never defined.
    DuplicateLabel = 5,   ///< Label defined more than once.
    MalformedOperand = 6, ///< Operand text or operand count is not valid syntax.
};

/// @brief Convert an error kind to its canonical name.
constexpr std::string_view toString(AsmErrc errc) noexcept
{
    switch (errc)
    {
        case AsmErrc::None:
            return "None";
        case AsmErrc::UnknownMnemonic:
            return "UnknownMnemonic";
        case AsmErrc::InvalidRegister:
            return "InvalidRegister";
        case AsmErrc::ValueOutOfRange:
            return "ValueOutOfRange";
        case AsmErrc::UndefinedLabel:
            return "UndefinedLabel";
        case AsmErrc::DuplicateLabel:
            return "DuplicateLabel";
        case AsmErrc::MalformedOperand:
            return "MalformedOperand";
    }
    return "None";
}

/// @brief Build an error diagnostic tagged with @p errc.
support::Diag makeAsmError(AsmErrc errc, support::SourceLoc loc, std::string message);

/// @brief Recover the assembler error kind stored in @p diag.
/// @return The kind, or AsmErrc::None when the code is not an assembler code.
AsmErrc asmErrcOf(const support::Diag &diag);

} // namespace rexta::assembler
