//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/asm/Assembler.hpp
// Purpose: Two-pass translation of Rexta assembly text into a binary image.
// Key invariants: Pass 1 fixes every instruction's offset and every label's
//                 address; pass 2 emits exactly the bytes pass 1 measured.
//                 Assembly is all-or-nothing: any diagnostic means no image.
// Ownership/Lifetime: An Assembler owns its symbol table and pending
//                     instruction list; both are reset by each assemble call.
// Links: isa/Isa.hpp, asm/AsmLexer.hpp, asm/OperandParse.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "asm/AsmLexer.hpp"
#include "asm/SymbolTable.hpp"
#include "isa/Isa.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace rexta::assembler
{

/// @brief Translates assembly source into a flat binary image.
/// @details Typical use:
/// @code
///   Assembler as(fileId);
///   auto image = as.assemble(text);
///   if (!image)
///       support::printDiag(image.error(), std::cerr, &sm);
/// @endcode
class Assembler
{
  public:
    /// @brief Create an assembler whose diagnostics refer to @p fileId.
    explicit Assembler(uint32_t fileId = 0);

    /// @brief Assemble @p source from offset 0.
    /// @return The image, or the first diagnostic encountered. The diagnostic
    ///         code holds an AsmErrc value.
    /// @throws std::logic_error If an instruction emits a different number of
    ///         bytes than was reserved for it during layout.
    support::Expected<isa::BinaryImage> assemble(std::string_view source);

    /// @brief Labels defined by the most recent assemble call.
    [[nodiscard]] const SymbolTable &symbols() const
    {
        return symbols_;
    }

  private:
    /// @brief Instruction recorded by layout, waiting for emission.
    struct PendingInstr
    {
        const isa::IsaEntry *entry = nullptr; ///< Encoding table row.
        std::vector<AsmToken> operands;       ///< Operand tokens as written.
        uint32_t lineNo = 0;                  ///< Source line.
        uint32_t offset = 0;                  ///< Image offset fixed by layout.
    };

    support::Expected<void> layout(std::string_view source);
    support::Expected<isa::BinaryImage> emit() const;
    support::Expected<isa::DecodedInstr> resolve(const PendingInstr &instr) const;

    uint32_t fileId_ = 0;
    SymbolTable symbols_;
    std::vector<PendingInstr> pending_;
    uint32_t imageSize_ = 0;
};

/// @brief Assemble @p source with a throwaway Assembler.
support::Expected<isa::BinaryImage> assemble(std::string_view source, uint32_t fileId = 0);

} // namespace rexta::assembler
