//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/asm/AsmLexer.hpp
// Purpose: Splits assembler source lines into label, mnemonic and operand tokens.
// Key invariants: Token columns are 1-based offsets into the original line.
//                 Comments start at ';' and run to end of line.
// Ownership/Lifetime: Tokens own copies of their text.
// Links: asm/Assembler.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rexta::assembler
{

/// @brief A piece of source text with the column it starts at.
struct AsmToken
{
    std::string text;    ///< Token text without surrounding whitespace.
    uint32_t column = 0; ///< 1-based column of the first character.
};

/// @brief Tokenised form of one source line.
/// @details A line may carry a label, an instruction, both (`loop: HLT`), or
///          neither (blank or comment-only).
struct AsmLine
{
    uint32_t lineNo = 0;              ///< 1-based line number.
    std::optional<AsmToken> label;    ///< Label name without the trailing ':'.
    std::optional<AsmToken> mnemonic; ///< Mnemonic as written.
    std::vector<AsmToken> operands;   ///< Comma-separated operands in order.

    /// @brief True when the line holds neither a label nor an instruction.
    [[nodiscard]] bool empty() const
    {
        return !label && !mnemonic;
    }
};

/// @brief Split @p source into lines, dropping a trailing '\r' from each.
std::vector<std::string_view> splitLines(std::string_view source);

/// @brief Tokenise a single source line.
/// @param text Line contents without the newline.
/// @param lineNo 1-based line number used for token locations.
/// @param fileId SourceManager id for diagnostics (0 for in-memory text).
/// @return The tokenised line, or a MalformedOperand diagnostic when the line
///         has an empty operand, stray text inside an operand, or a bad label.
support::Expected<AsmLine> lexLine(std::string_view text, uint32_t lineNo, uint32_t fileId);

/// @brief Check that @p name is a label-shaped identifier ([A-Za-z_][A-Za-z0-9_.]*).
[[nodiscard]] bool isIdentifier(std::string_view name);

/// @brief Check that @p name is spelled like a register (R or r followed by digits).
[[nodiscard]] bool isRegisterName(std::string_view name);

} // namespace rexta::assembler
