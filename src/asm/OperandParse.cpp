//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/asm/OperandParse.cpp
// Purpose: Register, immediate and address operand parsers.
// Key invariants: Diagnostics point at the first column of the operand.
// Ownership/Lifetime: Stateless helpers.
// Links: asm/OperandParse.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements operand parsing for the emission pass.
/// @details Numeric literals go through support::parseIntegerLiteral so the
///          assembler and the tools accept exactly the same spellings.  Range
///          checks happen here, after the literal is known to be well formed,
///          so a negative or oversized value is reported as ValueOutOfRange
///          rather than MalformedOperand.

#include "asm/OperandParse.hpp"

#include "asm/AsmErrors.hpp"
#include "support/literal.hpp"

#include <string>

namespace rexta::assembler
{
namespace
{
support::SourceLoc locOf(const AsmToken &tok, const OperandContext &ctx)
{
    return support::makeLoc(ctx.fileId, ctx.lineNo, tok.column);
}

support::Diag operandError(AsmErrc errc,
                           const AsmToken &tok,
                           const OperandContext &ctx,
                           std::string message)
{
    return makeAsmError(errc, locOf(tok, ctx), std::move(message));
}

/// @brief Parse a numeric literal and check it against [0, maxValue].
support::Expected<uint32_t> parseBoundedLiteral(const AsmToken &tok,
                                                const OperandContext &ctx,
                                                uint32_t maxValue,
                                                const char *what)
{
    int64_t value = 0;
    switch (support::parseIntegerLiteral(tok.text, value))
    {
        case support::LiteralStatus::Ok:
            break;
        case support::LiteralStatus::Malformed:
            return operandError(AsmErrc::MalformedOperand,
                                tok,
                                ctx,
                                "malformed " + std::string(what) + " '" + tok.text + "'");
        case support::LiteralStatus::OutOfRange:
            value = -1;
            break;
    }

    if (value < 0 || value > static_cast<int64_t>(maxValue))
    {
        return operandError(AsmErrc::ValueOutOfRange,
                            tok,
                            ctx,
                            std::string(what) + " '" + tok.text + "' out of range (0.." +
                                std::to_string(maxValue) + ")");
    }
    return static_cast<uint32_t>(value);
}
} // namespace

support::Expected<uint8_t> parseRegisterOperand(const AsmToken &tok, const OperandContext &ctx)
{
    if (!isRegisterName(tok.text))
    {
        return operandError(
            AsmErrc::MalformedOperand, tok, ctx, "expected register, got '" + tok.text + "'");
    }

    uint32_t index = 0;
    for (char ch : std::string_view(tok.text).substr(1))
    {
        index = index * 10 + static_cast<uint32_t>(ch - '0');
        if (index >= isa::kRegisterCount)
        {
            return operandError(AsmErrc::InvalidRegister,
                                tok,
                                ctx,
                                "invalid register '" + tok.text + "' (R0..R" +
                                    std::to_string(isa::kRegisterCount - 1) + ")");
        }
    }
    return static_cast<uint8_t>(index);
}

support::Expected<uint8_t> parseImmediateOperand(const AsmToken &tok, const OperandContext &ctx)
{
    if (!support::looksNumeric(tok.text))
    {
        return operandError(
            AsmErrc::MalformedOperand, tok, ctx, "expected immediate, got '" + tok.text + "'");
    }
    auto value = parseBoundedLiteral(tok, ctx, isa::kImmediateMax, "immediate");
    if (!value)
        return value.error();
    return static_cast<uint8_t>(value.value());
}

support::Expected<isa::Address> parseAddressOperand(const AsmToken &tok,
                                                    const SymbolTable &symbols,
                                                    const OperandContext &ctx)
{
    if (support::looksNumeric(tok.text))
    {
        auto value = parseBoundedLiteral(tok, ctx, isa::kMaxAddress, "address");
        if (!value)
            return value.error();
        return static_cast<isa::Address>(value.value());
    }

    if (!isIdentifier(tok.text) || isRegisterName(tok.text))
    {
        return operandError(
            AsmErrc::MalformedOperand, tok, ctx, "expected address or label, got '" + tok.text + "'");
    }

    if (auto addr = symbols.lookup(tok.text))
        return *addr;
    return operandError(AsmErrc::UndefinedLabel, tok, ctx, "undefined label '" + tok.text + "'");
}

} // namespace rexta::assembler
