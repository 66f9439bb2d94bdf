//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/asm/Assembler.cpp
// Purpose: Layout and emission passes of the Rexta assembler.
// Key invariants: Offsets advance by isa::encodedLength of each instruction's
//                 shape; emission asserts every instruction matches its
//                 reserved length.
// Ownership/Lifetime: See Assembler.hpp.
// Links: isa/Isa.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the two-pass assembler.
/// @details Layout only needs the mnemonic to know an instruction's size, so
///          forward label references need no fixups: by the time emission
///          runs every label already has its final address.

#include "asm/Assembler.hpp"

#include "asm/AsmErrors.hpp"
#include "asm/OperandParse.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace rexta::assembler
{

Assembler::Assembler(uint32_t fileId) : fileId_(fileId) {}

support::Expected<isa::BinaryImage> Assembler::assemble(std::string_view source)
{
    symbols_.clear();
    pending_.clear();
    imageSize_ = 0;

    if (auto laidOut = layout(source); !laidOut)
        return laidOut.error();
    return emit();
}

/// @brief Pass 1: tokenise lines, size instructions and bind labels.
/// @details Diagnoses unknown mnemonics, operand count mismatches, duplicate
///          labels and programs that would not fit in memory.
support::Expected<void> Assembler::layout(std::string_view source)
{
    uint32_t offset = 0;
    uint32_t lineNo = 0;
    for (std::string_view text : splitLines(source))
    {
        ++lineNo;
        auto lexed = lexLine(text, lineNo, fileId_);
        if (!lexed)
            return lexed.error();
        AsmLine &line = lexed.value();

        if (line.label)
        {
            const auto loc = support::makeLoc(fileId_, lineNo, line.label->column);
            if (offset > isa::kMaxAddress)
            {
                return makeAsmError(AsmErrc::ValueOutOfRange,
                                    loc,
                                    "label '" + line.label->text + "' lies past the end of memory");
            }
            if (!symbols_.define(line.label->text, static_cast<isa::Address>(offset), loc))
            {
                const auto first = symbols_.definedAt(line.label->text);
                return makeAsmError(AsmErrc::DuplicateLabel,
                                    loc,
                                    "duplicate label '" + line.label->text +
                                        "' (first defined on line " + std::to_string(first.line) +
                                        ")");
            }
        }

        if (!line.mnemonic)
            continue;

        const auto mnemonicLoc = support::makeLoc(fileId_, lineNo, line.mnemonic->column);
        const isa::IsaEntry *entry = isa::lookupByMnemonic(line.mnemonic->text);
        if (!entry)
        {
            return makeAsmError(AsmErrc::UnknownMnemonic,
                                mnemonicLoc,
                                "unknown mnemonic '" + line.mnemonic->text + "'");
        }

        const uint32_t expected = isa::sourceOperandCount(entry->shape);
        if (line.operands.size() != expected)
        {
            return makeAsmError(AsmErrc::MalformedOperand,
                                mnemonicLoc,
                                std::string(entry->mnemonic) + " expects " +
                                    std::to_string(expected) + " operand(s), got " +
                                    std::to_string(line.operands.size()));
        }

        const uint32_t length = isa::encodedLength(entry->shape);
        if (offset + length > isa::kMemorySize)
        {
            return makeAsmError(AsmErrc::ValueOutOfRange,
                                mnemonicLoc,
                                "program does not fit in " + std::to_string(isa::kMemorySize) +
                                    " bytes of memory");
        }

        pending_.push_back(PendingInstr{entry, std::move(line.operands), lineNo, offset});
        offset += length;
    }

    imageSize_ = offset;
    return {};
}

/// @brief Convert operand tokens of @p instr into a DecodedInstr.
support::Expected<isa::DecodedInstr> Assembler::resolve(const PendingInstr &instr) const
{
    const OperandContext ctx{fileId_, instr.lineNo};
    isa::DecodedInstr out;
    out.opcode = instr.entry->opcode;

    const auto &ops = instr.operands;
    switch (instr.entry->shape)
    {
        case isa::OperandShape::None:
            break;

        case isa::OperandShape::RegOnly:
        {
            auto rd = parseRegisterOperand(ops[0], ctx);
            if (!rd)
                return rd.error();
            out.rd = rd.value();
            break;
        }

        case isa::OperandShape::RegReg:
        {
            auto rd = parseRegisterOperand(ops[0], ctx);
            if (!rd)
                return rd.error();
            auto rs = parseRegisterOperand(ops[1], ctx);
            if (!rs)
                return rs.error();
            out.rd = rd.value();
            out.rs = rs.value();
            break;
        }

        case isa::OperandShape::RegImmediate:
        {
            auto rd = parseRegisterOperand(ops[0], ctx);
            if (!rd)
                return rd.error();
            auto imm = parseImmediateOperand(ops[1], ctx);
            if (!imm)
                return imm.error();
            out.rd = rd.value();
            out.imm = imm.value();
            break;
        }

        case isa::OperandShape::RegAddress:
        {
            auto rd = parseRegisterOperand(ops[0], ctx);
            if (!rd)
                return rd.error();
            auto addr = parseAddressOperand(ops[1], symbols_, ctx);
            if (!addr)
                return addr.error();
            out.rd = rd.value();
            out.addr = addr.value();
            break;
        }

        case isa::OperandShape::AddressOnly:
        {
            auto addr = parseAddressOperand(ops[0], symbols_, ctx);
            if (!addr)
                return addr.error();
            out.addr = addr.value();
            break;
        }
    }
    return out;
}

/// @brief Pass 2: encode every pending instruction in order.
support::Expected<isa::BinaryImage> Assembler::emit() const
{
    isa::BinaryImage image;
    image.reserve(imageSize_);

    for (const PendingInstr &instr : pending_)
    {
        auto decoded = resolve(instr);
        if (!decoded)
            return decoded.error();

        const size_t before = image.size();
        isa::encodeInstr(decoded.value(), image);
        const size_t written = image.size() - before;
        if (before != instr.offset || written != isa::encodedLength(instr.entry->shape))
        {
            throw std::logic_error("assembler: " + std::string(instr.entry->mnemonic) +
                                   " on line " + std::to_string(instr.lineNo) + " emitted " +
                                   std::to_string(written) + " byte(s) at offset " +
                                   std::to_string(before) + ", layout reserved " +
                                   std::to_string(isa::encodedLength(instr.entry->shape)) +
                                   " at offset " + std::to_string(instr.offset));
        }
    }
    return image;
}

support::Expected<isa::BinaryImage> assemble(std::string_view source, uint32_t fileId)
{
    Assembler assembler(fileId);
    return assembler.assemble(source);
}

} // namespace rexta::assembler
