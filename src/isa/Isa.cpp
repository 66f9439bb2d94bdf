// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.

#include "isa/Isa.hpp"

#include <cctype>
#include <stdexcept>
#include <string>

namespace rexta::isa
{
namespace
{
constexpr bool tableIsUnique()
{
    for (size_t i = 0; i < kIsaTable.size(); ++i)
    {
        for (size_t j = i + 1; j < kIsaTable.size(); ++j)
        {
            if (kIsaTable[i].opcode == kIsaTable[j].opcode)
                return false;
            if (kIsaTable[i].mnemonic == kIsaTable[j].mnemonic)
                return false;
        }
    }
    return true;
}

static_assert(tableIsUnique(), "opcodes and mnemonics must be unique");

bool equalsIgnoreCase(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}
} // namespace

const IsaEntry *lookupByMnemonic(std::string_view name)
{
    for (const auto &entry : kIsaTable)
    {
        if (equalsIgnoreCase(entry.mnemonic, name))
            return &entry;
    }
    return nullptr;
}

const IsaEntry *lookupByOpcode(uint8_t byte)
{
    for (const auto &entry : kIsaTable)
    {
        if (static_cast<uint8_t>(entry.opcode) == byte)
            return &entry;
    }
    return nullptr;
}

const char *mnemonicOf(Opcode op)
{
    const IsaEntry *entry = lookupByOpcode(static_cast<uint8_t>(op));
    return entry ? entry->mnemonic.data() : "???";
}

void writeAddress(uint8_t *out, Address addr)
{
    for (uint32_t i = 0; i < kAddressBytes; ++i)
    {
        const uint32_t shift = 8 * (kAddressBytes - 1 - i);
        out[i] = static_cast<uint8_t>((addr >> shift) & 0xFF);
    }
}

Address readAddress(const uint8_t *in)
{
    uint32_t value = 0;
    for (uint32_t i = 0; i < kAddressBytes; ++i)
        value = (value << 8) | in[i];
    return static_cast<Address>(value);
}

void encodeInstr(const DecodedInstr &instr, std::vector<uint8_t> &out)
{
    const IsaEntry *entry = lookupByOpcode(static_cast<uint8_t>(instr.opcode));
    if (!entry)
        throw std::logic_error("encodeInstr: opcode " +
                               std::to_string(static_cast<unsigned>(instr.opcode)) +
                               " is not in the encoding table");

    const uint32_t regs = registerOperandCount(entry->shape);
    if ((regs >= 1 && instr.rd >= kRegisterCount) || (regs == 2 && instr.rs >= kRegisterCount))
        throw std::logic_error("encodeInstr: register index out of range for " +
                               std::string(entry->mnemonic));

    out.push_back(static_cast<uint8_t>(entry->opcode));

    uint8_t addr[kAddressBytes];
    switch (entry->shape)
    {
        case OperandShape::None:
            break;
        case OperandShape::RegOnly:
            out.push_back(instr.rd);
            break;
        case OperandShape::RegReg:
            out.push_back(packRegPair(instr.rd, instr.rs));
            break;
        case OperandShape::RegImmediate:
            out.push_back(instr.rd);
            out.push_back(instr.imm);
            break;
        case OperandShape::RegAddress:
            out.push_back(instr.rd);
            writeAddress(addr, instr.addr);
            out.insert(out.end(), addr, addr + kAddressBytes);
            break;
        case OperandShape::AddressOnly:
            writeAddress(addr, instr.addr);
            out.insert(out.end(), addr, addr + kAddressBytes);
            break;
    }
}

DecodeStatus decodeInstr(const uint8_t *bytes,
                         size_t available,
                         DecodedInstr &out,
                         const IsaEntry **entryOut)
{
    if (available == 0)
        return DecodeStatus::Truncated;

    const IsaEntry *entry = lookupByOpcode(bytes[0]);
    if (!entry)
        return DecodeStatus::InvalidOpcode;
    if (entryOut)
        *entryOut = entry;

    if (available < encodedLength(entry->shape))
        return DecodeStatus::Truncated;

    DecodedInstr instr;
    instr.opcode = entry->opcode;
    const uint8_t *operands = bytes + 1;
    switch (entry->shape)
    {
        case OperandShape::None:
            break;
        case OperandShape::RegOnly:
            instr.rd = operands[0];
            break;
        case OperandShape::RegReg:
            instr.rd = regPairDest(operands[0]);
            instr.rs = regPairSource(operands[0]);
            break;
        case OperandShape::RegImmediate:
            instr.rd = operands[0];
            instr.imm = operands[1];
            break;
        case OperandShape::RegAddress:
            instr.rd = operands[0];
            instr.addr = readAddress(operands + 1);
            break;
        case OperandShape::AddressOnly:
            instr.addr = readAddress(operands);
            break;
    }

    const uint32_t regs = registerOperandCount(entry->shape);
    if ((regs >= 1 && instr.rd >= kRegisterCount) || (regs == 2 && instr.rs >= kRegisterCount))
        return DecodeStatus::InvalidRegister;

    out = instr;
    return DecodeStatus::Ok;
}

} // namespace rexta::isa
