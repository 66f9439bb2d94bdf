//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/sim/Fault.cpp
// Purpose: Human-readable formatting of simulator faults.
// Key invariants: Output is a single line without a trailing newline and uses
//                 fixed-width upper-case hexadecimal.
// Ownership/Lifetime: Stateless.
// Links: sim/Fault.hpp
//
//===----------------------------------------------------------------------===//

#include "sim/Fault.hpp"

#include "isa/Isa.hpp"

#include <cstdio>

namespace rexta::sim
{
namespace
{
std::string hex(uint32_t value, int width)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%0*X", width, value);
    return buf;
}

const char *mnemonicFor(uint8_t byte)
{
    const isa::IsaEntry *entry = isa::lookupByOpcode(byte);
    return entry ? isa::mnemonicOf(entry->opcode) : "???";
}
} // namespace

std::string formatFault(const Fault &fault)
{
    std::string out(toString(fault.kind));
    if (fault.kind == FaultKind::None)
        return out;

    out += " at " + hex(fault.pc, 4) + ": ";
    if (fault.pc >= isa::kMemorySize)
    {
        out += "instruction fetch past end of memory";
        return out;
    }
    switch (fault.kind)
    {
        case FaultKind::InvalidOpcode:
            if (isa::lookupByOpcode(fault.opcode))
                out += std::string(mnemonicFor(fault.opcode)) + " names a register outside R0..R" +
                       std::to_string(isa::kRegisterCount - 1);
            else
                out += "opcode " + hex(fault.opcode, 2);
            break;
        case FaultKind::MemoryFault:
            out += std::string(mnemonicFor(fault.opcode)) + " touches address " +
                   hex(fault.address, 5) + " outside memory";
            break;
        case FaultKind::StackFault:
            out += fault.opcode == static_cast<uint8_t>(isa::Opcode::JSR)
                       ? "JSR stack overflow (SP=" + hex(fault.address, 4) + ")"
                       : "RTS stack underflow (SP=" + hex(fault.address, 4) + ")";
            break;
        case FaultKind::None:
            break;
    }
    return out;
}

} // namespace rexta::sim
