//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/sim/Trace.cpp
// Purpose: Implement deterministic tracing for CPU steps.
// Key invariants: Each executed instruction produces exactly one flushed line
//                 when tracing is enabled and nothing otherwise.
// Ownership/Lifetime: Sinks write to externally owned streams.
// Links: sim/Trace.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements instruction tracing for the Rexta simulator.
/// @details Lines look like
///          `[INSTR] pc=0x0004 bytes=20 10 op=ADD R0, R1 C=1 Z=0`
///          and report flag state after the instruction executed.  Formatting
///          goes through a saved stream state so callers' hex/dec settings are
///          left untouched.

#include "sim/Trace.hpp"

#include <iomanip>
#include <iostream>
#include <ios>

namespace rexta::sim
{

bool TraceConfig::enabled() const
{
    return mode != Off;
}

namespace
{
/// @brief RAII helper restoring an ostream's format flags and fill.
class StreamStateGuard
{
  public:
    explicit StreamStateGuard(std::ostream &os) : os_(os), flags_(os.flags()), fill_(os.fill()) {}

    ~StreamStateGuard()
    {
        os_.flags(flags_);
        os_.fill(fill_);
    }

    StreamStateGuard(const StreamStateGuard &) = delete;
    StreamStateGuard &operator=(const StreamStateGuard &) = delete;

  private:
    std::ostream &os_;
    std::ios::fmtflags flags_;
    char fill_;
};

void printHex(std::ostream &os, uint32_t value, int width)
{
    os << "0x" << std::uppercase << std::hex << std::setw(width) << std::setfill('0') << value
       << std::dec;
}

void printOperands(std::ostream &os, const isa::IsaEntry &entry, const isa::DecodedInstr &in)
{
    switch (entry.shape)
    {
        case isa::OperandShape::None:
            break;
        case isa::OperandShape::RegOnly:
            os << " R" << unsigned(in.rd);
            break;
        case isa::OperandShape::RegReg:
            os << " R" << unsigned(in.rd) << ", R" << unsigned(in.rs);
            break;
        case isa::OperandShape::RegImmediate:
            os << " R" << unsigned(in.rd) << ", ";
            printHex(os, in.imm, 2);
            break;
        case isa::OperandShape::RegAddress:
            os << " R" << unsigned(in.rd) << ", ";
            printHex(os, in.addr, 4);
            break;
        case isa::OperandShape::AddressOnly:
            os << ' ';
            printHex(os, in.addr, 4);
            break;
    }
}
} // namespace

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

void TraceSink::onStep(const TraceEvent &ev)
{
    if (!cfg.enabled() || !ev.entry)
        return;

    std::ostream &os = cfg.out ? *cfg.out : std::cerr;
    StreamStateGuard guard(os);

    os << "[INSTR] pc=";
    printHex(os, ev.pc, 4);
    os << " bytes=";
    for (uint32_t i = 0; i < ev.length; ++i)
    {
        if (i)
            os << ' ';
        os << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
           << unsigned(ev.bytes[i]) << std::dec;
    }
    os << " op=" << ev.entry->mnemonic;
    printOperands(os, *ev.entry, ev.instr);
    os << " C=" << (ev.carry ? 1 : 0) << " Z=" << (ev.zero ? 1 : 0) << '\n' << std::flush;
}

} // namespace rexta::sim
