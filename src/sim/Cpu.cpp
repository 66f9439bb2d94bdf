//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/sim/Cpu.cpp
// Purpose: Fetch-decode-execute loop of the Rexta CPU.
// Key invariants: Every fault is detected before the faulting instruction
//                 writes any register, flag, memory byte, SP or PC.
// Ownership/Lifetime: See Cpu.hpp.
// Links: isa/Isa.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the Rexta CPU model.
/// @details Decoding is delegated to isa::decodeInstr so the simulator reads
///          exactly the layout the assembler writes.  The next PC is computed
///          from the encoded length before execution, which lets jumps simply
///          overwrite it.  The stack lives in ordinary memory and grows
///          downward from isa::kStackTop: a push stores the high byte at SP-1
///          and the low byte at SP, then lowers SP by two.

#include "sim/Cpu.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>

namespace rexta::sim
{

const char *toString(CpuState state)
{
    switch (state)
    {
        case CpuState::Running:
            return "Running";
        case CpuState::Halted:
            return "Halted";
        case CpuState::Faulted:
            return "Faulted";
    }
    return "Running";
}

const char *toString(RunStatus status)
{
    switch (status)
    {
        case RunStatus::Halted:
            return "Halted";
        case RunStatus::Faulted:
            return "Faulted";
        case RunStatus::StepBudgetExceeded:
            return "StepBudgetExceeded";
    }
    return "Halted";
}

Cpu::Cpu() : mem_(isa::kMemorySize, 0) {}

support::Expected<void> Cpu::load(const isa::BinaryImage &image, isa::Address base)
{
    if (image.size() > isa::kMemorySize - base)
    {
        std::ostringstream os;
        os << "image of " << image.size() << " byte(s) does not fit in memory at base 0x"
           << std::hex << std::uppercase << base;
        return support::makeError({}, os.str());
    }

    std::copy(image.begin(), image.end(), mem_.begin() + base);
    pc_ = base;
    return {};
}

void Cpu::setTrace(TraceConfig cfg)
{
    tracer_ = TraceSink(cfg);
}

uint8_t Cpu::reg(uint32_t index) const
{
    if (index >= isa::kRegisterCount)
        throw std::out_of_range("register R" + std::to_string(index) + " does not exist");
    return regs_[index];
}

void Cpu::setReg(uint32_t index, uint8_t value)
{
    if (index >= isa::kRegisterCount)
        throw std::out_of_range("register R" + std::to_string(index) + " does not exist");
    regs_[index] = value;
}

void Cpu::raiseFault(FaultKind kind, uint8_t opcode, uint32_t address)
{
    fault_ = Fault{kind, pc_, opcode, address};
    state_ = CpuState::Faulted;
}

bool Cpu::step()
{
    if (state_ != CpuState::Running)
    {
        throw std::logic_error(std::string("Cpu::step called on a ") + toString(state_) +
                               " CPU");
    }

    // Fetch.
    if (pc_ >= isa::kMemorySize)
    {
        raiseFault(FaultKind::MemoryFault, 0, pc_);
        return true;
    }
    const uint32_t pc = pc_;
    const uint8_t *bytes = mem_.data() + pc;
    const uint8_t opcode = *bytes;

    // Decode.
    isa::DecodedInstr in;
    const isa::IsaEntry *entry = nullptr;
    switch (isa::decodeInstr(bytes, isa::kMemorySize - pc, in, &entry))
    {
        case isa::DecodeStatus::Ok:
            break;
        case isa::DecodeStatus::InvalidOpcode:
        case isa::DecodeStatus::InvalidRegister:
            raiseFault(FaultKind::InvalidOpcode, opcode, pc);
            return true;
        case isa::DecodeStatus::Truncated:
            raiseFault(FaultKind::MemoryFault, opcode, isa::kMemorySize);
            return true;
    }

    const uint32_t length = isa::encodedLength(entry->shape);
    uint32_t nextPc = pc + length;

    // Execute.
    uint8_t &rd = regs_[in.rd];
    const uint8_t rs = regs_[in.rs];
    bool carry = carry_;
    bool zero = zero_;
    auto setLogical = [&](uint8_t value)
    {
        rd = value;
        carry = false;
        zero = value == 0;
    };

    switch (in.opcode)
    {
        case isa::Opcode::ADD:
        case isa::Opcode::ADDI:
        {
            const uint32_t rhs = in.opcode == isa::Opcode::ADD ? rs : in.imm;
            const uint32_t sum = static_cast<uint32_t>(rd) + rhs;
            rd = static_cast<uint8_t>(sum);
            carry = sum > 0xFF;
            zero = rd == 0;
            break;
        }
        case isa::Opcode::SUB:
        {
            const uint8_t lhs = rd;
            rd = static_cast<uint8_t>(lhs - rs);
            carry = lhs < rs;
            zero = rd == 0;
            break;
        }
        case isa::Opcode::AND:
            setLogical(static_cast<uint8_t>(rd & rs));
            break;
        case isa::Opcode::OR:
            setLogical(static_cast<uint8_t>(rd | rs));
            break;
        case isa::Opcode::XOR:
            setLogical(static_cast<uint8_t>(rd ^ rs));
            break;
        case isa::Opcode::NOT:
            setLogical(static_cast<uint8_t>(~rd));
            break;
        case isa::Opcode::LOADI:
            setLogical(in.imm);
            break;
        case isa::Opcode::LOAD:
            setLogical(mem_[in.addr]);
            break;
        case isa::Opcode::STORE:
            mem_[in.addr] = rd;
            carry = false;
            zero = rd == 0;
            break;
        case isa::Opcode::JMP:
            nextPc = in.addr;
            break;
        case isa::Opcode::JZ:
            if (zero_)
                nextPc = in.addr;
            break;
        case isa::Opcode::JC:
            if (carry_)
                nextPc = in.addr;
            break;
        case isa::Opcode::JSR:
            if (sp_ < 2)
            {
                raiseFault(FaultKind::StackFault, opcode, sp_);
                return true;
            }
            if (nextPc > isa::kMaxAddress)
            {
                raiseFault(FaultKind::MemoryFault, opcode, nextPc);
                return true;
            }
            mem_[sp_ - 1] = static_cast<uint8_t>(nextPc >> 8);
            mem_[sp_] = static_cast<uint8_t>(nextPc & 0xFF);
            sp_ = static_cast<isa::Address>(sp_ - 2);
            nextPc = in.addr;
            break;
        case isa::Opcode::RTS:
            if (sp_ >= isa::kStackTop)
            {
                raiseFault(FaultKind::StackFault, opcode, sp_);
                return true;
            }
            sp_ = static_cast<isa::Address>(sp_ + 2);
            nextPc = (static_cast<uint32_t>(mem_[sp_ - 1]) << 8) | mem_[sp_];
            break;
        case isa::Opcode::HLT:
            state_ = CpuState::Halted;
            break;
    }

    carry_ = carry;
    zero_ = zero;
    pc_ = nextPc;
    ++instrCount_;

    tracer_.onStep(
        TraceEvent{static_cast<isa::Address>(pc), entry, in, bytes, length, carry_, zero_});
    return state_ != CpuState::Running;
}

RunStatus Cpu::run(uint64_t maxSteps)
{
    uint64_t executed = 0;
    while (true)
    {
        if (maxSteps != 0 && executed >= maxSteps)
            return RunStatus::StepBudgetExceeded;
        if (step())
            return state_ == CpuState::Halted ? RunStatus::Halted : RunStatus::Faulted;
        ++executed;
    }
}

} // namespace rexta::sim
