// File: tests/unit/CpuFaultTests.cpp
// Purpose: Ensure every fault kind is raised at the right instruction and
//          leaves the CPU state as it was before that instruction.
// Key invariants: PC keeps the faulting address; registers, flags and SP are
//                 untouched; instrCount counts only completed instructions.
// Ownership/Lifetime: Each test owns its Cpu.
// Links: src/sim/Cpu.hpp, src/sim/Fault.hpp

#include <gtest/gtest.h>

#include "CpuTestUtil.hpp"
#include "sim/Cpu.hpp"

using namespace rexta;
using namespace rexta::testutil;
using isa::Opcode;

TEST(CpuFaults, InvalidOpcodeStopsAtFaultingByte)
{
    sim::Cpu cpu;
    auto img = image({opRI(Opcode::LOADI, 0, 5)});
    img.push_back(0xFF);
    ASSERT_TRUE(cpu.load(img));

    EXPECT_EQ(cpu.run(), sim::RunStatus::Faulted);
    EXPECT_EQ(cpu.state(), sim::CpuState::Faulted);
    const auto &f = cpu.fault();
    EXPECT_EQ(f.kind, sim::FaultKind::InvalidOpcode);
    EXPECT_EQ(f.pc, 3u);
    EXPECT_EQ(f.opcode, 0xFF);
    EXPECT_EQ(cpu.pc(), 3u);
    EXPECT_EQ(cpu.reg(0), 5);
    EXPECT_EQ(cpu.instrCount(), 1u);
    EXPECT_EQ(sim::formatFault(f), "InvalidOpcode at 0x0003: opcode 0xFF");
}

TEST(CpuFaults, ZeroFilledMemoryIsNotAProgram)
{
    sim::Cpu cpu;
    ASSERT_TRUE(cpu.load({}));
    EXPECT_EQ(cpu.run(), sim::RunStatus::Faulted);
    EXPECT_EQ(cpu.fault().kind, sim::FaultKind::InvalidOpcode);
    EXPECT_EQ(cpu.fault().opcode, 0x00);
    EXPECT_EQ(cpu.instrCount(), 0u);
}

TEST(CpuFaults, RegisterFieldOutsideFileIsInvalidOpcode)
{
    sim::Cpu cpu;
    ASSERT_TRUE(cpu.load(isa::BinaryImage{0x10, 0x08}));
    EXPECT_EQ(cpu.run(), sim::RunStatus::Faulted);
    EXPECT_EQ(cpu.fault().kind, sim::FaultKind::InvalidOpcode);
    EXPECT_EQ(sim::formatFault(cpu.fault()),
              "InvalidOpcode at 0x0000: NOT names a register outside R0..R7");

    sim::Cpu pair;
    ASSERT_TRUE(pair.load(isa::BinaryImage{0x20, 0x90}));
    EXPECT_EQ(pair.run(), sim::RunStatus::Faulted);
    EXPECT_EQ(pair.fault().kind, sim::FaultKind::InvalidOpcode);
}

TEST(CpuFaults, InstructionTruncatedByEndOfMemory)
{
    sim::Cpu cpu;
    ASSERT_TRUE(cpu.load(image({opRI(Opcode::LOADI, 2, 9), opA(Opcode::JMP, 0xFFFE)})));
    cpu.writeMem(0xFFFE, static_cast<uint8_t>(Opcode::LOADI));
    cpu.writeMem(0xFFFF, 0x00);

    EXPECT_EQ(cpu.run(), sim::RunStatus::Faulted);
    const auto &f = cpu.fault();
    EXPECT_EQ(f.kind, sim::FaultKind::MemoryFault);
    EXPECT_EQ(f.pc, 0xFFFEu);
    EXPECT_EQ(f.address, isa::kMemorySize);
    EXPECT_EQ(cpu.pc(), 0xFFFEu);
    EXPECT_EQ(cpu.reg(2), 9);
    EXPECT_EQ(cpu.reg(0), 0);
    EXPECT_EQ(sim::formatFault(f), "MemoryFault at 0xFFFE: LOADI touches address 0x10000 outside memory");
}

TEST(CpuFaults, FetchPastEndOfMemory)
{
    sim::Cpu cpu;
    ASSERT_TRUE(cpu.load(image({opRI(Opcode::LOADI, 0, 1)}), 0xFFFD));
    EXPECT_FALSE(cpu.step());
    EXPECT_EQ(cpu.pc(), isa::kMemorySize);

    EXPECT_TRUE(cpu.step());
    EXPECT_EQ(cpu.fault().kind, sim::FaultKind::MemoryFault);
    EXPECT_EQ(cpu.fault().pc, isa::kMemorySize);
    EXPECT_EQ(cpu.instrCount(), 1u);
    EXPECT_EQ(sim::formatFault(cpu.fault()),
              "MemoryFault at 0x10000: instruction fetch past end of memory");
}

TEST(CpuFaults, JsrWhoseReturnAddressIsOutsideMemory)
{
    sim::Cpu cpu;
    ASSERT_TRUE(cpu.load(image({opA(Opcode::JSR, 0x0000)}), 0xFFFD));
    EXPECT_EQ(cpu.run(), sim::RunStatus::Faulted);
    EXPECT_EQ(cpu.fault().kind, sim::FaultKind::MemoryFault);
    EXPECT_EQ(cpu.fault().address, isa::kMemorySize);
    EXPECT_EQ(cpu.sp(), isa::kStackTop);
    EXPECT_EQ(cpu.pc(), 0xFFFDu);
}

TEST(CpuFaults, RtsOnEmptyStack)
{
    sim::Cpu cpu;
    ASSERT_TRUE(cpu.load(image({opRI(Opcode::LOADI, 1, 0), op(Opcode::RTS)})));
    EXPECT_EQ(cpu.run(), sim::RunStatus::Faulted);
    const auto &f = cpu.fault();
    EXPECT_EQ(f.kind, sim::FaultKind::StackFault);
    EXPECT_EQ(f.pc, 3u);
    EXPECT_EQ(cpu.sp(), isa::kStackTop);
    EXPECT_TRUE(cpu.zero());
    EXPECT_EQ(sim::formatFault(f), "StackFault at 0x0003: RTS stack underflow (SP=0xFFFE)");
}

TEST(CpuFaults, UnboundedRecursionOverflowsStack)
{
    sim::Cpu cpu;
    ASSERT_TRUE(cpu.load(image({opA(Opcode::JSR, 0x0000)})));
    EXPECT_EQ(cpu.run(), sim::RunStatus::Faulted);
    const auto &f = cpu.fault();
    EXPECT_EQ(f.kind, sim::FaultKind::StackFault);
    EXPECT_EQ(f.pc, 0u);
    EXPECT_EQ(cpu.sp(), 0u);
    // SP drops by two from 0xFFFE on each call until no two-byte slot remains.
    EXPECT_EQ(cpu.instrCount(), 32767u);
    EXPECT_EQ(sim::formatFault(f), "StackFault at 0x0000: JSR stack overflow (SP=0x0000)");
}

TEST(CpuFaults, FaultKindNames)
{
    EXPECT_EQ(sim::toString(sim::FaultKind::None), "None");
    EXPECT_EQ(sim::toString(sim::FaultKind::InvalidOpcode), "InvalidOpcode");
    EXPECT_EQ(sim::toString(sim::FaultKind::MemoryFault), "MemoryFault");
    EXPECT_EQ(sim::toString(sim::FaultKind::StackFault), "StackFault");
    EXPECT_EQ(sim::formatFault(sim::Fault{}), "None");
    EXPECT_STREQ(sim::toString(sim::RunStatus::StepBudgetExceeded), "StepBudgetExceeded");
    EXPECT_STREQ(sim::toString(sim::CpuState::Faulted), "Faulted");
}
