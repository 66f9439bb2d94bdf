// File: tests/unit/CpuFlagTests.cpp
// Purpose: Verify arithmetic results and CARRY/ZERO flags of every
//          flag-affecting instruction.
// Key invariants: ADD sets CARRY iff a + b > 255; SUB sets CARRY iff a < b;
//                 ZERO mirrors Rd == 0 after each flag-affecting instruction.
// Ownership/Lifetime: Each test owns its Cpu.
// Links: src/sim/Cpu.hpp

#include <gtest/gtest.h>

#include "CpuTestUtil.hpp"
#include "sim/Cpu.hpp"

using namespace rexta;
using namespace rexta::testutil;
using isa::Opcode;

namespace
{
/// @brief Run `<op> R0, R1` followed by `JMP 0` for every pair of byte values.
template <class Check> void sweepRegReg(Opcode opcode, Check check)
{
    sim::Cpu cpu;
    ASSERT_TRUE(cpu.load(image({opRR(opcode, 0, 1), opA(Opcode::JMP, 0)})));
    for (unsigned a = 0; a < 256; ++a)
    {
        for (unsigned b = 0; b < 256; ++b)
        {
            cpu.setReg(0, static_cast<uint8_t>(a));
            cpu.setReg(1, static_cast<uint8_t>(b));
            ASSERT_FALSE(cpu.step());
            check(a, b, cpu);
            ASSERT_FALSE(cpu.step());
            ASSERT_EQ(cpu.pc(), 0u);
        }
    }
}

sim::Cpu runProgram(const isa::BinaryImage &img)
{
    sim::Cpu cpu;
    EXPECT_TRUE(cpu.load(img));
    EXPECT_EQ(cpu.run(), sim::RunStatus::Halted);
    return cpu;
}
} // namespace

TEST(CpuFlags, AddAllPairs)
{
    sweepRegReg(Opcode::ADD,
                [](unsigned a, unsigned b, const sim::Cpu &cpu)
                {
                    const uint8_t expected = static_cast<uint8_t>(a + b);
                    ASSERT_EQ(cpu.reg(0), expected) << a << " + " << b;
                    ASSERT_EQ(cpu.carry(), a + b > 255) << a << " + " << b;
                    ASSERT_EQ(cpu.zero(), expected == 0) << a << " + " << b;
                    ASSERT_EQ(cpu.reg(1), b);
                });
}

TEST(CpuFlags, SubAllPairs)
{
    sweepRegReg(Opcode::SUB,
                [](unsigned a, unsigned b, const sim::Cpu &cpu)
                {
                    const uint8_t expected = static_cast<uint8_t>(a - b);
                    ASSERT_EQ(cpu.reg(0), expected) << a << " - " << b;
                    ASSERT_EQ(cpu.carry(), a < b) << a << " - " << b;
                    ASSERT_EQ(cpu.zero(), expected == 0) << a << " - " << b;
                });
}

TEST(CpuFlags, AddSameRegisterDoubles)
{
    auto cpu = runProgram(image({opRI(Opcode::LOADI, 2, 0x80), opRR(Opcode::ADD, 2, 2),
                                 op(Opcode::HLT)}));
    EXPECT_EQ(cpu.reg(2), 0);
    EXPECT_TRUE(cpu.carry());
    EXPECT_TRUE(cpu.zero());
}

TEST(CpuFlags, AddiCarryAndWrap)
{
    auto cpu = runProgram(image({opRI(Opcode::LOADI, 3, 250), opRI(Opcode::ADDI, 3, 10),
                                 op(Opcode::HLT)}));
    EXPECT_EQ(cpu.reg(3), 4);
    EXPECT_TRUE(cpu.carry());
    EXPECT_FALSE(cpu.zero());

    cpu = runProgram(image({opRI(Opcode::LOADI, 3, 255), opRI(Opcode::ADDI, 3, 1),
                            op(Opcode::HLT)}));
    EXPECT_EQ(cpu.reg(3), 0);
    EXPECT_TRUE(cpu.carry());
    EXPECT_TRUE(cpu.zero());
}

TEST(CpuFlags, LogicalOpsClearCarry)
{
    struct Case
    {
        Opcode opcode;
        uint8_t a;
        uint8_t b;
        uint8_t result;
    };
    const Case cases[] = {
        {Opcode::AND, 0xF0, 0x0F, 0x00},
        {Opcode::AND, 0xF3, 0x3F, 0x33},
        {Opcode::OR, 0x00, 0x00, 0x00},
        {Opcode::OR, 0xA0, 0x05, 0xA5},
        {Opcode::XOR, 0x5A, 0x5A, 0x00},
        {Opcode::XOR, 0xFF, 0x0F, 0xF0},
    };

    for (const auto &c : cases)
    {
        // ADDI 255 + 255 first so CARRY is set going in.
        auto cpu = runProgram(image({opRI(Opcode::LOADI, 4, 0xFF), opRI(Opcode::ADDI, 4, 0xFF),
                                     opRI(Opcode::LOADI, 0, c.a), opRI(Opcode::LOADI, 1, c.b),
                                     opRR(c.opcode, 0, 1), op(Opcode::HLT)}));
        EXPECT_EQ(cpu.reg(0), c.result) << isa::mnemonicOf(c.opcode);
        EXPECT_FALSE(cpu.carry()) << isa::mnemonicOf(c.opcode);
        EXPECT_EQ(cpu.zero(), c.result == 0) << isa::mnemonicOf(c.opcode);
    }
}

TEST(CpuFlags, NotInvertsAndSetsZero)
{
    auto cpu = runProgram(image({opRI(Opcode::LOADI, 5, 0xFF), opR(Opcode::NOT, 5),
                                 op(Opcode::HLT)}));
    EXPECT_EQ(cpu.reg(5), 0x00);
    EXPECT_TRUE(cpu.zero());
    EXPECT_FALSE(cpu.carry());

    cpu = runProgram(image({opRI(Opcode::LOADI, 5, 0x0F), opR(Opcode::NOT, 5), op(Opcode::HLT)}));
    EXPECT_EQ(cpu.reg(5), 0xF0);
    EXPECT_FALSE(cpu.zero());
}

TEST(CpuFlags, LoadiSetsZeroFromValue)
{
    auto cpu = runProgram(image({opRI(Opcode::LOADI, 0, 0), op(Opcode::HLT)}));
    EXPECT_TRUE(cpu.zero());
    cpu = runProgram(image({opRI(Opcode::LOADI, 0, 1), op(Opcode::HLT)}));
    EXPECT_FALSE(cpu.zero());
}

TEST(CpuFlags, LoadAndStoreMoveBytesAndSetZero)
{
    auto cpu = runProgram(image({opRI(Opcode::LOADI, 1, 0x42), opRA(Opcode::STORE, 1, 0x3000),
                                 opRA(Opcode::LOAD, 2, 0x3000), opRA(Opcode::LOAD, 3, 0x3001),
                                 op(Opcode::HLT)}));
    EXPECT_EQ(cpu.readMem(0x3000), 0x42);
    EXPECT_EQ(cpu.reg(2), 0x42);
    EXPECT_EQ(cpu.reg(3), 0x00);
    EXPECT_TRUE(cpu.zero());
    EXPECT_FALSE(cpu.carry());

    cpu = runProgram(image({opRI(Opcode::LOADI, 1, 0), opRA(Opcode::STORE, 1, 0x3000),
                            op(Opcode::HLT)}));
    EXPECT_TRUE(cpu.zero());
    cpu = runProgram(image({opRI(Opcode::LOADI, 1, 7), opRA(Opcode::STORE, 1, 0x3000),
                            op(Opcode::HLT)}));
    EXPECT_FALSE(cpu.zero());
}

TEST(CpuFlags, JumpsLeaveFlagsAlone)
{
    // LOADI R0, 0 sets ZERO; ADDI 255+1 sets CARRY; JMP/JZ/JC must not touch them.
    auto cpu = runProgram(image({opRI(Opcode::LOADI, 0, 255), opRI(Opcode::ADDI, 0, 1),
                                 opA(Opcode::JMP, 9), opA(Opcode::JZ, 12), opA(Opcode::JC, 15),
                                 op(Opcode::HLT)}));
    EXPECT_TRUE(cpu.zero());
    EXPECT_TRUE(cpu.carry());
}
