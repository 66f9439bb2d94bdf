// File: tests/unit/AssemblerErrorTests.cpp
// Purpose: Check that every assembler error kind is reported with its line
//          and column, and that a failed assembly yields no image.
// Key invariants: The first error aborts assembly.
// Ownership/Lifetime: Standalone tests.
// Links: src/asm/Assembler.hpp, src/asm/AsmErrors.hpp

#include <gtest/gtest.h>

#include "asm/AsmErrors.hpp"
#include "asm/Assembler.hpp"
#include "support/source_manager.hpp"

#include <sstream>
#include <string>

using namespace rexta;
using rexta::assembler::AsmErrc;

namespace
{
struct Failure
{
    AsmErrc errc = AsmErrc::None;
    uint32_t line = 0;
    uint32_t column = 0;
    std::string message;
};

Failure assembleFail(std::string_view source)
{
    auto image = assembler::assemble(source);
    EXPECT_FALSE(image.hasValue()) << "assembly unexpectedly succeeded";
    if (image)
        return {};
    const auto &diag = image.error();
    EXPECT_EQ(diag.severity, support::Severity::Error);
    return Failure{assembler::asmErrcOf(diag), diag.loc.line, diag.loc.column, diag.message};
}
} // namespace

TEST(AssemblerErrors, UnknownMnemonic)
{
    const auto f = assembleFail("HLT\n  NOP\n");
    EXPECT_EQ(f.errc, AsmErrc::UnknownMnemonic);
    EXPECT_EQ(f.line, 2u);
    EXPECT_EQ(f.column, 3u);
    EXPECT_NE(f.message.find("NOP"), std::string::npos);
}

TEST(AssemblerErrors, InvalidRegister)
{
    const auto f = assembleFail("LOADI R0, 1\nADD R0, R8\n");
    EXPECT_EQ(f.errc, AsmErrc::InvalidRegister);
    EXPECT_EQ(f.line, 2u);
    EXPECT_EQ(f.column, 9u);

    EXPECT_EQ(assembleFail("NOT r99").errc, AsmErrc::InvalidRegister);
    EXPECT_EQ(assembleFail("NOT R123456789012345678901234567890").errc, AsmErrc::InvalidRegister);
}

TEST(AssemblerErrors, ValueOutOfRange)
{
    EXPECT_EQ(assembleFail("LOADI R0, 256").errc, AsmErrc::ValueOutOfRange);
    EXPECT_EQ(assembleFail("ADDI R0, -1").errc, AsmErrc::ValueOutOfRange);
    EXPECT_EQ(assembleFail("LOAD R0, 0x10000").errc, AsmErrc::ValueOutOfRange);
    EXPECT_EQ(assembleFail("JMP -5").errc, AsmErrc::ValueOutOfRange);
    EXPECT_EQ(assembleFail("JMP 99999999999999999999999").errc, AsmErrc::ValueOutOfRange);
}

TEST(AssemblerErrors, UndefinedLabelProducesNoImage)
{
    const auto f = assembleFail("LOADI R0, 1\nJMP nowhere\nHLT\n");
    EXPECT_EQ(f.errc, AsmErrc::UndefinedLabel);
    EXPECT_EQ(f.line, 2u);
    EXPECT_EQ(f.column, 5u);
    EXPECT_NE(f.message.find("nowhere"), std::string::npos);
}

TEST(AssemblerErrors, DuplicateLabel)
{
    const auto f = assembleFail("x: HLT\nx: RTS\n");
    EXPECT_EQ(f.errc, AsmErrc::DuplicateLabel);
    EXPECT_EQ(f.line, 2u);
    EXPECT_NE(f.message.find("line 1"), std::string::npos);
}

TEST(AssemblerErrors, MalformedOperands)
{
    EXPECT_EQ(assembleFail("ADD R0").errc, AsmErrc::MalformedOperand);
    EXPECT_EQ(assembleFail("HLT R0").errc, AsmErrc::MalformedOperand);
    EXPECT_EQ(assembleFail("ADD R0,, R1").errc, AsmErrc::MalformedOperand);
    EXPECT_EQ(assembleFail("ADD R0, R1,").errc, AsmErrc::MalformedOperand);
    EXPECT_EQ(assembleFail("LOADI R0, five").errc, AsmErrc::MalformedOperand);
    EXPECT_EQ(assembleFail("LOADI R0, 0xZZ").errc, AsmErrc::MalformedOperand);
    EXPECT_EQ(assembleFail("LOADI 5, R0").errc, AsmErrc::MalformedOperand);
    EXPECT_EQ(assembleFail("JMP R1").errc, AsmErrc::MalformedOperand);
    EXPECT_EQ(assembleFail("LOADI R0, 1 2").errc, AsmErrc::MalformedOperand);
    EXPECT_EQ(assembleFail("1bad: HLT").errc, AsmErrc::MalformedOperand);
    EXPECT_EQ(assembleFail("R1: HLT").errc, AsmErrc::MalformedOperand);
}

TEST(AssemblerErrors, LayoutErrorsPrecedeEmissionErrors)
{
    const auto f = assembleFail("JMP missing\nBOGUS\n");
    EXPECT_EQ(f.errc, AsmErrc::UnknownMnemonic);
    EXPECT_EQ(f.line, 2u);
}

TEST(AssemblerErrors, ProgramLargerThanMemory)
{
    std::string source;
    for (uint32_t i = 0; i < isa::kMemorySize / 4; ++i)
        source += "LOAD R0, 0\n";
    ASSERT_TRUE(assembler::assemble(source));

    source += "HLT\n";
    EXPECT_EQ(assembleFail(source).errc, AsmErrc::ValueOutOfRange);
}

TEST(AssemblerErrors, PrintedWithPath)
{
    support::SourceManager sm;
    const uint32_t fileId = sm.addFile("progs/bad.s");
    auto image = assembler::assemble("HLT\nJMP nowhere\n", fileId);
    ASSERT_FALSE(image);

    std::ostringstream os;
    support::printDiag(image.error(), os, &sm);
    EXPECT_EQ(os.str(), "progs/bad.s:2:5: error: undefined label 'nowhere'\n");
}

TEST(AssemblerErrors, ErrorNames)
{
    EXPECT_EQ(assembler::toString(AsmErrc::UndefinedLabel), "UndefinedLabel");
    EXPECT_EQ(assembler::toString(AsmErrc::MalformedOperand), "MalformedOperand");
    EXPECT_EQ(assembler::asmErrcOf(support::makeError({}, "plain")), AsmErrc::None);
}
