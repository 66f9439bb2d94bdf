//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/drivers.cpp
// Purpose: Shared bodies of the Rexta command-line tools.
// Key invariants: Assembly failures never produce an output file; simulator
//                 exit codes distinguish halt, fault and exhausted budget.
// Ownership/Lifetime: Stateless; every call builds its own Cpu/Assembler.
// Links: src/tools/common/drivers.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the rexta-asm, rexta-sim and rexta-demo tool bodies.

#include "tools/common/drivers.hpp"

#include "asm/Assembler.hpp"
#include "support/source_manager.hpp"
#include "tools/common/file_io.hpp"

#include <iomanip>
#include <ios>

namespace rexta::tools
{
namespace
{
/// @brief Stream manipulator printing @p value as 0x-prefixed upper-case hex.
struct Hex
{
    uint32_t value;
    int width;
};

std::ostream &operator<<(std::ostream &os, Hex h)
{
    const auto flags = os.flags();
    const char fill = os.fill();
    os << "0x" << std::uppercase << std::hex << std::setw(h.width) << std::setfill('0')
       << h.value;
    os.flags(flags);
    os.fill(fill);
    return os;
}

constexpr std::string_view kDemoSource = R"(; Adds two numbers and stores the sum at 0x2000.
        LOADI R0, 10
        LOADI R1, 20
        ADD   R0, R1
        STORE R0, 0x2000
        HLT
)";

constexpr isa::Address kDemoResultAddress = 0x2000;
} // namespace

void writeListing(const isa::BinaryImage &image, std::ostream &out, isa::Address base)
{
    for (size_t i = 0; i < image.size(); ++i)
        out << Hex{static_cast<uint32_t>(base + i), 4} << ": " << Hex{image[i], 2} << '\n';
}

void writeRegisterDump(const sim::Cpu &cpu, std::ostream &out)
{
    for (uint32_t r = 0; r < isa::kRegisterCount; ++r)
    {
        out << 'R' << r << '=' << Hex{cpu.reg(r), 2};
        out << (r + 1 == isa::kRegisterCount ? '\n' : ' ');
    }
    out << "PC=" << Hex{cpu.pc(), 4} << " SP=" << Hex{cpu.sp(), 4}
        << " CARRY=" << (cpu.carry() ? 1 : 0) << " ZERO=" << (cpu.zero() ? 1 : 0) << '\n';
}

int runAssembler(const AsmCliOptions &opts, std::ostream &out, std::ostream &err)
{
    support::SourceManager sm;
    auto source = common::loadSourceBuffer(opts.inputPath, sm);
    if (!source)
    {
        support::printDiag(source.error(), err);
        return kExitFailure;
    }

    auto image = assembler::assemble(source.value().buffer, source.value().fileId);
    if (!image)
    {
        support::printDiag(image.error(), err, &sm);
        return kExitFailure;
    }

    const std::string outputPath =
        opts.outputPath.empty() ? common::defaultImagePath(opts.inputPath) : opts.outputPath;
    if (auto written = common::writeBinaryImage(outputPath, image.value()); !written)
    {
        support::printDiag(written.error(), err);
        return kExitFailure;
    }

    if (opts.listing)
        writeListing(image.value(), out);
    return kExitOk;
}

int runImage(const isa::BinaryImage &image,
             const SimCliOptions &opts,
             std::ostream &out,
             std::ostream &err)
{
    sim::Cpu cpu;
    sim::TraceConfig trace = opts.run.trace;
    if (!trace.out)
        trace.out = &err;
    cpu.setTrace(trace);

    if (auto loaded = cpu.load(image, opts.run.baseAddress); !loaded)
    {
        support::printDiag(loaded.error(), err);
        return kExitFailure;
    }

    const sim::RunStatus status = cpu.run(opts.run.maxSteps);
    int rc = kExitOk;
    switch (status)
    {
        case sim::RunStatus::Halted:
            out << "Run successful\n";
            if (opts.inspect)
            {
                out << "Value at " << Hex{*opts.inspect, 4} << ": "
                    << Hex{cpu.readMem(*opts.inspect), 2} << '\n';
            }
            break;
        case sim::RunStatus::Faulted:
            err << "fault: " << sim::formatFault(cpu.fault()) << '\n';
            rc = kExitFailure;
            break;
        case sim::RunStatus::StepBudgetExceeded:
            err << "step budget of " << opts.run.maxSteps << " instruction(s) exhausted at PC="
                << Hex{cpu.pc(), 4} << '\n';
            rc = kExitBudgetExceeded;
            break;
    }

    if (opts.dumpRegs)
        writeRegisterDump(cpu, out);
    if (opts.count)
        out << "Executed " << cpu.instrCount() << " instruction(s)\n";
    return rc;
}

int runSimulator(const SimCliOptions &opts, std::ostream &out, std::ostream &err)
{
    auto image = common::loadBinaryImage(opts.imagePath);
    if (!image)
    {
        support::printDiag(image.error(), err);
        return kExitFailure;
    }
    return runImage(image.value(), opts, out, err);
}

std::string_view demoProgramSource()
{
    return kDemoSource;
}

int runDemo(std::ostream &out, std::ostream &err)
{
    auto image = assembler::assemble(kDemoSource);
    if (!image)
    {
        support::printDiag(image.error(), err);
        return kExitFailure;
    }

    out << "Encoded program:\n";
    writeListing(image.value(), out);

    SimCliOptions opts;
    opts.inspect = kDemoResultAddress;
    return runImage(image.value(), opts, out, err);
}

} // namespace rexta::tools
