//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the rexta-sim command-line tool.
// Loads a binary image, runs it on a fresh CPU and reports the outcome.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the rexta-sim simulator.

#include "rexta/version.hpp"
#include "support/diag_expected.hpp"
#include "tools/common/ArgvView.hpp"
#include "tools/common/cli.hpp"
#include "tools/common/drivers.hpp"

#include <iostream>
#include <string_view>

namespace
{

void printUsage()
{
    std::cerr << "rexta-sim v" << REXTA_VERSION_STR << " - Rexta CPU Simulator\n"
              << "\n"
              << "Usage: rexta-sim <image.bin> [<inspect-addr>] [options]\n"
              << "\n"
              << "Options:\n"
              << "  --base ADDR                    Load address and initial PC (default 0)\n"
              << "  --max-steps N                  Stop after N instructions (exit code 2)\n"
              << "  --trace                        Trace each executed instruction to stderr\n"
              << "  --regs                         Print registers and flags after the run\n"
              << "  --count                        Print the executed instruction count\n"
              << "  -h, --help                     Show this help message\n"
              << "  --version                      Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  rexta-sim add.bin 2000                Run and print the byte at 0x2000\n"
              << "  rexta-sim loop.bin --max-steps 1000   Guard against endless loops\n"
              << "\n"
              << "Notes:\n"
              << "  - <inspect-addr> is hexadecimal, with or without a 0x prefix\n";
}

void printVersion()
{
    std::cout << "rexta-sim v" << REXTA_VERSION_STR << "\n";
    std::cout << "Rexta CPU Simulator\n";
    std::cout << "Image format: " << REXTA_IMAGE_FORMAT_STR << "\n";
}

} // namespace

/// @brief Main entry point for rexta-sim.
/// @return 0 when the program halts, 1 on errors or CPU faults, 2 when the
///         step budget runs out.
int main(int argc, char **argv)
{
    if (argc < 2)
    {
        printUsage();
        return 1;
    }

    std::string_view arg1 = argv[1];
    if (arg1 == "-h" || arg1 == "--help")
    {
        printUsage();
        return 0;
    }
    if (arg1 == "--version")
    {
        printVersion();
        return 0;
    }

    const rexta::tools::ArgvView args{argc, argv};
    auto opts = rexta::tools::parseSimCommandLine(args.drop_front());
    if (!opts)
    {
        rexta::support::printDiag(opts.error(), std::cerr);
        printUsage();
        return 1;
    }

    std::cout << "Executing: " << opts.value().imagePath << "\n";
    return rexta::tools::runSimulator(opts.value(), std::cout, std::cerr);
}
