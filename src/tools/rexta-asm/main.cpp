//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the rexta-asm command-line tool.
// Translates a Rexta assembly source file into a flat binary image.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the rexta-asm assembler.

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
    std::cerr << "rexta-asm v" << REXTA_VERSION_STR << " - Rexta Assembler\n"
              << "\n"
              << "Usage: rexta-asm <input.s> [options]\n"
              << "\n"
              << "Options:\n"
              << "  -o FILE                        Write the image to FILE (default: input with .bin)\n"
              << "  --listing                      Print address/byte pairs of the image\n"
              << "  -h, --help                     Show this help message\n"
              << "  --version                      Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  rexta-asm add.s                       Assemble to add.bin\n"
              << "  rexta-asm add.s -o out.bin --listing  Assemble and list bytes\n";
}

void printVersion()
{
    std::cout << "rexta-asm v" << REXTA_VERSION_STR << "\n";
    std::cout << "Rexta Assembler\n";
    std::cout << "Image format: " << REXTA_IMAGE_FORMAT_STR << "\n";
}

} // namespace

/// @brief Main entry point for rexta-asm.
/// @return 0 on success; 1 on usage, I/O or assembly errors.
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
    auto opts = rexta::tools::parseAsmCommandLine(args.drop_front());
    if (!opts)
    {
        rexta::support::printDiag(opts.error(), std::cerr);
        printUsage();
        return 1;
    }
    return rexta::tools::runAssembler(opts.value(), std::cout, std::cerr);
}
