// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
// Main entry point for rexta-demo: assembles and runs a fixed program that
// adds 10 and 20 and stores the sum at 0x2000.

#include "rexta/version.hpp"
#include "tools/common/drivers.hpp"

#include <iostream>
#include <string_view>

int main(int argc, char **argv)
{
    if (argc > 1)
    {
        std::string_view arg1 = argv[1];
        if (arg1 == "--version")
        {
            std::cout << "rexta-demo v" << REXTA_VERSION_STR << "\n";
            return 0;
        }
        std::cerr << "Usage: rexta-demo [--help|--version]\n"
                  << "\n"
                  << "Program:\n"
                  << rexta::tools::demoProgramSource();
        return (arg1 == "-h" || arg1 == "--help") ? 0 : 1;
    }
    return rexta::tools::runDemo(std::cout, std::cerr);
}
