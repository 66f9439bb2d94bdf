//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements command-line parsing for the Rexta tools.  Flags may appear in
// any order relative to the positional arguments; options that take a value
// consume the following argument.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Parses rexta-asm and rexta-sim command lines.

#include "tools/common/cli.hpp"

#include "support/literal.hpp"

#include <charconv>
#include <string>
#include <system_error>

namespace rexta::tools
{
namespace
{
support::Diag usageError(std::string message)
{
    return support::makeError({}, std::move(message));
}

std::optional<isa::Address> toAddress(std::string_view literal)
{
    int64_t value = 0;
    if (support::parseIntegerLiteral(literal, value) != support::LiteralStatus::Ok)
        return std::nullopt;
    if (value < 0 || value > static_cast<int64_t>(isa::kMaxAddress))
        return std::nullopt;
    return static_cast<isa::Address>(value);
}

bool isFlag(std::string_view arg)
{
    return arg.size() > 1 && arg.front() == '-';
}
} // namespace

std::optional<isa::Address> parseHexAddress(std::string_view text)
{
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
        text.remove_prefix(2);
    if (text.empty() || text.front() == '-')
        return std::nullopt;
    return toAddress("0x" + std::string(text));
}

std::optional<isa::Address> parseAddress(std::string_view text)
{
    return toAddress(text);
}

support::Expected<AsmCliOptions> parseAsmCommandLine(ArgvView args)
{
    AsmCliOptions opts;
    for (int i = 0; i < args.size(); ++i)
    {
        const std::string_view arg = args.at(i);
        if (arg == "-o")
        {
            if (i + 1 >= args.size())
                return usageError("missing path after -o");
            opts.outputPath = std::string(args.at(++i));
        }
        else if (arg == "--listing")
        {
            opts.listing = true;
        }
        else if (isFlag(arg))
        {
            return usageError("unknown option '" + std::string(arg) + "'");
        }
        else if (opts.inputPath.empty())
        {
            opts.inputPath = std::string(arg);
        }
        else
        {
            return usageError("unexpected argument '" + std::string(arg) + "'");
        }
    }

    if (opts.inputPath.empty())
        return usageError("no input file");
    return opts;
}

support::Expected<SimCliOptions> parseSimCommandLine(ArgvView args)
{
    SimCliOptions opts;
    for (int i = 0; i < args.size(); ++i)
    {
        const std::string_view arg = args.at(i);
        if (arg == "--base")
        {
            if (i + 1 >= args.size())
                return usageError("missing address after --base");
            const std::string_view value = args.at(++i);
            auto base = parseAddress(value);
            if (!base)
                return usageError("invalid base address '" + std::string(value) + "'");
            opts.run.baseAddress = *base;
        }
        else if (arg == "--max-steps")
        {
            if (i + 1 >= args.size())
                return usageError("missing count after --max-steps");
            const std::string_view value = args.at(++i);
            uint64_t parsed = 0;
            const char *const begin = value.data();
            const char *const end = begin + value.size();
            const auto fc = std::from_chars(begin, end, parsed);
            if (fc.ec != std::errc() || fc.ptr != end)
                return usageError("invalid step count '" + std::string(value) + "'");
            opts.run.maxSteps = parsed;
        }
        else if (arg == "--trace")
        {
            opts.run.trace.mode = sim::TraceConfig::Instr;
        }
        else if (arg == "--regs")
        {
            opts.dumpRegs = true;
        }
        else if (arg == "--count")
        {
            opts.count = true;
        }
        else if (isFlag(arg))
        {
            return usageError("unknown option '" + std::string(arg) + "'");
        }
        else if (opts.imagePath.empty())
        {
            opts.imagePath = std::string(arg);
        }
        else if (!opts.inspect)
        {
            auto addr = parseHexAddress(arg);
            if (!addr)
                return usageError("invalid inspection address '" + std::string(arg) + "'");
            opts.inspect = *addr;
        }
        else
        {
            return usageError("unexpected argument '" + std::string(arg) + "'");
        }
    }

    if (opts.imagePath.empty())
        return usageError("no image file");
    return opts;
}

} // namespace rexta::tools
