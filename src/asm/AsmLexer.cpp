//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Line tokeniser for the Rexta assembler.  A line has the shape
//
//     [label:] [MNEMONIC [operand {, operand}]] [; comment]
//
// The tokeniser only checks punctuation; whether a mnemonic exists or an
// operand is a valid register or number is decided by the assembler passes.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements splitting of source text into per-line tokens.

#include "asm/AsmLexer.hpp"

#include "asm/AsmErrors.hpp"

#include <cctype>

namespace rexta::assembler
{
namespace
{
bool isSpace(char ch)
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

size_t skipSpaces(std::string_view text, size_t pos)
{
    while (pos < text.size() && isSpace(text[pos]))
        ++pos;
    return pos;
}

uint32_t columnOf(size_t pos)
{
    return static_cast<uint32_t>(pos + 1);
}
} // namespace

std::vector<std::string_view> splitLines(std::string_view source)
{
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= source.size())
    {
        size_t end = source.find('\n', start);
        if (end == std::string_view::npos)
            end = source.size();
        std::string_view line = source.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        lines.push_back(line);
        if (end == source.size())
            break;
        start = end + 1;
    }
    return lines;
}

bool isIdentifier(std::string_view name)
{
    if (name.empty())
        return false;
    const auto head = static_cast<unsigned char>(name.front());
    if (!std::isalpha(head) && head != '_')
        return false;
    for (char ch : name.substr(1))
    {
        const auto c = static_cast<unsigned char>(ch);
        if (!std::isalnum(c) && c != '_' && c != '.')
            return false;
    }
    return true;
}

bool isRegisterName(std::string_view name)
{
    if (name.size() < 2 || (name.front() != 'R' && name.front() != 'r'))
        return false;
    for (char ch : name.substr(1))
    {
        if (!std::isdigit(static_cast<unsigned char>(ch)))
            return false;
    }
    return true;
}

support::Expected<AsmLine> lexLine(std::string_view text, uint32_t lineNo, uint32_t fileId)
{
    if (const size_t semi = text.find(';'); semi != std::string_view::npos)
        text = text.substr(0, semi);

    AsmLine line;
    line.lineNo = lineNo;

    size_t pos = skipSpaces(text, 0);
    if (pos == text.size())
        return line;

    // Leading word: label or mnemonic.
    size_t end = pos;
    while (end < text.size() && !isSpace(text[end]) && text[end] != ':' && text[end] != ',')
        ++end;

    if (end < text.size() && text[end] == ':')
    {
        std::string_view name = text.substr(pos, end - pos);
        if (!isIdentifier(name) || isRegisterName(name))
        {
            return makeAsmError(AsmErrc::MalformedOperand,
                                support::makeLoc(fileId, lineNo, columnOf(pos)),
                                "invalid label name '" + std::string(name) + "'");
        }
        line.label = AsmToken{std::string(name), columnOf(pos)};

        pos = skipSpaces(text, end + 1);
        if (pos == text.size())
            return line;
        end = pos;
        while (end < text.size() && !isSpace(text[end]) && text[end] != ',')
            ++end;
    }

    if (end == pos)
    {
        return makeAsmError(AsmErrc::MalformedOperand,
                            support::makeLoc(fileId, lineNo, columnOf(pos)),
                            "expected mnemonic");
    }
    line.mnemonic = AsmToken{std::string(text.substr(pos, end - pos)), columnOf(pos)};

    // Operands: comma-separated, each a single whitespace-free token.
    pos = skipSpaces(text, end);
    if (pos == text.size())
        return line;

    while (true)
    {
        const size_t start = skipSpaces(text, pos);
        size_t stop = text.find(',', start);
        if (stop == std::string_view::npos)
            stop = text.size();

        size_t last = stop;
        while (last > start && isSpace(text[last - 1]))
            --last;

        if (last == start)
        {
            return makeAsmError(AsmErrc::MalformedOperand,
                                support::makeLoc(fileId, lineNo, columnOf(start)),
                                "empty operand");
        }

        std::string_view operand = text.substr(start, last - start);
        for (size_t i = 0; i < operand.size(); ++i)
        {
            if (isSpace(operand[i]))
            {
                return makeAsmError(AsmErrc::MalformedOperand,
                                    support::makeLoc(fileId, lineNo, columnOf(start + i)),
                                    "unexpected text in operand '" + std::string(operand) + "'");
            }
        }
        line.operands.push_back(AsmToken{std::string(operand), columnOf(start)});

        if (stop == text.size())
            break;
        pos = stop + 1;
    }

    return line;
}

} // namespace rexta::assembler
