//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Integer literal parsing for assembler operands and tool arguments.  Digits
// are accumulated by hand so overflow is detected exactly instead of relying
// on std::stoll exceptions.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements decimal/hexadecimal literal parsing.

#include "support/literal.hpp"

#include <cctype>
#include <limits>

namespace rexta::support
{
namespace
{
int digitValue(char ch, int base)
{
    int v = -1;
    if (ch >= '0' && ch <= '9')
        v = ch - '0';
    else if (ch >= 'a' && ch <= 'f')
        v = ch - 'a' + 10;
    else if (ch >= 'A' && ch <= 'F')
        v = ch - 'A' + 10;
    return v < base ? v : -1;
}
} // namespace

/// @brief Parse a token as a signed integer literal.
///
/// Recognises an optional leading '-', then either a "0x"/"0X" prefix followed
/// by hexadecimal digits or a run of decimal digits.  Anything else, including
/// a bare prefix or trailing junk, is Malformed.  Magnitudes that do not fit
/// in int64_t are reported as OutOfRange so callers can tell "too big" apart
/// from "not a number".
LiteralStatus parseIntegerLiteral(std::string_view token, int64_t &value)
{
    size_t pos = 0;
    bool negative = false;
    if (pos < token.size() && token[pos] == '-')
    {
        negative = true;
        ++pos;
    }

    int base = 10;
    if (pos + 1 < token.size() && token[pos] == '0' &&
        (token[pos + 1] == 'x' || token[pos + 1] == 'X'))
    {
        base = 16;
        pos += 2;
    }

    if (pos >= token.size())
        return LiteralStatus::Malformed;

    constexpr uint64_t kLimit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    uint64_t acc = 0;
    bool overflow = false;
    for (; pos < token.size(); ++pos)
    {
        const int d = digitValue(token[pos], base);
        if (d < 0)
            return LiteralStatus::Malformed;
        if (acc > (kLimit - static_cast<uint64_t>(d)) / static_cast<uint64_t>(base))
            overflow = true;
        else
            acc = acc * static_cast<uint64_t>(base) + static_cast<uint64_t>(d);
    }

    if (overflow)
        return LiteralStatus::OutOfRange;

    value = negative ? -static_cast<int64_t>(acc) : static_cast<int64_t>(acc);
    return LiteralStatus::Ok;
}

bool looksNumeric(std::string_view token)
{
    if (!token.empty() && token.front() == '-')
        token.remove_prefix(1);
    return !token.empty() && std::isdigit(static_cast<unsigned char>(token.front()));
}

} // namespace rexta::support
