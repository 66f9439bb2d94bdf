//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/literal.hpp
// Purpose: Declares the integer literal parser shared by the assembler and the
//          command-line tools (decimal and 0x-prefixed hexadecimal).
// Key invariants: The whole token must be consumed; no surrounding whitespace.
// Ownership/Lifetime: Stateless; operates on caller-provided views.
// Links: asm/OperandParse.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string_view>

namespace rexta::support
{

/// @brief Outcome of parsing an integer literal token.
enum class LiteralStatus
{
    Ok,        ///< Token parsed; value written.
    Malformed, ///< Token is not a decimal or 0x-hexadecimal literal.
    OutOfRange ///< Token is well formed but does not fit in int64_t.
};

/// @brief Parse @p token as an optionally negative decimal or hex literal.
/// @param token Text such as "42", "0x2000" or "-1".
/// @param value Receives the parsed value when the status is Ok.
/// @return Parse status; @p value is untouched unless Ok.
LiteralStatus parseIntegerLiteral(std::string_view token, int64_t &value);

/// @brief Determine whether @p token starts like a numeric literal.
/// @details Used to decide between "malformed number" and "label name" when a
///          token is neither a valid literal nor a valid identifier.
[[nodiscard]] bool looksNumeric(std::string_view token);

} // namespace rexta::support
