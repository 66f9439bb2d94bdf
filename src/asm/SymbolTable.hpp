//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/asm/SymbolTable.hpp
// Purpose: Label name to image offset mapping built during layout.
// Key invariants: Names are case-sensitive and unique.
// Ownership/Lifetime: Owned by the Assembler for one assembly.
// Links: asm/Assembler.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "isa/Variant.hpp"
#include "support/source_location.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rexta::assembler
{

class SymbolTable
{
  public:
    /// @brief Record @p name at @p addr.
    /// @return False when @p name is already defined; the table is unchanged.
    bool define(std::string_view name, isa::Address addr, support::SourceLoc loc);

    /// @brief Address bound to @p name, if any.
    [[nodiscard]] std::optional<isa::Address> lookup(std::string_view name) const;

    /// @brief Location of the first definition of @p name (invalid if undefined).
    [[nodiscard]] support::SourceLoc definedAt(std::string_view name) const;

    [[nodiscard]] size_t size() const
    {
        return symbols_.size();
    }

    void clear()
    {
        symbols_.clear();
    }

  private:
    struct Entry
    {
        isa::Address addr = 0;
        support::SourceLoc loc;
    };

    std::unordered_map<std::string, Entry> symbols_;
};

} // namespace rexta::assembler
