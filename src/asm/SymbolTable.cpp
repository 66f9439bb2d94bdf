// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.

#include "asm/SymbolTable.hpp"

namespace rexta::assembler
{

bool SymbolTable::define(std::string_view name, isa::Address addr, support::SourceLoc loc)
{
    return symbols_.try_emplace(std::string(name), Entry{addr, loc}).second;
}

std::optional<isa::Address> SymbolTable::lookup(std::string_view name) const
{
    auto it = symbols_.find(std::string(name));
    if (it == symbols_.end())
        return std::nullopt;
    return it->second.addr;
}

support::SourceLoc SymbolTable::definedAt(std::string_view name) const
{
    auto it = symbols_.find(std::string(name));
    if (it == symbols_.end())
        return {};
    return it->second.loc;
}

} // namespace rexta::assembler
