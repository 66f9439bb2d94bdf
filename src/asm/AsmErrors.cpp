// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.

#include "asm/AsmErrors.hpp"

namespace rexta::assembler
{

support::Diag makeAsmError(AsmErrc errc, support::SourceLoc loc, std::string message)
{
    return support::makeError(loc, std::move(message), static_cast<uint32_t>(errc));
}

AsmErrc asmErrcOf(const support::Diag &diag)
{
    switch (diag.code)
    {
        case static_cast<uint32_t>(AsmErrc::UnknownMnemonic):
            return AsmErrc::UnknownMnemonic;
        case static_cast<uint32_t>(AsmErrc::InvalidRegister):
            return AsmErrc::InvalidRegister;
        case static_cast<uint32_t>(AsmErrc::ValueOutOfRange):
            return AsmErrc::ValueOutOfRange;
        case static_cast<uint32_t>(AsmErrc::UndefinedLabel):
            return AsmErrc::UndefinedLabel;
        case static_cast<uint32_t>(AsmErrc::DuplicateLabel):
            return AsmErrc::DuplicateLabel;
        case static_cast<uint32_t>(AsmErrc::MalformedOperand):
            return AsmErrc::MalformedOperand;
    }
    return AsmErrc::None;
}

} // namespace rexta::assembler
