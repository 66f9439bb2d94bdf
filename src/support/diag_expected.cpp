//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers.  Assembler errors,
// image loading failures and tool I/O problems all travel as a single `Diag`
// inside an `Expected`, and are printed through `printDiag` so every tool
// reports in the same "<path>:<line>:<col>: error: <message>" shape.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies `Expected<void>`, severity names and the diagnostic printer.

#include "support/diag_expected.hpp"

namespace rexta::support
{

/// @brief Construct an Expected<void> that stores a diagnostic error state.
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Report whether the Expected<void> represents a successful outcome.
/// @return True if the instance holds no diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
/// @details Callers must check hasValue() first.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(SourceLoc loc, std::string msg, uint32_t code)
{
    return Diag{Severity::Error, std::move(msg), loc, code};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When the location names a registered file the message is prefixed
///          with "<path>:<line>:<column>:".  In-memory sources have no path;
///          for those a "line <n>:" prefix still points the reader at the
///          offending statement.  A trailing newline is always written.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
/// @param sm Optional source manager for mapping file identifiers to paths.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    bool wrotePath = false;
    if (sm && diag.loc.hasFile())
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            if (diag.loc.line != 0)
            {
                os << ':' << diag.loc.line;
                if (diag.loc.column != 0)
                    os << ':' << diag.loc.column;
            }
            os << ": ";
            wrotePath = true;
        }
    }
    if (!wrotePath && diag.loc.isValid())
    {
        os << "line " << diag.loc.line;
        if (diag.loc.column != 0)
            os << ':' << diag.loc.column;
        os << ": ";
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}

} // namespace rexta::support
