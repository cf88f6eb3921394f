//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic helpers that accompany the Expected container:
// severity-to-string mapping, the error factory, and the single-diagnostic
// printer shared by the diagnostic engine and the command-line tool.
//
//===----------------------------------------------------------------------===//

#include "diag_expected.hpp"

namespace jsopt::support
{
namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
///
/// @details New severity enumerators should extend this switch to keep the
///          wording predictable across command-line tools.
///
/// @param severity Severity enumeration value to translate.
/// @return Null-terminated string naming the severity level.
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

/// @brief Build an error diagnostic with the provided origin and message.
///
/// @param origin Flag or input text that triggered the diagnostic, or empty.
/// @param msg Human-readable description of the problem.
/// @return Diagnostic populated with error severity and provided context.
Diag makeError(std::string origin, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), std::move(origin)};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When an origin is recorded the message is prefixed with
///          "<origin>:" in the usual compiler diagnostic style.  The function
///          always emits a trailing newline so multiple diagnostics appear as a
///          contiguous block.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
void printDiag(const Diag &diag, std::ostream &os)
{
    if (!diag.origin.empty())
    {
        os << diag.origin << ": ";
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace jsopt::support
