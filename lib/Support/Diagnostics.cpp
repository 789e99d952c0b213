//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic collection helpers.
///
/// The diagnostic engine records tree-located notes, warnings, and errors consumed by the CLI.
///
//===----------------------------------------------------------------------===//

#include "tsbind/Support/Diagnostics.h"

#include <utility>

namespace tsbind
{

void DiagnosticEngine::report(DiagnosticLevel level, const TreeLocation& location, std::string message)
{
    diagnostics_.push_back(Diagnostic{level, location, std::move(message)});
}

void DiagnosticEngine::note(const TreeLocation& location, std::string message)
{
    report(DiagnosticLevel::Note, location, std::move(message));
}

void DiagnosticEngine::warning(const TreeLocation& location, std::string message)
{
    report(DiagnosticLevel::Warning, location, std::move(message));
}

void DiagnosticEngine::error(const TreeLocation& location, std::string message)
{
    report(DiagnosticLevel::Error, location, std::move(message));
}

bool DiagnosticEngine::hasErrors() const
{
    for (const Diagnostic& d : diagnostics_)
    {
        if (d.level == DiagnosticLevel::Error)
        {
            return true;
        }
    }
    return false;
}

const char* diagnosticLevelName(const DiagnosticLevel level)
{
    switch (level)
    {
    case DiagnosticLevel::Note:
        return "note";
    case DiagnosticLevel::Warning:
        return "warning";
    case DiagnosticLevel::Error:
        return "error";
    }
    return "note";
}

}  // namespace tsbind
