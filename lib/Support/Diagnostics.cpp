//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic collection and formatting helpers.
///
//===----------------------------------------------------------------------===//

#include "domnaming/Support/Diagnostics.h"

#include <utility>

namespace domnaming
{

void DiagnosticEngine::report(const DiagnosticLevel level, const SourceLocation& location, std::string message)
{
    diagnostics_.push_back(Diagnostic{level, location, std::move(message)});
}

void DiagnosticEngine::note(const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Note, location, std::move(message));
}

void DiagnosticEngine::warning(const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Warning, location, std::move(message));
}

void DiagnosticEngine::error(const SourceLocation& location, std::string message)
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

llvm::StringRef diagnosticLevelName(const DiagnosticLevel level)
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

void printDiagnostics(llvm::raw_ostream& os, const DiagnosticEngine& diagnostics)
{
    for (const auto& d : diagnostics.diagnostics())
    {
        os << d.location.str() << ": " << diagnosticLevelName(d.level) << ": " << d.message << "\n";
    }
}

}  // namespace domnaming
