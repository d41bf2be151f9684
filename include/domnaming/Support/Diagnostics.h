//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations for diagnostic reporting used by rename-map loading and the command-line tool.
///
//===----------------------------------------------------------------------===//
#ifndef DOMNAMING_SUPPORT_DIAGNOSTICS_H
#define DOMNAMING_SUPPORT_DIAGNOSTICS_H

#include "domnaming/Support/SourceLocation.h"

#include <string>
#include <vector>

#include "llvm/Support/raw_ostream.h"

namespace domnaming
{

/// @brief Severity level for a diagnostic message.
enum class DiagnosticLevel
{

    /// @brief Informational note.
    Note,

    /// @brief Non-fatal warning.
    Warning,

    /// @brief Fatal error.
    Error,
};

/// @brief Single diagnostic record.
struct Diagnostic
{
    /// @brief Severity level.
    DiagnosticLevel level;

    /// @brief Source location associated with the message.
    SourceLocation location;

    /// @brief Human-readable message text.
    std::string message;
};

/// @brief Accumulates diagnostics in insertion order.
class DiagnosticEngine final
{
public:
    /// @brief Appends a diagnostic entry.
    /// @param[in] level Severity level.
    /// @param[in] location Source location associated with the message.
    /// @param[in] message Human-readable message text.
    void report(DiagnosticLevel level, const SourceLocation& location, std::string message);

    /// @brief Emits a note-level diagnostic.
    void note(const SourceLocation& location, std::string message);

    /// @brief Emits a warning-level diagnostic.
    void warning(const SourceLocation& location, std::string message);

    /// @brief Emits an error-level diagnostic.
    void error(const SourceLocation& location, std::string message);

    /// @brief Indicates whether any error diagnostics were recorded.
    /// @return True when at least one error exists.
    [[nodiscard]] bool hasErrors() const;

    /// @brief Returns all recorded diagnostics in insertion order.
    /// @return Immutable diagnostic list.
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const
    {
        return diagnostics_;
    }

private:
    /// @brief Backing storage for collected diagnostics.
    std::vector<Diagnostic> diagnostics_;
};

/// @brief Returns the lower-case label of a diagnostic level (`note`, `warning`, `error`).
llvm::StringRef diagnosticLevelName(DiagnosticLevel level);

/// @brief Writes diagnostics as `<file>:<line>:<col>: <level>: <message>` lines.
/// @param[in,out] os Output stream.
/// @param[in] diagnostics Diagnostic engine containing accumulated diagnostics.
void printDiagnostics(llvm::raw_ostream& os, const DiagnosticEngine& diagnostics);

}  // namespace domnaming

#endif  // DOMNAMING_SUPPORT_DIAGNOSTICS_H
