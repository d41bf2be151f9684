//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Command-line option model for the `domname` tool.
///
//===----------------------------------------------------------------------===//
#ifndef DOMNAMING_TOOL_TOOL_OPTIONS_H
#define DOMNAMING_TOOL_TOOL_OPTIONS_H

#include <string>
#include <vector>

#include "domnaming/Tool/RenameMap.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace domnaming
{

/// @brief Report format written to stdout.
enum class ReportFormat
{
    /// @brief `<name> -> <key>` lines.
    Text,

    /// @brief JSON array of resolution objects.
    Json,
};

/// @brief Parsed `domname` invocation.
struct ToolOptions final
{
    /// @brief Raw names given as positional arguments.
    std::vector<std::string> names;

    /// @brief Inline `--rename` overrides; these win over `renameMapPath` entries.
    RenameMap inlineRenames;

    /// @brief Optional JSON rename map path.
    std::string renameMapPath;

    /// @brief Output format.
    ReportFormat format{ReportFormat::Text};

    /// @brief Reads additional names from stdin, one per line.
    bool readStdin{false};

    /// @brief Logs each resolution decision to stderr.
    bool verbose{false};

    bool helpRequested{false};

    bool versionRequested{false};
};

/// @brief Parses command-line arguments, excluding the program name.
/// @param[in] args Argument tokens.
/// @return Parsed options, or an error for unknown options, missing values,
///         unsupported formats, or malformed rename assignments.
llvm::Expected<ToolOptions> parseToolOptions(llvm::ArrayRef<std::string> args);

}  // namespace domnaming

#endif  // DOMNAMING_TOOL_TOOL_OPTIONS_H
