//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Batch DOM key resolution and report rendering for the `domname` tool.
///
//===----------------------------------------------------------------------===//
#ifndef DOMNAMING_TOOL_KEY_REPORT_H
#define DOMNAMING_TOOL_KEY_REPORT_H

#include <string>
#include <vector>

#include "domnaming/Tool/RenameMap.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

namespace domnaming
{

/// @brief How a DOM key was obtained.
enum class KeySource
{
    /// @brief Explicit override from the rename map.
    Rename,

    /// @brief Default convention left the name as it was.
    Unchanged,

    /// @brief Default convention rewrote the name.
    Converted,
};

/// @brief Resolution result for one raw name.
struct KeyResolution final
{
    /// @brief Raw input name.
    std::string name;

    /// @brief Resolved DOM key.
    std::string key;

    /// @brief Origin of `key`.
    KeySource source{KeySource::Unchanged};
};

/// @brief Returns the report label of a key source (`rename`, `unchanged`, `converted`).
llvm::StringRef keySourceName(KeySource source);

/// @brief Resolves one raw name against a rename map.
/// @param[in] name Raw identifier.
/// @param[in] renames Explicit overrides.
/// @return Resolved key and its origin.
KeyResolution resolveKey(llvm::StringRef name, const RenameMap& renames);

/// @brief Resolves raw names in order.
std::vector<KeyResolution> resolveKeys(llvm::ArrayRef<std::string> names, const RenameMap& renames);

/// @brief Writes one `<name> -> <key>` line per resolution.
/// @param[in,out] os Output stream.
/// @param[in] resolutions Resolved keys.
void renderTextReport(llvm::raw_ostream& os, llvm::ArrayRef<KeyResolution> resolutions);

/// @brief Builds a JSON array of `{"name", "key", "source"}` objects.
/// @param[in] resolutions Resolved keys.
/// @return JSON report value.
llvm::json::Value renderJsonReport(llvm::ArrayRef<KeyResolution> resolutions);

}  // namespace domnaming

#endif  // DOMNAMING_TOOL_KEY_REPORT_H
