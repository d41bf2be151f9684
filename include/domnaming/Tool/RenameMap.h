//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Explicit rename overrides keyed by raw identifier.
///
/// A rename map is loaded from a JSON object whose members map raw names to
/// override text, e.g. `{"field_name": "custom"}`, or built from inline
/// `name=override` assignments. Overrides are used verbatim by `domKey`.
///
//===----------------------------------------------------------------------===//
#ifndef DOMNAMING_TOOL_RENAME_MAP_H
#define DOMNAMING_TOOL_RENAME_MAP_H

#include <cstddef>
#include <optional>
#include <string>

#include "domnaming/Support/Diagnostics.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace domnaming
{

/// @brief Mapping from raw identifiers to explicit override names.
class RenameMap final
{
public:
    /// @brief Inserts or replaces the override for one name.
    /// @param[in] name Raw identifier.
    /// @param[in] rename Override text.
    void set(llvm::StringRef name, llvm::StringRef rename);

    /// @brief Looks up the override for one name.
    /// @param[in] name Raw identifier.
    /// @return View of the stored override, valid while the map is alive and unmodified.
    [[nodiscard]] std::optional<llvm::StringRef> lookup(llvm::StringRef name) const;

    [[nodiscard]] std::size_t size() const
    {
        return entries_.size();
    }

    [[nodiscard]] bool empty() const
    {
        return entries_.empty();
    }

    /// @brief Copies every entry of `other` into this map, replacing existing overrides.
    /// @param[in] other Map whose entries take precedence.
    void merge(const RenameMap& other);

private:
    llvm::StringMap<std::string> entries_;
};

/// @brief Parses a rename map from JSON text.
///
/// Overrides that are empty or start with an ASCII digit are kept but reported
/// as warnings, since they do not form valid markup names.
///
/// @param[in] jsonText JSON document.
/// @param[in] sourceName Label used for diagnostic locations.
/// @param[in,out] diagnostics Sink for warnings about suspicious overrides.
/// @return Parsed map, or an error for malformed input.
llvm::Expected<RenameMap> parseRenameMap(llvm::StringRef jsonText, llvm::StringRef sourceName,
                                         DiagnosticEngine& diagnostics);

/// @brief Reads and parses a rename map file.
/// @param[in] path File path.
/// @param[in,out] diagnostics Sink for warnings about suspicious overrides.
/// @return Parsed map, or an error when the file is unreadable or malformed.
llvm::Expected<RenameMap> loadRenameMapFile(const std::string& path, DiagnosticEngine& diagnostics);

/// @brief Parses one inline `name=override` assignment into a map.
/// @param[in] assignment Assignment text; the first `=` separates name from override.
/// @param[in,out] map Destination map.
/// @return Error when the `=` is missing or the name is empty.
llvm::Error parseRenameAssignment(llvm::StringRef assignment, RenameMap& map);

}  // namespace domnaming

#endif  // DOMNAMING_TOOL_RENAME_MAP_H
