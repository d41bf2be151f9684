//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements batch DOM key resolution and text/JSON report rendering.
///
//===----------------------------------------------------------------------===//

#include "domnaming/Tool/KeyReport.h"

#include <optional>
#include <utility>

#include "domnaming/Naming/ElementName.h"

namespace domnaming
{
namespace
{

// json::Value requires UTF-8; raw names from the command line may not be.
std::string jsonText(const llvm::StringRef text)
{
    if (llvm::json::isUTF8(text))
    {
        return text.str();
    }
    return llvm::json::fixUTF8(text);
}

}  // namespace

llvm::StringRef keySourceName(const KeySource source)
{
    switch (source)
    {
    case KeySource::Rename:
        return "rename";
    case KeySource::Unchanged:
        return "unchanged";
    case KeySource::Converted:
        return "converted";
    }
    return "unchanged";
}

KeyResolution resolveKey(const llvm::StringRef name, const RenameMap& renames)
{
    const std::optional<llvm::StringRef> rename = renames.lookup(name);
    ElementName                          key    = domKey(name, rename);

    KeyResolution resolution;
    resolution.name = name.str();
    if (rename)
    {
        resolution.source = KeySource::Rename;
    }
    else
    {
        resolution.source = key.isBorrowed() ? KeySource::Unchanged : KeySource::Converted;
    }
    resolution.key = std::move(key).takeString();
    return resolution;
}

std::vector<KeyResolution> resolveKeys(const llvm::ArrayRef<std::string> names, const RenameMap& renames)
{
    std::vector<KeyResolution> out;
    out.reserve(names.size());
    for (const std::string& name : names)
    {
        out.push_back(resolveKey(name, renames));
    }
    return out;
}

void renderTextReport(llvm::raw_ostream& os, const llvm::ArrayRef<KeyResolution> resolutions)
{
    for (const KeyResolution& resolution : resolutions)
    {
        os << resolution.name << " -> " << resolution.key << "\n";
    }
}

llvm::json::Value renderJsonReport(const llvm::ArrayRef<KeyResolution> resolutions)
{
    llvm::json::Array rows;
    for (const KeyResolution& resolution : resolutions)
    {
        rows.push_back(llvm::json::Object{
            {"name", jsonText(resolution.name)},
            {"key", jsonText(resolution.key)},
            {"source", keySourceName(resolution.source)},
        });
    }
    return llvm::json::Value(std::move(rows));
}

}  // namespace domnaming
