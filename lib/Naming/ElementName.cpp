//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements markup name resolution on top of the lowerCamelCase projection.
///
/// The conversion compares the projected text with the input so that names
/// already in the default convention are returned without allocating.
///
//===----------------------------------------------------------------------===//

#include "domnaming/Naming/ElementName.h"

#include <string>
#include <utility>

#include "domnaming/Naming/LowerCamelCase.h"
#include "llvm/ADT/StringExtras.h"

namespace domnaming
{

ElementName ElementName::borrowed(const llvm::StringRef text)
{
    ElementName name;
    name.borrowed_ = text;
    return name;
}

ElementName ElementName::owned(std::string text)
{
    ElementName name;
    name.owned_ = std::move(text);
    return name;
}

std::string ElementName::takeString() &&
{
    if (owned_)
    {
        return std::move(*owned_);
    }
    return borrowed_.str();
}

bool startsWithAsciiDigit(const llvm::StringRef name)
{
    return !name.empty() && llvm::isDigit(name.front());
}

ElementName toElementName(const llvm::StringRef name)
{
    // Tuple fields: prefix only, no case projection.
    if (startsWithAsciiDigit(name))
    {
        return ElementName::owned("_" + name.str());
    }

    std::string converted = toLowerCamelCase(name);
    // Stripped leading separators can expose a digit (`_0` -> `0`).
    if (startsWithAsciiDigit(converted))
    {
        converted.insert(converted.begin(), '_');
    }
    if (llvm::StringRef(converted) == name)
    {
        return ElementName::borrowed(name);
    }
    return ElementName::owned(std::move(converted));
}

ElementName domKey(const llvm::StringRef name, const std::optional<llvm::StringRef> rename)
{
    if (rename)
    {
        return ElementName::borrowed(*rename);
    }
    return toElementName(name);
}

std::string tupleFieldElementName(const std::size_t index)
{
    return "_" + std::to_string(index);
}

}  // namespace domnaming
