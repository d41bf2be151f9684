//===----------------------------------------------------------------------===//
///
/// @file
/// Implements source-location rendering helpers.
///
/// This file contains utility formatting logic for presenting file, line, and column coordinates.
///
//===----------------------------------------------------------------------===//

#include "domnaming/Support/SourceLocation.h"

#include <algorithm>
#include <sstream>

namespace domnaming
{

std::string SourceLocation::str() const
{
    std::ostringstream out;
    out << file << ':' << line << ':' << column;
    return out.str();
}

SourceLocation locationAtOffset(const llvm::StringRef file, const llvm::StringRef text, const std::size_t offset)
{
    SourceLocation location;
    location.file = file.str();

    const std::size_t end = std::min(offset, text.size());
    for (std::size_t i = 0; i < end; ++i)
    {
        if (text[i] == '\n')
        {
            ++location.line;
            location.column = 1;
        }
        else
        {
            ++location.column;
        }
    }
    return location;
}

}  // namespace domnaming
