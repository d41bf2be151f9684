//===----------------------------------------------------------------------===//
///
/// @file
/// Source location primitives for configuration inputs and diagnostics.
///
//===----------------------------------------------------------------------===//
#ifndef DOMNAMING_SUPPORT_SOURCE_LOCATION_H
#define DOMNAMING_SUPPORT_SOURCE_LOCATION_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "llvm/ADT/StringRef.h"

namespace domnaming
{

/// @brief Identifies a concrete position in an input file.
struct SourceLocation
{
    /// @brief Path to the input file, or a label such as `<command line>`.
    std::string file;

    /// @brief 1-based line.
    std::uint32_t line{1};

    /// @brief 1-based column.
    std::uint32_t column{1};

    /// @brief Formats this location as a human-readable string.
    /// @return Formatted location text.
    [[nodiscard]] std::string str() const;
};

/// @brief Computes the line and column of a byte offset within text.
/// @param[in] file File label stored in the result.
/// @param[in] text Full input text.
/// @param[in] offset Byte offset into `text`; clamped to its size.
/// @return Location of the offset.
SourceLocation locationAtOffset(llvm::StringRef file, llvm::StringRef text, std::size_t offset);

}  // namespace domnaming

#endif  // DOMNAMING_SUPPORT_SOURCE_LOCATION_H
