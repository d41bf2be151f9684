//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Markup element and attribute name resolution for DOM serialization.
///
/// lowerCamelCase is the default convention for element and attribute names:
/// `Banana` becomes `<banana>`, `MyPlaylist` becomes `<myPlaylist>`,
/// `field_name` becomes `<fieldName>`, and the tuple field `0` becomes `<_0>`
/// because markup names cannot start with a digit.
///
//===----------------------------------------------------------------------===//
#ifndef DOMNAMING_NAMING_ELEMENT_NAME_H
#define DOMNAMING_NAMING_ELEMENT_NAME_H

#include <cstddef>
#include <optional>
#include <string>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

namespace domnaming
{

/// @brief Resolved markup name that either borrows caller text or owns a rewritten copy.
///
/// A borrowed name is a view into the string passed to `toElementName` or
/// `domKey` and is only valid while that storage is alive.
class ElementName final
{
public:
    /// @brief Creates a name that refers to existing text without copying it.
    /// @param[in] text Caller-owned text.
    /// @return Borrowed name.
    static ElementName borrowed(llvm::StringRef text);

    /// @brief Creates a name that owns its text.
    /// @param[in] text Rewritten text.
    /// @return Owned name.
    static ElementName owned(std::string text);

    /// @brief Returns true when the name aliases caller storage.
    [[nodiscard]] bool isBorrowed() const
    {
        return !owned_.has_value();
    }

    /// @brief Returns a view of the name text.
    [[nodiscard]] llvm::StringRef view() const
    {
        return owned_ ? llvm::StringRef(*owned_) : borrowed_;
    }

    /// @brief Returns a pointer to the name bytes; aliases caller storage when borrowed.
    [[nodiscard]] const char* data() const
    {
        return view().data();
    }

    /// @brief Returns the name length in bytes.
    [[nodiscard]] std::size_t size() const
    {
        return view().size();
    }

    /// @brief Returns true for an empty name.
    [[nodiscard]] bool empty() const
    {
        return view().empty();
    }

    /// @brief Copies the name into a standalone string.
    [[nodiscard]] std::string str() const
    {
        return view().str();
    }

    /// @brief Releases the name as a string, moving out owned storage when present.
    [[nodiscard]] std::string takeString() &&;

    /// @brief Converts implicitly to a view of the name text.
    operator llvm::StringRef() const
    {
        return view();
    }

private:
    ElementName() = default;

    llvm::StringRef            borrowed_;
    std::optional<std::string> owned_;
};

inline bool operator==(const ElementName& lhs, const ElementName& rhs)
{
    return lhs.view() == rhs.view();
}

inline bool operator!=(const ElementName& lhs, const ElementName& rhs)
{
    return !(lhs == rhs);
}

inline bool operator==(const ElementName& lhs, const llvm::StringRef rhs)
{
    return lhs.view() == rhs;
}

inline bool operator!=(const ElementName& lhs, const llvm::StringRef rhs)
{
    return !(lhs == rhs);
}

inline bool operator==(const llvm::StringRef lhs, const ElementName& rhs)
{
    return rhs == lhs;
}

inline bool operator!=(const llvm::StringRef lhs, const ElementName& rhs)
{
    return !(rhs == lhs);
}

inline llvm::raw_ostream& operator<<(llvm::raw_ostream& os, const ElementName& name)
{
    return os << name.view();
}

/// @brief Returns true when text begins with an ASCII digit `0`-`9`.
/// @param[in] name Candidate name.
/// @return False for empty text and for non-ASCII leading characters.
bool startsWithAsciiDigit(llvm::StringRef name);

/// @brief Converts an identifier to a valid markup element name in lowerCamelCase.
///
/// Names that start with an ASCII digit (tuple fields such as `0`) are prefixed
/// with an underscore and otherwise left untouched. All other names go through
/// the lowerCamelCase projection; when the projection leaves the text unchanged
/// the result borrows `name` instead of allocating.
///
/// @param[in] name Raw structure, variant or field identifier.
/// @return Markup-safe name that never starts with an ASCII digit.
ElementName toElementName(llvm::StringRef name);

/// @brief Computes the DOM key for a field.
///
/// An explicit rename (from a rename attribute or a rename-all convention
/// applied by the caller) is used verbatim. Otherwise the default convention
/// from `toElementName` applies to the raw field name.
///
/// @param[in] name Raw field identifier.
/// @param[in] rename Optional override text.
/// @return Borrowed `rename` when present, otherwise `toElementName(name)`.
ElementName domKey(llvm::StringRef name, std::optional<llvm::StringRef> rename);

/// @brief Renders the element name for a positional tuple field.
/// @param[in] index Zero-based field position.
/// @return `_<index>`.
std::string tupleFieldElementName(std::size_t index);

}  // namespace domnaming

#endif  // DOMNAMING_NAMING_ELEMENT_NAME_H
