//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Word segmentation and lowerCamelCase projection for identifier text.
///
/// Words are split on ASCII separators, lower-to-upper case humps, acronym
/// tails (`XMLHttp` -> `XML`, `Http`) and letter/digit transitions. Text is
/// decoded as UTF-8; a non-ASCII code point counts as upper-case when Unicode
/// simple case folding changes it, and as lower-case word content otherwise.
///
//===----------------------------------------------------------------------===//
#ifndef DOMNAMING_NAMING_LOWER_CAMEL_CASE_H
#define DOMNAMING_NAMING_LOWER_CAMEL_CASE_H

#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"

namespace domnaming
{

/// @brief Splits identifier text into words.
/// @param[in] name Source text.
/// @return Views into `name`, one per word, separators excluded.
std::vector<llvm::StringRef> splitIdentifierWords(llvm::StringRef name);

/// @brief Projects text into lowerCamelCase.
/// @param[in] name Source text.
/// @return First word lower-cased, following words capitalized, no separators.
std::string toLowerCamelCase(llvm::StringRef name);

}  // namespace domnaming

#endif  // DOMNAMING_NAMING_LOWER_CAMEL_CASE_H
