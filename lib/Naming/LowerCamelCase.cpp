//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements identifier word segmentation and lowerCamelCase projection.
///
/// Segmentation works on UTF-8 code points. Lower-casing of non-ASCII code
/// points uses Unicode simple case folding; malformed UTF-8 bytes are copied
/// through unchanged.
///
//===----------------------------------------------------------------------===//

#include "domnaming/Naming/LowerCamelCase.h"

#include <cctype>
#include <cstddef>
#include <string>
#include <vector>

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/ConvertUTF.h"
#include "llvm/Support/Unicode.h"

namespace domnaming
{
namespace
{

enum class CharClass
{
    Separator,
    Lower,
    Upper,
    Digit,
    Caseless,
};

/// @brief One decoded code point, or one malformed byte.
struct CodePoint
{
    std::size_t offset{0};
    std::size_t length{1};
    llvm::UTF32 value{0};
    CharClass   cls{CharClass::Caseless};
};

CharClass classifyAscii(const char c)
{
    if (llvm::isDigit(c))
    {
        return CharClass::Digit;
    }
    if (std::islower(static_cast<unsigned char>(c)))
    {
        return CharClass::Lower;
    }
    if (std::isupper(static_cast<unsigned char>(c)))
    {
        return CharClass::Upper;
    }
    return CharClass::Separator;
}

llvm::UTF32 foldToLower(const llvm::UTF32 value)
{
    return static_cast<llvm::UTF32>(llvm::sys::unicode::foldCharSimple(static_cast<int>(value)));
}

std::vector<CodePoint> decodeCodePoints(const llvm::StringRef text)
{
    std::vector<CodePoint> out;
    out.reserve(text.size());

    const auto* const begin = reinterpret_cast<const llvm::UTF8*>(text.data());
    const auto* const end   = begin + text.size();
    const llvm::UTF8* cursor = begin;
    while (cursor < end)
    {
        CodePoint cp;
        cp.offset = static_cast<std::size_t>(cursor - begin);
        if (llvm::isASCII(static_cast<char>(*cursor)))
        {
            cp.value = *cursor;
            cp.cls   = classifyAscii(static_cast<char>(*cursor));
            ++cursor;
            out.push_back(cp);
            continue;
        }

        const llvm::UTF8* next = cursor;
        llvm::UTF32       value = 0;
        if (llvm::convertUTF8Sequence(&next, end, &value, llvm::strictConversion) == llvm::conversionOK &&
            next > cursor)
        {
            cp.length = static_cast<std::size_t>(next - cursor);
            cp.value  = value;
            cp.cls    = (foldToLower(value) != value) ? CharClass::Upper : CharClass::Lower;
            cursor    = next;
        }
        else
        {
            cp.value = *cursor;
            ++cursor;
        }
        out.push_back(cp);
    }
    return out;
}

bool isLetter(const CharClass cls)
{
    return cls == CharClass::Lower || cls == CharClass::Upper;
}

// `current` opens a new word when it follows `prev` inside a separator-free run.
bool startsWord(const CharClass prev, const CharClass current, const CharClass next)
{
    if (current == CharClass::Upper)
    {
        if (prev == CharClass::Lower)
        {
            return true;
        }
        if (prev == CharClass::Upper && next == CharClass::Lower)
        {
            return true;
        }
    }
    if (current == CharClass::Digit && isLetter(prev))
    {
        return true;
    }
    return isLetter(current) && prev == CharClass::Digit;
}

void appendCodePoint(std::string& out, const llvm::StringRef text, const CodePoint& cp, const bool capitalize)
{
    if (cp.length == 1 && cp.value < 0x80)
    {
        const char c = text[cp.offset];
        out.push_back(capitalize ? llvm::toUpper(c) : llvm::toLower(c));
        return;
    }
    // Case folding only maps towards lower case; non-ASCII word initials keep their form.
    if (cp.cls == CharClass::Upper && !capitalize)
    {
        char  buffer[UNI_MAX_UTF8_BYTES_PER_CODE_POINT];
        char* cursor = buffer;
        if (llvm::ConvertCodePointToUTF8(foldToLower(cp.value), cursor))
        {
            out.append(buffer, cursor);
            return;
        }
    }
    out.append(text.data() + cp.offset, cp.length);
}

}  // namespace

std::vector<llvm::StringRef> splitIdentifierWords(const llvm::StringRef name)
{
    std::vector<llvm::StringRef> words;

    const std::vector<CodePoint> cps = decodeCodePoints(name);

    std::size_t begin  = 0;
    bool        inWord = false;
    for (std::size_t i = 0; i < cps.size(); ++i)
    {
        const CharClass current = cps[i].cls;
        if (current == CharClass::Separator)
        {
            if (inWord)
            {
                words.push_back(name.slice(begin, cps[i].offset));
                inWord = false;
            }
            continue;
        }
        if (!inWord)
        {
            begin  = cps[i].offset;
            inWord = true;
            continue;
        }

        const CharClass prev = cps[i - 1].cls;
        const CharClass next = (i + 1 < cps.size()) ? cps[i + 1].cls : CharClass::Separator;
        if (startsWord(prev, current, next))
        {
            words.push_back(name.slice(begin, cps[i].offset));
            begin = cps[i].offset;
        }
    }
    if (inWord)
    {
        words.push_back(name.slice(begin, name.size()));
    }
    return words;
}

std::string toLowerCamelCase(const llvm::StringRef name)
{
    std::string out;
    out.reserve(name.size());

    bool firstWord = true;
    for (const llvm::StringRef word : splitIdentifierWords(name))
    {
        const std::vector<CodePoint> cps = decodeCodePoints(word);
        for (std::size_t i = 0; i < cps.size(); ++i)
        {
            appendCodePoint(out, word, cps[i], !firstWord && i == 0);
        }
        firstWord = false;
    }
    return out;
}

}  // namespace domnaming
