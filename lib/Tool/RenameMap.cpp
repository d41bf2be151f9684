//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements rename-map storage, JSON loading, and inline assignment parsing.
///
//===----------------------------------------------------------------------===//

#include "domnaming/Tool/RenameMap.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "domnaming/Naming/ElementName.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/ConvertUTF.h"
#include "llvm/Support/JSON.h"

namespace domnaming
{
namespace
{

std::size_t skipWhitespace(const llvm::StringRef text, std::size_t pos)
{
    while (pos < text.size() && llvm::isSpace(text[pos]))
    {
        ++pos;
    }
    return pos;
}

std::optional<unsigned> parseHex4(const llvm::StringRef text, const std::size_t pos)
{
    unsigned value = 0;
    if (pos + 4 > text.size() || text.substr(pos, 4).getAsInteger(16, value))
    {
        return std::nullopt;
    }
    return value;
}

/// @brief Decodes the JSON string literal whose opening quote is at `pos`.
/// @param[in] text Full JSON text.
/// @param[in] pos Offset of the opening quote.
/// @param[out] decoded Unescaped literal contents.
/// @return Offset just past the closing quote, or `npos` for a malformed literal.
std::size_t readStringLiteral(const llvm::StringRef text, std::size_t pos, std::string& decoded)
{
    decoded.clear();
    for (++pos; pos < text.size(); ++pos)
    {
        const char c = text[pos];
        if (c == '"')
        {
            return pos + 1;
        }
        if (c != '\\')
        {
            decoded.push_back(c);
            continue;
        }
        if (++pos >= text.size())
        {
            break;
        }
        switch (text[pos])
        {
        case 'b':
            decoded.push_back('\b');
            break;
        case 'f':
            decoded.push_back('\f');
            break;
        case 'n':
            decoded.push_back('\n');
            break;
        case 'r':
            decoded.push_back('\r');
            break;
        case 't':
            decoded.push_back('\t');
            break;
        case 'u': {
            auto codePoint = parseHex4(text, pos + 1);
            if (!codePoint)
            {
                return llvm::StringRef::npos;
            }
            pos += 4;
            // High surrogate followed by an escaped low surrogate.
            if (*codePoint >= 0xD800 && *codePoint < 0xDC00 && text.substr(pos + 1, 2) == "\\u")
            {
                const auto low = parseHex4(text, pos + 3);
                if (low && *low >= 0xDC00 && *low < 0xE000)
                {
                    codePoint = 0x10000 + ((*codePoint - 0xD800) << 10) + (*low - 0xDC00);
                    pos += 6;
                }
            }
            char  buffer[UNI_MAX_UTF8_BYTES_PER_CODE_POINT];
            char* cursor = buffer;
            if (llvm::ConvertCodePointToUTF8(*codePoint, cursor))
            {
                decoded.append(buffer, cursor);
            }
            break;
        }
        default:
            decoded.push_back(text[pos]);
            break;
        }
    }
    return llvm::StringRef::npos;
}

/// @brief Finds where a member key of the top-level object is written.
///
/// Only string literals in key position (after `{` or `,` at object depth one
/// and followed by `:`) are matched, so values and nested content never count.
/// Falls back to the opening brace of the object.
SourceLocation locateMember(const llvm::StringRef sourceName, const llvm::StringRef text, const llvm::StringRef key)
{
    std::size_t objectStart = 0;
    int         depth       = 0;
    char        lastToken   = '\0';
    std::string literal;
    for (std::size_t pos = 0; pos < text.size();)
    {
        const char c = text[pos];
        if (c == '"')
        {
            const std::size_t end = readStringLiteral(text, pos, literal);
            if (end == llvm::StringRef::npos)
            {
                break;
            }
            const bool keyPosition = depth == 1 && (lastToken == '{' || lastToken == ',');
            const std::size_t after = skipWhitespace(text, end);
            if (keyPosition && after < text.size() && text[after] == ':' && literal == key)
            {
                return locationAtOffset(sourceName, text, pos);
            }
            lastToken = '"';
            pos       = end;
            continue;
        }
        if (c == '{' || c == '[')
        {
            if (depth == 0 && c == '{')
            {
                objectStart = pos;
            }
            ++depth;
        }
        else if (c == '}' || c == ']')
        {
            --depth;
        }
        if (!llvm::isSpace(c))
        {
            lastToken = c;
        }
        ++pos;
    }
    return locationAtOffset(sourceName, text, objectStart);
}

void checkOverride(const llvm::StringRef sourceName,
                   const llvm::StringRef text,
                   const llvm::StringRef name,
                   const llvm::StringRef rename,
                   DiagnosticEngine&     diagnostics)
{
    if (rename.empty())
    {
        diagnostics.warning(locateMember(sourceName, text, name), "rename for '" + name.str() + "' is empty");
        return;
    }
    if (startsWithAsciiDigit(rename))
    {
        diagnostics.warning(locateMember(sourceName, text, name),
                            "rename '" + rename.str() + "' for '" + name.str() +
                                "' starts with a digit and is not a valid markup name");
    }
}

}  // namespace

void RenameMap::set(const llvm::StringRef name, const llvm::StringRef rename)
{
    entries_[name] = rename.str();
}

std::optional<llvm::StringRef> RenameMap::lookup(const llvm::StringRef name) const
{
    const auto it = entries_.find(name);
    if (it == entries_.end())
    {
        return std::nullopt;
    }
    return llvm::StringRef(it->second);
}

void RenameMap::merge(const RenameMap& other)
{
    for (const auto& entry : other.entries_)
    {
        set(entry.getKey(), entry.getValue());
    }
}

llvm::Expected<RenameMap> parseRenameMap(const llvm::StringRef jsonText,
                                         const llvm::StringRef sourceName,
                                         DiagnosticEngine&     diagnostics)
{
    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(jsonText);
    if (!parsed)
    {
        const std::string detail = llvm::toString(parsed.takeError());
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "invalid rename map JSON: %s",
                                       detail.c_str());
    }

    const auto* root = parsed->getAsObject();
    if (!root)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "rename map must be a JSON object");
    }

    // json::Object iteration order is unspecified; sort for stable diagnostics.
    std::vector<std::string> names;
    names.reserve(root->size());
    for (const auto& member : *root)
    {
        names.push_back(llvm::StringRef(member.first).str());
    }
    std::sort(names.begin(), names.end());

    RenameMap map;
    for (const std::string& name : names)
    {
        const auto rename = root->getString(name);
        if (!rename)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "rename for '%s' must be a string",
                                           name.c_str());
        }
        checkOverride(sourceName, jsonText, name, *rename, diagnostics);
        map.set(name, *rename);
    }
    return map;
}

llvm::Expected<RenameMap> loadRenameMapFile(const std::string& path, DiagnosticEngine& diagnostics)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.good())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "failed to read rename map '%s'", path.c_str());
    }
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parseRenameMap(text, path, diagnostics);
}

llvm::Error parseRenameAssignment(const llvm::StringRef assignment, RenameMap& map)
{
    const auto separator = assignment.find('=');
    if (separator == llvm::StringRef::npos)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "rename '%s' must have the form <name>=<override>",
                                       assignment.str().c_str());
    }
    const llvm::StringRef name = assignment.take_front(separator);
    if (name.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "rename '%s' has an empty name",
                                       assignment.str().c_str());
    }
    map.set(name, assignment.drop_front(separator + 1));
    return llvm::Error::success();
}

}  // namespace domnaming
