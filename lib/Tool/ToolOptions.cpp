//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `domname` command-line parsing.
///
//===----------------------------------------------------------------------===//

#include "domnaming/Tool/ToolOptions.h"

#include <cstddef>
#include <utility>

namespace domnaming
{
namespace
{

bool isHelpToken(const llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

bool isVersionToken(const llvm::StringRef arg)
{
    return arg == "--version" || arg == "-V";
}

llvm::Error missingValue(const llvm::StringRef option)
{
    return llvm::createStringError(llvm::inconvertibleErrorCode(), "missing value for %s", option.str().c_str());
}

llvm::Expected<ReportFormat> parseReportFormat(const llvm::StringRef value)
{
    if (value == "text")
    {
        return ReportFormat::Text;
    }
    if (value == "json")
    {
        return ReportFormat::Json;
    }
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "unsupported --format '%s' (expected text or json)",
                                   value.str().c_str());
}

}  // namespace

llvm::Expected<ToolOptions> parseToolOptions(const llvm::ArrayRef<std::string> args)
{
    ToolOptions options;
    bool        optionsEnded = false;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const llvm::StringRef arg(args[i]);
        if (optionsEnded || arg.empty() || arg.front() != '-' || arg == "-")
        {
            options.names.push_back(args[i]);
            continue;
        }

        if (arg == "--")
        {
            optionsEnded = true;
        }
        else if (isHelpToken(arg))
        {
            options.helpRequested = true;
        }
        else if (isVersionToken(arg))
        {
            options.versionRequested = true;
        }
        else if (arg == "--stdin")
        {
            options.readStdin = true;
        }
        else if (arg == "--verbose")
        {
            options.verbose = true;
        }
        else if (arg == "--rename")
        {
            if (i + 1 >= args.size())
            {
                return missingValue(arg);
            }
            if (llvm::Error err = parseRenameAssignment(args[++i], options.inlineRenames))
            {
                return std::move(err);
            }
        }
        else if (arg == "--rename-map")
        {
            if (i + 1 >= args.size())
            {
                return missingValue(arg);
            }
            options.renameMapPath = args[++i];
        }
        else if (arg == "--format")
        {
            if (i + 1 >= args.size())
            {
                return missingValue(arg);
            }
            auto format = parseReportFormat(args[++i]);
            if (!format)
            {
                return format.takeError();
            }
            options.format = *format;
        }
        else
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(), "unknown option: %s", arg.str().c_str());
        }
    }
    return options;
}

}  // namespace domnaming
