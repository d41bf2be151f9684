//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `domname` command-line tool.
///
/// The tool resolves raw identifiers to DOM element/attribute keys using the
/// default lowerCamelCase convention and optional explicit renames, and prints
/// a text or JSON report.
///
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "domnaming/Support/Diagnostics.h"
#include "domnaming/Tool/KeyReport.h"
#include "domnaming/Tool/RenameMap.h"
#include "domnaming/Tool/ToolOptions.h"
#include "domnaming/Version.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: domname [options] <name>... | domname --stdin [options]\n"
                 << "Try: domname --help\n";
}

/// @brief Prints the full help text.
void printHelp()
{
    llvm::errs() << "NAME\n"
                 << "  domname - resolve identifiers to DOM element and attribute names\n\n"
                 << "SYNOPSIS\n"
                 << "  domname [options] <name>...\n"
                 << "  domname --stdin [options]\n\n"
                 << "DESCRIPTION\n"
                 << "  Each name is converted to lowerCamelCase. Names starting with a digit (tuple\n"
                 << "  fields) are prefixed with '_' instead. An explicit rename replaces the\n"
                 << "  converted name verbatim.\n\n"
                 << "OPTIONS\n"
                 << "  --rename <name>=<override>\n"
                 << "      Explicit rename for one name. Repeatable; wins over --rename-map.\n"
                 << "  --rename-map <file>\n"
                 << "      JSON object mapping raw names to overrides.\n"
                 << "  --format <text|json>\n"
                 << "      Report format (default: text).\n"
                 << "  --stdin\n"
                 << "      Read additional names from stdin, one per line.\n"
                 << "  --verbose\n"
                 << "      Log each resolution decision to stderr.\n"
                 << "  --version, -V\n"
                 << "      Print the tool version.\n"
                 << "  --help, -h\n"
                 << "      Print this help text.\n\n"
                 << "EXAMPLES\n"
                 << "  domname MyPlaylist field_name 0\n"
                 << "  domname --rename field_name=custom --format json field_name other_field\n\n"
                 << "EXIT STATUS\n"
                 << "  0 on success, non-zero on invalid CLI usage or rename map errors.\n";
}

/// @brief Appends non-empty stdin lines to the name list.
///
/// @param[in,out] names Destination list.
void readNamesFromStdin(std::vector<std::string>& names)
{
    std::string line;
    while (std::getline(std::cin, line))
    {
        const llvm::StringRef trimmed = llvm::StringRef(line).trim();
        if (!trimmed.empty())
        {
            names.push_back(trimmed.str());
        }
    }
}

}  // namespace

/// @brief Program entry point for `domname`.
///
/// @param[in] argc Argument count.
/// @param[in] argv Argument vector.
/// @return Zero on success, non-zero on CLI or rename map failure.
int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        args.emplace_back(argv[i]);
    }

    auto parsed = domnaming::parseToolOptions(args);
    if (!parsed)
    {
        llvm::errs() << "[domname] " << llvm::toString(parsed.takeError()) << "\n";
        printUsage();
        return 1;
    }
    domnaming::ToolOptions options = std::move(*parsed);

    if (options.helpRequested)
    {
        printHelp();
        return 0;
    }
    if (options.versionRequested)
    {
        llvm::outs() << "domname " << domnaming::kVersionString << "\n";
        return 0;
    }

    if (options.readStdin)
    {
        readNamesFromStdin(options.names);
    }
    else if (options.names.empty())
    {
        llvm::errs() << "[domname] no names given\n";
        printUsage();
        return 1;
    }

    domnaming::DiagnosticEngine diagnostics;
    domnaming::RenameMap        renames;
    if (!options.renameMapPath.empty())
    {
        auto loaded = domnaming::loadRenameMapFile(options.renameMapPath, diagnostics);
        if (!loaded)
        {
            domnaming::printDiagnostics(llvm::errs(), diagnostics);
            llvm::errs() << "[domname] " << llvm::toString(loaded.takeError()) << "\n";
            return 1;
        }
        renames = std::move(*loaded);
        if (options.verbose)
        {
            llvm::errs() << "[domname] loaded " << renames.size() << " rename(s) from " << options.renameMapPath
                         << "\n";
        }
    }
    renames.merge(options.inlineRenames);
    domnaming::printDiagnostics(llvm::errs(), diagnostics);

    const std::vector<domnaming::KeyResolution> resolutions = domnaming::resolveKeys(options.names, renames);
    if (options.verbose)
    {
        for (const auto& resolution : resolutions)
        {
            llvm::errs() << "[domname] " << domnaming::keySourceName(resolution.source) << " '" << resolution.name
                         << "' -> '" << resolution.key << "'\n";
        }
    }

    if (options.format == domnaming::ReportFormat::Json)
    {
        llvm::outs() << llvm::formatv("{0:2}", domnaming::renderJsonReport(resolutions)) << "\n";
    }
    else
    {
        domnaming::renderTextReport(llvm::outs(), resolutions);
    }
    return 0;
}
