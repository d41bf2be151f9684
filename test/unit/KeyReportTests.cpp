//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <vector>

#include "domnaming/Tool/KeyReport.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

bool runKeyReportTests()
{
    using domnaming::KeySource;

    domnaming::RenameMap renames;
    renames.set("field_name", "custom");

    const std::vector<std::string> names       = {"MyPlaylist", "myPlaylist", "field_name", "0"};
    const auto                     resolutions = domnaming::resolveKeys(names, renames);
    if (resolutions.size() != 4)
    {
        std::cerr << "expected one resolution per name\n";
        return false;
    }
    if (resolutions[0].key != "myPlaylist" || resolutions[0].source != KeySource::Converted)
    {
        std::cerr << "converted resolution mismatch\n";
        return false;
    }
    if (resolutions[1].key != "myPlaylist" || resolutions[1].source != KeySource::Unchanged)
    {
        std::cerr << "unchanged resolution mismatch\n";
        return false;
    }
    if (resolutions[2].key != "custom" || resolutions[2].source != KeySource::Rename ||
        resolutions[2].name != "field_name")
    {
        std::cerr << "rename resolution mismatch\n";
        return false;
    }
    if (resolutions[3].key != "_0" || resolutions[3].source != KeySource::Converted)
    {
        std::cerr << "tuple field resolution mismatch\n";
        return false;
    }

    std::string              text;
    llvm::raw_string_ostream os(text);
    domnaming::renderTextReport(os, resolutions);
    os.flush();
    if (text != "MyPlaylist -> myPlaylist\nmyPlaylist -> myPlaylist\nfield_name -> custom\n0 -> _0\n")
    {
        std::cerr << "text report mismatch:\n" << text;
        return false;
    }

    const llvm::json::Value report = domnaming::renderJsonReport(resolutions);
    const auto*             rows   = report.getAsArray();
    if (!rows || rows->size() != 4)
    {
        std::cerr << "JSON report must be an array with one row per name\n";
        return false;
    }
    const auto* row = (*rows)[2].getAsObject();
    if (!row)
    {
        std::cerr << "JSON report rows must be objects\n";
        return false;
    }
    const auto name   = row->getString("name");
    const auto key    = row->getString("key");
    const auto source = row->getString("source");
    if (!name || *name != "field_name" || !key || *key != "custom" || !source || *source != "rename")
    {
        std::cerr << "JSON report row mismatch\n";
        return false;
    }

    if (domnaming::keySourceName(KeySource::Unchanged) != "unchanged" ||
        domnaming::keySourceName(KeySource::Converted) != "converted")
    {
        std::cerr << "key source label mismatch\n";
        return false;
    }

    return true;
}
