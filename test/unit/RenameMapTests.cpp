//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

#include "domnaming/Support/Diagnostics.h"
#include "domnaming/Tool/RenameMap.h"
#include "llvm/Support/Error.h"

namespace
{

bool expectParseError(const std::string& text, const std::string& expectedMessage)
{
    domnaming::DiagnosticEngine diagnostics;
    auto                        map = domnaming::parseRenameMap(text, "renames.json", diagnostics);
    if (map)
    {
        std::cerr << "rename map parse unexpectedly succeeded for: " << text << "\n";
        return false;
    }
    const std::string message = llvm::toString(map.takeError());
    if (message.rfind(expectedMessage, 0) != 0)
    {
        std::cerr << "unexpected rename map error: " << message << "\n";
        return false;
    }
    return true;
}

}  // namespace

bool runRenameMapTests()
{
    {
        domnaming::DiagnosticEngine diagnostics;
        auto map = domnaming::parseRenameMap(R"({"field_name": "custom", "MyType": "my-type"})", "renames.json",
                                             diagnostics);
        if (!map)
        {
            llvm::consumeError(map.takeError());
            std::cerr << "valid rename map failed to parse\n";
            return false;
        }
        const auto custom = map->lookup("field_name");
        const auto myType = map->lookup("MyType");
        if (map->size() != 2 || !custom || *custom != "custom" || !myType || *myType != "my-type")
        {
            std::cerr << "rename map entries mismatch\n";
            return false;
        }
        if (map->lookup("other").has_value() || !diagnostics.diagnostics().empty())
        {
            std::cerr << "rename map reported unexpected entries or diagnostics\n";
            return false;
        }
    }

    if (!expectParseError("{not json", "invalid rename map JSON") ||
        !expectParseError(R"(["a", "b"])", "rename map must be a JSON object") ||
        !expectParseError(R"({"a": 1})", "rename for 'a' must be a string"))
    {
        return false;
    }

    {
        domnaming::DiagnosticEngine diagnostics;
        auto map = domnaming::parseRenameMap("{\n  \"b\": \"9lives\",\n  \"a\": \"\"\n}", "renames.json", diagnostics);
        if (!map)
        {
            llvm::consumeError(map.takeError());
            std::cerr << "rename map with suspicious overrides should still parse\n";
            return false;
        }
        const auto& diags = diagnostics.diagnostics();
        if (diags.size() != 2 || diagnostics.hasErrors())
        {
            std::cerr << "expected two warnings for suspicious overrides\n";
            return false;
        }
        if (diags[0].level != domnaming::DiagnosticLevel::Warning || diags[0].location.line != 3 ||
            diags[0].location.column != 3 || diags[0].message != "rename for 'a' is empty")
        {
            std::cerr << "empty override warning mismatch: " << diags[0].location.str() << " " << diags[0].message
                      << "\n";
            return false;
        }
        if (diags[1].location.line != 2 || diags[1].location.file != "renames.json" ||
            diags[1].message != "rename '9lives' for 'b' starts with a digit and is not a valid markup name")
        {
            std::cerr << "digit override warning mismatch: " << diags[1].location.str() << " " << diags[1].message
                      << "\n";
            return false;
        }
        const auto nineLives = map->lookup("b");
        if (!nineLives || *nineLives != "9lives")
        {
            std::cerr << "suspicious override must be kept verbatim\n";
            return false;
        }
    }

    {
        // A value equal to a later key must not be reported as that key.
        domnaming::DiagnosticEngine diagnostics;
        auto map = domnaming::parseRenameMap("{\"point_x\": \"x\",\n \"x\": \"\"}", "renames.json", diagnostics);
        if (!map)
        {
            llvm::consumeError(map.takeError());
            std::cerr << "rename map with repeated text failed to parse\n";
            return false;
        }
        const auto& diags = diagnostics.diagnostics();
        if (diags.size() != 1 || diags[0].location.line != 2 || diags[0].location.column != 2)
        {
            std::cerr << "empty override warning must point at the member key\n";
            return false;
        }
    }

    {
        // Escaped keys are matched by their decoded text.
        domnaming::DiagnosticEngine diagnostics;
        auto map = domnaming::parseRenameMap("{\n  \"caf\\u00e9\": \"1st\"\n}", "renames.json", diagnostics);
        if (!map)
        {
            llvm::consumeError(map.takeError());
            std::cerr << "rename map with escaped key failed to parse\n";
            return false;
        }
        const auto& diags = diagnostics.diagnostics();
        if (diags.size() != 1 || diags[0].location.line != 2 || diags[0].location.column != 3 ||
            !map->lookup("caf\xC3\xA9").has_value())
        {
            std::cerr << "escaped key warning must point at the member key\n";
            return false;
        }
    }

    {
        domnaming::RenameMap map;
        if (llvm::Error err = domnaming::parseRenameAssignment("a=b=c", map))
        {
            llvm::consumeError(std::move(err));
            std::cerr << "valid rename assignment rejected\n";
            return false;
        }
        if (llvm::Error err = domnaming::parseRenameAssignment("empty=", map))
        {
            llvm::consumeError(std::move(err));
            std::cerr << "rename assignment with empty override rejected\n";
            return false;
        }
        const auto abc   = map.lookup("a");
        const auto empty = map.lookup("empty");
        if (!abc || *abc != "b=c" || !empty || !empty->empty())
        {
            std::cerr << "rename assignment must split on the first '='\n";
            return false;
        }

        llvm::Error missing = domnaming::parseRenameAssignment("novalue", map);
        if (!missing)
        {
            std::cerr << "rename assignment without '=' must fail\n";
            return false;
        }
        llvm::consumeError(std::move(missing));

        llvm::Error unnamed = domnaming::parseRenameAssignment("=x", map);
        if (!unnamed)
        {
            std::cerr << "rename assignment with empty name must fail\n";
            return false;
        }
        llvm::consumeError(std::move(unnamed));
    }

    {
        domnaming::RenameMap base;
        base.set("a", "fromFile");
        base.set("b", "keep");
        domnaming::RenameMap inlineRenames;
        inlineRenames.set("a", "fromCli");
        base.merge(inlineRenames);
        const auto a = base.lookup("a");
        const auto b = base.lookup("b");
        if (base.size() != 2 || !a || *a != "fromCli" || !b || *b != "keep")
        {
            std::cerr << "merged renames must prefer the merged-in entries\n";
            return false;
        }
    }

    {
        domnaming::DiagnosticEngine diagnostics;
        auto missing = domnaming::loadRenameMapFile("/nonexistent/domnaming/renames.json", diagnostics);
        if (missing)
        {
            std::cerr << "loading a missing rename map must fail\n";
            return false;
        }
        const std::string message = llvm::toString(missing.takeError());
        if (message.rfind("failed to read rename map", 0) != 0)
        {
            std::cerr << "unexpected missing-file error: " << message << "\n";
            return false;
        }

        std::error_code             ec;
        const std::filesystem::path path = std::filesystem::temp_directory_path(ec) / "domnaming-rename-map-test.json";
        if (ec)
        {
            std::cerr << "temporary directory unavailable\n";
            return false;
        }
        {
            std::ofstream out(path, std::ios::binary);
            out << R"({"point_x": "x"})";
        }
        auto loaded = domnaming::loadRenameMapFile(path.string(), diagnostics);
        std::filesystem::remove(path, ec);
        if (!loaded)
        {
            llvm::consumeError(loaded.takeError());
            std::cerr << "rename map file failed to load\n";
            return false;
        }
        const auto x = loaded->lookup("point_x");
        if (!x || *x != "x")
        {
            std::cerr << "rename map file entries mismatch\n";
            return false;
        }
    }

    return true;
}
