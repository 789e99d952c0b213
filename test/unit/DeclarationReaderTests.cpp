//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "tsbind/Frontend/DeclarationReader.h"
#include "tsbind/Model/TreePrinter.h"
#include "tsbind/Support/Diagnostics.h"
#include "llvm/Support/Error.h"

namespace
{

bool expectRejected(const char* text, const std::string& expectedPath, const char* what)
{
    tsbind::DiagnosticEngine diagnostics;
    auto                     root = tsbind::parseDeclarationTree(text, "in.json", diagnostics);
    if (root)
    {
        std::cerr << what << ": malformed tree was accepted\n";
        return false;
    }
    llvm::consumeError(root.takeError());
    if (!diagnostics.hasErrors())
    {
        std::cerr << what << ": no error diagnostic reported\n";
        return false;
    }
    const auto& location = diagnostics.diagnostics().front().location;
    if (location.str() != "in.json:" + expectedPath)
    {
        std::cerr << what << ": error located at " << location.str() << ", expected in.json:" << expectedPath << "\n";
        return false;
    }
    return true;
}

}  // namespace

bool runDeclarationReaderTests()
{
    const char* const moduleText = R"({
      "kind": "module",
      "name": "\"left-pad\"",
      "statements": [
        {"kind": "var", "name": "version", "type": {"kind": "string"}},
        {"kind": "func", "name": "pad", "type": {
          "kind": "function",
          "params": [
            {"name": "s", "type": {"kind": "union", "members": [{"kind": "string"}, {"kind": "number"}]}},
            {"name": "fill", "type": {"kind": "optional", "type": {"kind": "string"}}}
          ],
          "returns": {"kind": "string"}
        }},
        {"kind": "type", "name": "Table", "type": {"kind": "dict", "value": {"kind": "array", "element": {"kind": "regex"}}}},
        {"kind": "class", "name": "Pad", "type": {"kind": "class", "fields": [
          {"name": "width", "type": {"kind": "named", "name": "Width"}}
        ]}},
        {"kind": "exports", "type": {"kind": "tuple", "members": [{"kind": "boolean"}, {"kind": "null"}]}},
        {"kind": "namespace", "name": "ignored"}
      ]
    })";

    tsbind::DiagnosticEngine diagnostics;
    auto                     root = tsbind::parseDeclarationTree(moduleText, "left-pad.json", diagnostics);
    if (!root)
    {
        std::cerr << "valid declaration tree rejected: " << llvm::toString(root.takeError()) << "\n";
        for (const auto& d : diagnostics.diagnostics())
        {
            std::cerr << "  " << d.location.str() << ": " << d.message << "\n";
        }
        return false;
    }

    const std::string expectedTree =
        "module \"left-pad\" {\n"
        "  var version: string\n"
        "  func pad: function(s: union(string | number), fill: optional<string>) -> string\n"
        "  type Table = dict<array<regex>>\n"
        "  class Pad: class {width: named Width}\n"
        "  exports tuple(boolean, null)\n"
        "  unknown\n"
        "}\n";
    const std::string printed = tsbind::printDeclaration(**root);
    if (printed != expectedTree)
    {
        std::cerr << "declaration tree mismatch:\n" << printed;
        return false;
    }

    if (diagnostics.hasErrors() || diagnostics.diagnostics().size() != 1 ||
        diagnostics.diagnostics().front().level != tsbind::DiagnosticLevel::Warning ||
        diagnostics.diagnostics().front().location.str() != "left-pad.json:$.statements[5]")
    {
        std::cerr << "unrecognized declaration kind must produce one located warning\n";
        return false;
    }

    if (!expectRejected("{\"kind\": \"module\"", "$", "truncated JSON") ||
        !expectRejected("[]", "$", "non-object root") ||
        !expectRejected(R"({"kind": "module", "name": "m", "statements": [{"kind": "var", "name": "x"}]})",
                        "$.statements[0].type",
                        "missing type member") ||
        !expectRejected(R"({"kind": "type", "name": "t", "type": {"kind": "union", "members": []}})",
                        "$.type.members",
                        "empty union") ||
        !expectRejected(R"({"kind": "type", "name": "t", "type": {"kind": "array", "element": {"kind": "bigint"}}})",
                        "$.type.element.kind",
                        "unknown type kind") ||
        !expectRejected(R"({"kind": "func", "name": "f", "type": {"kind": "function", "params": [{"name": 3}],
                            "returns": {"kind": "unit"}}})",
                        "$.type.params[0].name",
                        "non-string parameter name") ||
        !expectRejected(R"({"kind": "class", "name": "C", "type": {"kind": "object", "fields": []}})",
                        "$.type",
                        "class declaration over an object") ||
        !expectRejected(R"({"name": "m"})", "$.kind", "missing kind"))
    {
        return false;
    }

    tsbind::DiagnosticEngine missingFile;
    auto                     absent = tsbind::loadDeclarationFile("/nonexistent/tsbind/input.json", missingFile);
    if (absent || !missingFile.hasErrors())
    {
        if (!absent)
        {
            llvm::consumeError(absent.takeError());
        }
        std::cerr << "reading a missing file must fail with a diagnostic\n";
        return false;
    }
    llvm::consumeError(absent.takeError());

    return true;
}
