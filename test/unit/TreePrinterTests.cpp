//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "tsbind/Model/TreePrinter.h"

bool runTreePrinterTests()
{
    using namespace tsbind;

    const TypeRef callback =
        makeFunction({TypeField{"a", makeOptional(makeNumber())}}, makeUnion({makeString(), makeNamed("Foo")}));
    if (printType(*callback) != "function(a: optional<number>) -> union(string | named Foo)")
    {
        std::cerr << "function type print mismatch: " << printType(*callback) << "\n";
        return false;
    }
    if (printType(*makeObject({})) != "object {}" || printType(*makeAny()) != "any")
    {
        std::cerr << "object/primitive print mismatch\n";
        return false;
    }

    const DeclRef tree = makeModuleDecl(
        "outer",
        {makeVarDecl("x", makeNumber()), makeModuleDecl("inner", {makeUnknownDecl()}), makeExportsDecl(makeUnit())});
    const std::string expected = "module outer {\n"
                                 "  var x: number\n"
                                 "  module inner {\n"
                                 "    unknown\n"
                                 "  }\n"
                                 "  exports unit\n"
                                 "}\n";
    if (printDeclaration(*tree) != expected)
    {
        std::cerr << "nested module print mismatch:\n" << printDeclaration(*tree);
        return false;
    }

    return true;
}
