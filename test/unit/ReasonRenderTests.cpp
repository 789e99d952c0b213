//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <vector>

#include "tsbind/CodeGen/ReasonRender.h"

bool runReasonRenderTests()
{
    using namespace tsbind;

    const std::string module =
        renderModuleDeclaration("\"my-mod\"", {"type t = {.};\nlet x = 1;", "", "module Inner = {\n  let y = 2;\n};"});
    const std::string expectedModule = "module My_mod = {\n"
                                       "  type t = {.};\n"
                                       "  let x = 1;\n"
                                       "  module Inner = {\n"
                                       "    let y = 2;\n"
                                       "  };\n"
                                       "};";
    if (module != expectedModule)
    {
        std::cerr << "module wrapper must indent children and skip empty ones:\n" << module << "\n";
        return false;
    }

    if (renderObjectType({EncodedField{"'quoted'", "float"}, EncodedField{"plain", "string"}}) !=
        "{. \"quoted\": float, \"plain\": string}")
    {
        std::cerr << "object labels must be quoted exactly once\n";
        return false;
    }

    if (renderObjectType({EncodedField{"a\"b", "float"}, EncodedField{"back\\slash", "string"}}) !=
        "{. \"a\\\"b\": float, \"back\\\\slash\": string}")
    {
        std::cerr << "object labels must escape embedded quotes and backslashes\n";
        return false;
    }

    if (renderClassType({EncodedClassMember{"run", "unit => unit", true}}) != "{. [@bs.meth] \"run\": unit => unit}")
    {
        std::cerr << "class method annotation mismatch\n";
        return false;
    }

    if (renderTupleType({"float"}) != "(float)")
    {
        std::cerr << "single-member tuple mismatch\n";
        return false;
    }

    if (renderFunctionType({EncodedField{"cb", "unit => unit"}}, false, "unit") != "(unit => unit) => unit")
    {
        std::cerr << "plain function layout mismatch\n";
        return false;
    }
    if (renderFunctionType({EncodedField{"opts", "string=?"}}, true, "float") != "(~opts: string=?, unit) => float")
    {
        std::cerr << "labeled function layout mismatch\n";
        return false;
    }

    if (renderVariableDeclaration("main", "pkg", "float", true) != "[@bs.module] external main: float = \"pkg\";")
    {
        std::cerr << "default export layout mismatch\n";
        return false;
    }

    if (renderUnionAlias("a_or_b", {UnionVariant{"A", "a"}, UnionVariant{"B", "b"}}) !=
        "type a_or_b =\n  | A(a)\n  | B(b);")
    {
        std::cerr << "union alias layout mismatch\n";
        return false;
    }

    return true;
}
