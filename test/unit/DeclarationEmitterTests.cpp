//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "TranslateTestSupport.h"
#include "tsbind/CodeGen/DeclarationEmitter.h"
#include "tsbind/CodeGen/ReasonRender.h"

bool runDeclarationEmitterTests()
{
    using namespace tsbind;
    using test::expectText;

    if (!expectText(emitDeclaration(*makeVarDecl("version", makeString()), "\"left-pad\""),
                    "[@bs.module \"left_pad\"] external version: string = \"version\";",
                    "variable binding"))
    {
        return false;
    }

    const TypeRef padType =
        makeFunction({TypeField{"s", makeString()}, TypeField{"n", makeNumber()}}, makeString());
    if (!expectText(emitDeclaration(*makeFuncDecl("pad", padType), "left-pad"),
                    "[@bs.module \"left_pad\"] external pad: (string, float) => string = \"pad\";",
                    "function binding"))
    {
        return false;
    }
    if (!expectText(emitDeclaration(*makeFuncDecl("'to-string'", makeString()), "m"),
                    "[@bs.module \"m\"] external to_string: string = \"to_string\";",
                    "quoted binding name"))
    {
        return false;
    }

    if (!expectText(emitDeclaration(*makeExportsDecl(makeFunction({TypeField{"s", makeString()}}, makeString())),
                                    "\"left-pad\""),
                    "[@bs.module] external left_pad: (string) => string = \"left_pad\";",
                    "default export binding"))
    {
        return false;
    }

    if (!expectText(emitDeclaration(*makeTypeDecl("Id", makeNumber()), "m"), "", "type declaration body"))
    {
        return false;
    }
    if (!expectText(emitDeclaration(*makeUnknownDecl(), "m"), kUnknownDeclarationMarker, "unknown declaration"))
    {
        return false;
    }

    const DeclRef greeter = makeClassDecl(
        "Greeter",
        makeClass({
            TypeField{"constructor", makeFunction({TypeField{"name", makeString()}}, makeNamed("Greeter"))},
            TypeField{"greet", makeFunction({}, makeString())},
            TypeField{"name", makeString()},
        }));
    if (!expectText(emitDeclaration(*greeter, "greeter"),
                    "type greeter = {. [@bs.meth] \"greet\": unit => string, \"name\": string};\n"
                    "[@bs.new] [@bs.module \"greeter\"] external makeGreeter: (string) => greeter = \"Greeter\";",
                    "class declaration"))
    {
        return false;
    }
    if (!expectText(emitDeclaration(*makeClassDecl("Empty", makeClass({})), "m"),
                    "type empty = {.};\n[@bs.new] [@bs.module \"m\"] external makeEmpty: (unit) => empty = \"Empty\";",
                    "class with default constructor"))
    {
        return false;
    }

    const DeclRef nested = makeModuleDecl("inner-mod", {makeVarDecl("x", makeNumber())});
    if (!expectText(emitDeclaration(*nested, "outer"),
                    "module Inner_mod = {\n  [@bs.module \"inner_mod\"] external x: float = \"x\";\n};",
                    "nested module"))
    {
        return false;
    }
    if (!expectText(emitDeclaration(*makeModuleDecl("empty", {}), "outer"), "module Empty = {};", "empty module"))
    {
        return false;
    }

    auto invalidClass = emitDeclaration(*makeClassDecl("Bad", makeObject({})), "m");
    if (invalidClass ||
        !test::failsWithKind(invalidClass.takeError(), TranslateErrorKind::InvalidConstructorTarget))
    {
        std::cerr << "class declaration over a non-class type must fail\n";
        return false;
    }

    return true;
}
