//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <vector>

#include "TranslateTestSupport.h"
#include "tsbind/CodeGen/Precode.h"

namespace
{

const char* const kNumberOrString = "type number_or_string =\n  | Number(float)\n  | String(string);";
const char* const kBoolOrNull     = "type bool_or_null =\n  | Bool(bool)\n  | Null(Js.Types.null_val);";

}  // namespace

bool runPrecodeTests()
{
    using namespace tsbind;
    using test::expectText;

    const TranslateOptions defaults;
    TranslateOptions       hoisting;
    hoisting.hoistReturnTypeUnions = true;

    const DeclRef returnsUnion =
        makeFuncDecl("f",
                     makeFunction({TypeField{"x", makeUnion({makeNumber(), makeString()})}},
                                  makeUnion({makeBoolean(), makeNull()})));
    if (!expectText(renderPrecode(*returnsUnion, defaults), kNumberOrString, "parameter-only union hoisting"))
    {
        return false;
    }
    if (!expectText(renderPrecode(*returnsUnion, hoisting),
                    std::string(kNumberOrString) + "\n" + kBoolOrNull,
                    "return union hoisting"))
    {
        return false;
    }

    const DeclRef repeated = makeModuleDecl("m",
                                            {
                                                makeVarDecl("a", makeUnion({makeNumber(), makeString()})),
                                                makeVarDecl("b", makeArray(makeUnion({makeBoolean(), makeNull()}))),
                                                makeVarDecl("c", makeUnion({makeNumber(), makeString()})),
                                            });
    auto collected = collectDeclarationPrecode(*repeated, defaults);
    if (!collected)
    {
        std::cerr << "module precode collection failed: " << llvm::toString(collected.takeError()) << "\n";
        return false;
    }
    if (collected->size() != 3)
    {
        std::cerr << "raw precode collection must keep duplicates, got " << collected->size() << "\n";
        return false;
    }
    if (!expectText(renderPrecode(*repeated, defaults),
                    std::string(kNumberOrString) + "\n" + kBoolOrNull,
                    "deduplicated module precode"))
    {
        return false;
    }

    const DeclRef alias = makeTypeDecl("Shape", makeUnion({makeNamed("Circle"), makeNamed("Square")}));
    if (!expectText(renderPrecode(*alias, defaults),
                    "type shape = circle_or_square;\ntype circle_or_square =\n  | Circle(circle)\n  | Square(square);",
                    "type alias precode"))
    {
        return false;
    }
    if (!expectText(renderPrecode(*makeTypeDecl("Count", makeNumber()), defaults),
                    "type count = float;",
                    "plain type alias precode"))
    {
        return false;
    }

    const TypeRef containers = makeObject({
        TypeField{"a", makeArray(makeUnion({makeNumber(), makeString()}))},
        TypeField{"b", makeDict(makeOptional(makeUnion({makeBoolean(), makeNull()})))},
    });
    auto containerAliases = collectTypePrecode(*containers, defaults);
    if (!containerAliases || *containerAliases != std::vector<std::string>{kNumberOrString, kBoolOrNull})
    {
        if (!containerAliases)
        {
            llvm::consumeError(containerAliases.takeError());
        }
        std::cerr << "object/array/dict/optional traversal mismatch\n";
        return false;
    }

    const TypeRef nestedUnion = makeUnion({makeNumber(), makeArray(makeUnion({makeString(), makeBoolean()}))});
    auto          outerOnly   = collectTypePrecode(*nestedUnion, defaults);
    if (!outerOnly || outerOnly->size() != 1)
    {
        if (!outerOnly)
        {
            llvm::consumeError(outerOnly.takeError());
        }
        std::cerr << "union members must not be scanned for further unions\n";
        return false;
    }

    const TypeRef tupled = makeTuple({makeUnion({makeNumber(), makeString()})});
    auto          none   = collectTypePrecode(*tupled, defaults);
    if (!none || !none->empty())
    {
        if (!none)
        {
            llvm::consumeError(none.takeError());
        }
        std::cerr << "tuple members must not be scanned\n";
        return false;
    }

    const DeclRef classDecl = makeClassDecl(
        "Client",
        makeClass({TypeField{"constructor",
                             makeFunction({TypeField{"endpoint", makeUnion({makeString(), makeNumber()})}},
                                          makeNamed("Client"))}}));
    if (!expectText(renderPrecode(*classDecl, defaults),
                    "type string_or_number =\n  | String(string)\n  | Number(float);",
                    "constructor parameter precode"))
    {
        return false;
    }

    if (!expectText(renderPrecode(*makeUnknownDecl(), defaults), "", "unknown declaration precode"))
    {
        return false;
    }

    auto failing = renderPrecode(*makeVarDecl("v", makeUnion({makeClass({}), makeNumber()})), defaults);
    if (failing || !test::failsWithKind(failing.takeError(), TranslateErrorKind::UnnameableType))
    {
        std::cerr << "precode over a union of a class must fail\n";
        return false;
    }

    return true;
}
