//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "TranslateTestSupport.h"
#include "tsbind/CodeGen/ReasonRender.h"
#include "tsbind/CodeGen/TypeEncoder.h"

bool runTypeEncoderTests()
{
    using namespace tsbind;
    using test::expectText;

    if (!expectText(encodeType(*makeNumber()), "float", "number encoding") ||
        !expectText(encodeType(*makeString()), "string", "string encoding") ||
        !expectText(encodeType(*makeBoolean()), "bool", "boolean encoding") ||
        !expectText(encodeType(*makeUnit()), "unit", "unit encoding") ||
        !expectText(encodeType(*makeNull()), "Js.Types.null_val", "null encoding") ||
        !expectText(encodeType(*makeAny()), "'any", "any encoding") ||
        !expectText(encodeType(*makeRegex()), "Js.Re.t", "regex encoding"))
    {
        return false;
    }
    if (!expectText(encodeType(*makeUnknown()), kUntranslatableTypeMarker, "unknown encoding"))
    {
        return false;
    }

    if (!expectText(encodeType(*makeDict(makeNumber())), "Js.Dict.t(float)", "dict encoding") ||
        !expectText(encodeType(*makeArray(makeArray(makeString()))), "array(array(string))", "array encoding") ||
        !expectText(encodeType(*makeTuple({makeNumber(), makeString()})), "(float, string)", "tuple encoding"))
    {
        return false;
    }

    const TypeRef object = makeObject({TypeField{"a", makeNumber()}, TypeField{"b-c", makeOptional(makeString())}});
    if (!expectText(encodeType(*object), "{. \"a\": float, \"b-c\": string=?}", "object encoding") ||
        !expectText(encodeType(*makeObject({})), "{.}", "empty object encoding"))
    {
        return false;
    }

    const TypeRef plain = makeFunction({TypeField{"x", makeNumber()}, TypeField{"y", makeString()}}, makeBoolean());
    if (!expectText(encodeType(*plain), "(float, string) => bool", "plain function encoding") ||
        !expectText(encodeType(*makeFunction({}, makeUnit())), "unit => unit", "nullary function encoding"))
    {
        return false;
    }

    const auto* plainFunction = std::get_if<FunctionType>(&plain->value);
    if (plainFunction == nullptr || hasOptionalParam(*plainFunction))
    {
        std::cerr << "function without optional parameters reported as optional\n";
        return false;
    }

    const TypeRef labeled =
        makeFunction({TypeField{"a", makeNumber()}, TypeField{"b-opt", makeOptional(makeString())}}, makeUnit());
    const auto* labeledFunction = std::get_if<FunctionType>(&labeled->value);
    if (labeledFunction == nullptr || !hasOptionalParam(*labeledFunction))
    {
        std::cerr << "function with an optional parameter not detected\n";
        return false;
    }
    if (!expectText(encodeType(*labeled), "(~a: float, ~b_opt: string=?, unit) => unit", "labeled function encoding"))
    {
        return false;
    }

    const TypeRef classType = makeClass({
        TypeField{"constructor", makeFunction({TypeField{"name", makeString()}}, makeNamed("Greeter"))},
        TypeField{"name", makeString()},
        TypeField{"greet", makeFunction({}, makeString())},
    });
    if (!expectText(encodeType(*classType),
                    "{. \"name\": string, [@bs.meth] \"greet\": unit => string}",
                    "class encoding"))
    {
        return false;
    }

    if (!expectText(encodeType(*makeNamed("HTMLElement")), "hTMLElement", "named encoding") ||
        !expectText(encodeType(*makeUnion({makeNumber(), makeNamed("Foo")})), "number_or_foo", "union reference") ||
        !expectText(encodeType(*makeOptional(makeNumber())), "float=?", "optional encoding"))
    {
        return false;
    }

    auto unionOfClass = encodeType(*makeArray(makeUnion({makeClass({}), makeNumber()})));
    if (unionOfClass || !test::failsWithKind(unionOfClass.takeError(), TranslateErrorKind::UnnameableType))
    {
        std::cerr << "a union over a class type must fail to encode\n";
        return false;
    }

    return true;
}
