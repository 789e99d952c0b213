//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "TranslateTestSupport.h"
#include "tsbind/CodeGen/ConstructorResolver.h"
#include "tsbind/CodeGen/TypeEncoder.h"

bool runConstructorResolverTests()
{
    using namespace tsbind;
    using test::expectText;

    if (!expectText(resolveConstructorType("Foo", *makeClass({TypeField{"size", makeNumber()}})),
                    "(unit) => foo",
                    "default constructor"))
    {
        return false;
    }

    const TypeRef explicitClass = makeClass({
        TypeField{"constructor", makeFunction({TypeField{"name", makeString()}}, makeNamed("Foo"))},
        TypeField{"name", makeString()},
    });
    if (!expectText(resolveConstructorType("Foo", *explicitClass), "(string) => foo", "explicit constructor"))
    {
        return false;
    }
    if (!expectText(encodeType(*explicitClass), "{. \"name\": string}", "class type without constructor"))
    {
        return false;
    }

    const TypeRef overloaded = makeClass({
        TypeField{"constructor", makeFunction({TypeField{"a", makeNumber()}}, makeNamed("Foo"))},
        TypeField{"constructor", makeFunction({TypeField{"b", makeString()}}, makeNamed("Foo"))},
    });
    if (!expectText(resolveConstructorType("Foo", *overloaded), "(float) => foo", "first constructor wins"))
    {
        return false;
    }

    auto constructor = constructorTypeOf("Foo", *overloaded);
    if (!constructor)
    {
        std::cerr << "constructorTypeOf failed: " << llvm::toString(constructor.takeError()) << "\n";
        return false;
    }
    const auto* overloadedClass = std::get_if<ClassType>(&overloaded->value);
    if (*constructor != overloadedClass->fields.front().type)
    {
        std::cerr << "declared constructor type must be returned as-is\n";
        return false;
    }

    auto notAClass = resolveConstructorType("Foo", *makeObject({}));
    if (notAClass || !test::failsWithKind(notAClass.takeError(), TranslateErrorKind::InvalidConstructorTarget))
    {
        std::cerr << "constructor of a non-class type must fail\n";
        return false;
    }

    return true;
}
