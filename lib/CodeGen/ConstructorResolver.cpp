//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements class constructor resolution.
///
//===----------------------------------------------------------------------===//

#include "tsbind/CodeGen/ConstructorResolver.h"

#include "tsbind/CodeGen/TranslateError.h"
#include "tsbind/CodeGen/TypeEncoder.h"

namespace tsbind
{

llvm::Expected<TypeRef> constructorTypeOf(llvm::StringRef className, const Type& type)
{
    const auto* classType = std::get_if<ClassType>(&type.value);
    if (classType == nullptr)
    {
        return makeTranslateError(TranslateErrorKind::InvalidConstructorTarget,
                                  "constructor requested for non-class type '" + className.str() + "'");
    }

    // Repeated constructor members are not merged; the first one is used.
    for (const TypeField& field : classType->fields)
    {
        if (field.name == kConstructorMemberName)
        {
            return field.type;
        }
    }
    return makeFunction({TypeField{"", makeUnit()}}, makeNamed(className.str()));
}

llvm::Expected<std::string> resolveConstructorType(llvm::StringRef className, const Type& type)
{
    auto constructor = constructorTypeOf(className, type);
    if (!constructor)
    {
        return constructor.takeError();
    }
    return encodeType(**constructor);
}

}  // namespace tsbind
