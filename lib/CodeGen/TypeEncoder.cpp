//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements ReasonML type encoding.
///
//===----------------------------------------------------------------------===//

#include "tsbind/CodeGen/TypeEncoder.h"

#include <type_traits>
#include <utility>
#include <vector>

#include "tsbind/CodeGen/ConstructorResolver.h"
#include "tsbind/CodeGen/NamingPolicy.h"
#include "tsbind/CodeGen/ReasonRender.h"
#include "tsbind/CodeGen/TypeNaming.h"

namespace tsbind
{
namespace
{

std::string primitiveSpelling(const PrimitiveKind kind)
{
    switch (kind)
    {
    case PrimitiveKind::Number:
        return "float";
    case PrimitiveKind::String:
        return "string";
    case PrimitiveKind::Boolean:
        return "bool";
    case PrimitiveKind::Unit:
        return "unit";
    case PrimitiveKind::Null:
        return "Js.Types.null_val";
    case PrimitiveKind::Any:
        return "'any";
    case PrimitiveKind::Unknown:
        return kUntranslatableTypeMarker;
    case PrimitiveKind::Regex:
        return "Js.Re.t";
    }
    return kUntranslatableTypeMarker;
}

llvm::Expected<std::string> wrapped(const char* head, const Type& inner)
{
    auto encoded = encodeType(inner);
    if (!encoded)
    {
        return encoded.takeError();
    }
    return std::string(head) + "(" + *encoded + ")";
}

llvm::Expected<std::vector<EncodedField>> encodeFields(const std::vector<TypeField>& fields)
{
    std::vector<EncodedField> out;
    out.reserve(fields.size());
    for (const TypeField& field : fields)
    {
        auto encoded = encodeType(*field.type);
        if (!encoded)
        {
            return encoded.takeError();
        }
        out.push_back(EncodedField{field.name, std::move(*encoded)});
    }
    return out;
}

llvm::Expected<std::string> encodeClass(const ClassType& node)
{
    std::vector<EncodedClassMember> members;
    members.reserve(node.fields.size());
    for (const TypeField& field : node.fields)
    {
        if (field.name == kConstructorMemberName)
        {
            continue;
        }
        auto encoded = encodeType(*field.type);
        if (!encoded)
        {
            return encoded.takeError();
        }
        const bool isMethod = std::holds_alternative<FunctionType>(field.type->value);
        members.push_back(EncodedClassMember{field.name, std::move(*encoded), isMethod});
    }
    return renderClassType(members);
}

}  // namespace

bool hasOptionalParam(const FunctionType& function)
{
    for (const TypeField& param : function.params)
    {
        if (param.type->isOptional())
        {
            return true;
        }
    }
    return false;
}

llvm::Expected<std::string> encodeType(const Type& type)
{
    return std::visit(
        [&type](const auto& node) -> llvm::Expected<std::string> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, PrimitiveType>)
            {
                return primitiveSpelling(node.kind);
            }
            else if constexpr (std::is_same_v<T, DictType>)
            {
                return wrapped("Js.Dict.t", *node.value);
            }
            else if constexpr (std::is_same_v<T, ArrayType>)
            {
                return wrapped("array", *node.element);
            }
            else if constexpr (std::is_same_v<T, TupleType>)
            {
                std::vector<std::string> members;
                members.reserve(node.members.size());
                for (const TypeRef& member : node.members)
                {
                    auto encoded = encodeType(*member);
                    if (!encoded)
                    {
                        return encoded.takeError();
                    }
                    members.push_back(std::move(*encoded));
                }
                return renderTupleType(members);
            }
            else if constexpr (std::is_same_v<T, ObjectType>)
            {
                auto fields = encodeFields(node.fields);
                if (!fields)
                {
                    return fields.takeError();
                }
                return renderObjectType(*fields);
            }
            else if constexpr (std::is_same_v<T, ClassType>)
            {
                return encodeClass(node);
            }
            else if constexpr (std::is_same_v<T, FunctionType>)
            {
                auto params = encodeFields(node.params);
                if (!params)
                {
                    return params.takeError();
                }
                auto returns = encodeType(*node.returns);
                if (!returns)
                {
                    return returns.takeError();
                }
                return renderFunctionType(*params, hasOptionalParam(node), *returns);
            }
            else if constexpr (std::is_same_v<T, NamedType>)
            {
                return lowercaseFirst(node.name);
            }
            else if constexpr (std::is_same_v<T, UnionType>)
            {
                return typeName(type);
            }
            else if constexpr (std::is_same_v<T, OptionalType>)
            {
                auto encoded = encodeType(*node.type);
                if (!encoded)
                {
                    return encoded.takeError();
                }
                return renderOptionalType(*encoded);
            }
            else
            {
                static_assert(kUnhandledAlternative<T>, "unhandled type alternative");
            }
        },
        type.value);
}

}  // namespace tsbind
