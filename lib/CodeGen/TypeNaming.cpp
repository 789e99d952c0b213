//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements shape-derived type naming.
///
//===----------------------------------------------------------------------===//

#include "tsbind/CodeGen/TypeNaming.h"

#include <cstddef>
#include <type_traits>
#include <vector>

#include "tsbind/CodeGen/NamingPolicy.h"
#include "tsbind/CodeGen/TranslateError.h"

namespace tsbind
{
namespace
{

const char* primitiveName(const PrimitiveKind kind)
{
    switch (kind)
    {
    case PrimitiveKind::Number:
        return "number";
    case PrimitiveKind::String:
        return "string";
    case PrimitiveKind::Boolean:
        return "bool";
    case PrimitiveKind::Unit:
        return "unit";
    case PrimitiveKind::Null:
        return "null";
    case PrimitiveKind::Any:
        return "any";
    case PrimitiveKind::Unknown:
        return "unknown";
    case PrimitiveKind::Regex:
        return "regex";
    }
    return "unknown";
}

llvm::Expected<std::string> joinNames(const std::vector<TypeRef>& members, const char* separator)
{
    std::string out;
    for (std::size_t i = 0; i < members.size(); ++i)
    {
        auto name = typeName(*members[i]);
        if (!name)
        {
            return name.takeError();
        }
        if (i > 0)
        {
            out += separator;
        }
        out += *name;
    }
    return out;
}

llvm::Expected<std::string> prefixed(const char* prefix, const Type& inner)
{
    auto name = typeName(inner);
    if (!name)
    {
        return name.takeError();
    }
    return prefix + *name;
}

}  // namespace

llvm::Expected<std::string> typeName(const Type& type)
{
    return std::visit(
        [](const auto& node) -> llvm::Expected<std::string> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, PrimitiveType>)
            {
                return std::string(primitiveName(node.kind));
            }
            else if constexpr (std::is_same_v<T, DictType>)
            {
                return prefixed("dict_", *node.value);
            }
            else if constexpr (std::is_same_v<T, ArrayType>)
            {
                return prefixed("array_", *node.element);
            }
            else if constexpr (std::is_same_v<T, TupleType>)
            {
                auto members = joinNames(node.members, "_");
                if (!members)
                {
                    return members.takeError();
                }
                return "tuple_of_" + *members;
            }
            else if constexpr (std::is_same_v<T, ObjectType>)
            {
                return std::string("object");
            }
            else if constexpr (std::is_same_v<T, ClassType>)
            {
                return makeTranslateError(TranslateErrorKind::UnnameableType,
                                          "class types have no structural name; reference them through their "
                                          "declaration");
            }
            else if constexpr (std::is_same_v<T, FunctionType>)
            {
                return std::string("func");
            }
            else if constexpr (std::is_same_v<T, NamedType>)
            {
                return lowercaseFirst(node.name);
            }
            else if constexpr (std::is_same_v<T, UnionType>)
            {
                return joinNames(node.members, "_or_");
            }
            else if constexpr (std::is_same_v<T, OptionalType>)
            {
                return std::string();
            }
            else
            {
                static_assert(kUnhandledAlternative<T>, "unhandled type alternative");
            }
        },
        type.value);
}

}  // namespace tsbind
