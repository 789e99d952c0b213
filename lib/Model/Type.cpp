//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements type-node queries and factory helpers.
///
//===----------------------------------------------------------------------===//

#include "tsbind/Model/Type.h"

namespace tsbind
{
namespace
{

template <typename T>
TypeRef makeNode(T node)
{
    return std::make_shared<const Type>(Type{std::move(node)});
}

}  // namespace

bool Type::isPrimitive(const PrimitiveKind kind) const
{
    const auto* primitive = std::get_if<PrimitiveType>(&value);
    return primitive != nullptr && primitive->kind == kind;
}

bool Type::isOptional() const
{
    return std::holds_alternative<OptionalType>(value);
}

TypeRef makePrimitive(const PrimitiveKind kind)
{
    return makeNode(PrimitiveType{kind});
}

TypeRef makeNumber()
{
    return makePrimitive(PrimitiveKind::Number);
}

TypeRef makeString()
{
    return makePrimitive(PrimitiveKind::String);
}

TypeRef makeBoolean()
{
    return makePrimitive(PrimitiveKind::Boolean);
}

TypeRef makeUnit()
{
    return makePrimitive(PrimitiveKind::Unit);
}

TypeRef makeNull()
{
    return makePrimitive(PrimitiveKind::Null);
}

TypeRef makeAny()
{
    return makePrimitive(PrimitiveKind::Any);
}

TypeRef makeUnknown()
{
    return makePrimitive(PrimitiveKind::Unknown);
}

TypeRef makeRegex()
{
    return makePrimitive(PrimitiveKind::Regex);
}

TypeRef makeDict(TypeRef value)
{
    return makeNode(DictType{std::move(value)});
}

TypeRef makeArray(TypeRef element)
{
    return makeNode(ArrayType{std::move(element)});
}

TypeRef makeTuple(std::vector<TypeRef> members)
{
    return makeNode(TupleType{std::move(members)});
}

TypeRef makeObject(std::vector<TypeField> fields)
{
    return makeNode(ObjectType{std::move(fields)});
}

TypeRef makeClass(std::vector<TypeField> fields)
{
    return makeNode(ClassType{std::move(fields)});
}

TypeRef makeFunction(std::vector<TypeField> params, TypeRef returns)
{
    return makeNode(FunctionType{std::move(params), std::move(returns)});
}

TypeRef makeNamed(std::string name)
{
    return makeNode(NamedType{std::move(name)});
}

TypeRef makeUnion(std::vector<TypeRef> members)
{
    return makeNode(UnionType{std::move(members)});
}

TypeRef makeOptional(TypeRef type)
{
    return makeNode(OptionalType{std::move(type)});
}

}  // namespace tsbind
