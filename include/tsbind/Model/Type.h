//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Closed algebraic model of foreign-module types consumed by the translator.
///
/// Trees are built upstream, shared through `TypeRef`, and never mutated.
///
//===----------------------------------------------------------------------===//
#ifndef TSBIND_MODEL_TYPE_H
#define TSBIND_MODEL_TYPE_H

#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tsbind
{

/// @brief Marker (payload-free) type kinds.
enum class PrimitiveKind
{
    /// @brief Numeric value.
    Number,

    /// @brief String value.
    String,

    /// @brief Boolean value.
    Boolean,

    /// @brief Unit (void) value.
    Unit,

    /// @brief Null value.
    Null,

    /// @brief Unconstrained value.
    Any,

    /// @brief Type the upstream parser could not describe.
    Unknown,

    /// @brief Regular-expression object.
    Regex,
};

struct Type;

/// @brief Shared immutable handle to a type node.
using TypeRef = std::shared_ptr<const Type>;

/// @brief One named member of an object, class, or parameter list.
struct TypeField final
{
    /// @brief Field or parameter name as declared.
    std::string name;

    /// @brief Field or parameter type.
    TypeRef type;
};

struct PrimitiveType final
{
    PrimitiveKind kind{PrimitiveKind::Any};
};

/// @brief String-keyed map of `value`.
struct DictType final
{
    TypeRef value;
};

struct ArrayType final
{
    TypeRef element;
};

/// @brief Fixed-length heterogeneous sequence.
struct TupleType final
{
    std::vector<TypeRef> members;
};

/// @brief Anonymous structural record; field order is significant.
struct ObjectType final
{
    std::vector<TypeField> fields;
};

/// @brief Class shape. A field literally named `constructor` is the constructor.
struct ClassType final
{
    std::vector<TypeField> fields;
};

struct FunctionType final
{
    std::vector<TypeField> params;
    TypeRef                returns;
};

/// @brief Reference to a declared type by identifier.
struct NamedType final
{
    std::string name;
};

/// @brief Tagged choice; members are non-empty and order-significant.
struct UnionType final
{
    std::vector<TypeRef> members;
};

/// @brief Optional function parameter type.
struct OptionalType final
{
    TypeRef type;
};

/// @brief One node of a type tree.
struct Type final
{
    std::variant<PrimitiveType,
                 DictType,
                 ArrayType,
                 TupleType,
                 ObjectType,
                 ClassType,
                 FunctionType,
                 NamedType,
                 UnionType,
                 OptionalType>
        value;

    /// @brief Returns true when this node is the given primitive kind.
    [[nodiscard]] bool isPrimitive(PrimitiveKind kind) const;

    /// @brief Returns true for `OptionalType` nodes.
    [[nodiscard]] bool isOptional() const;
};

/// @brief Dependent false used to close `if constexpr` visitation chains.
template <typename T>
inline constexpr bool kUnhandledAlternative = false;

TypeRef makePrimitive(PrimitiveKind kind);
TypeRef makeNumber();
TypeRef makeString();
TypeRef makeBoolean();
TypeRef makeUnit();
TypeRef makeNull();
TypeRef makeAny();
TypeRef makeUnknown();
TypeRef makeRegex();
TypeRef makeDict(TypeRef value);
TypeRef makeArray(TypeRef element);
TypeRef makeTuple(std::vector<TypeRef> members);
TypeRef makeObject(std::vector<TypeField> fields);
TypeRef makeClass(std::vector<TypeField> fields);
TypeRef makeFunction(std::vector<TypeField> params, TypeRef returns);
TypeRef makeNamed(std::string name);
TypeRef makeUnion(std::vector<TypeRef> members);
TypeRef makeOptional(TypeRef type);

}  // namespace tsbind

#endif  // TSBIND_MODEL_TYPE_H
