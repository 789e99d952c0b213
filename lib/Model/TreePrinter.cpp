#include "tsbind/Model/TreePrinter.h"

#include <cstddef>
#include <sstream>
#include <type_traits>

namespace tsbind
{
namespace
{

const char* primitiveToString(const PrimitiveKind kind)
{
    switch (kind)
    {
    case PrimitiveKind::Number:
        return "number";
    case PrimitiveKind::String:
        return "string";
    case PrimitiveKind::Boolean:
        return "boolean";
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
    return "?";
}

void printFields(std::ostringstream& out, const std::vector<TypeField>& fields)
{
    for (std::size_t i = 0; i < fields.size(); ++i)
    {
        if (i > 0)
        {
            out << ", ";
        }
        out << fields[i].name << ": " << (fields[i].type ? printType(*fields[i].type) : "?");
    }
}

void printTypeList(std::ostringstream& out, const std::vector<TypeRef>& types, const char* separator)
{
    for (std::size_t i = 0; i < types.size(); ++i)
    {
        if (i > 0)
        {
            out << separator;
        }
        out << (types[i] ? printType(*types[i]) : "?");
    }
}

void printDeclarationAt(std::ostringstream& out, const Declaration& decl, const std::size_t depth)
{
    const std::string indent(depth * 2, ' ');
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, VarDecl>)
            {
                out << indent << "var " << node.name << ": " << printType(*node.type) << "\n";
            }
            else if constexpr (std::is_same_v<T, FuncDecl>)
            {
                out << indent << "func " << node.name << ": " << printType(*node.type) << "\n";
            }
            else if constexpr (std::is_same_v<T, TypeDecl>)
            {
                out << indent << "type " << node.name << " = " << printType(*node.type) << "\n";
            }
            else if constexpr (std::is_same_v<T, ClassDecl>)
            {
                out << indent << "class " << node.name << ": " << printType(*node.type) << "\n";
            }
            else if constexpr (std::is_same_v<T, ExportsDecl>)
            {
                out << indent << "exports " << printType(*node.type) << "\n";
            }
            else if constexpr (std::is_same_v<T, ModuleDecl>)
            {
                out << indent << "module " << node.name << " {\n";
                for (const DeclRef& statement : node.statements)
                {
                    printDeclarationAt(out, *statement, depth + 1);
                }
                out << indent << "}\n";
            }
            else if constexpr (std::is_same_v<T, UnknownDecl>)
            {
                out << indent << "unknown\n";
            }
            else
            {
                static_assert(kUnhandledAlternative<T>, "unhandled declaration alternative");
            }
        },
        decl.value);
}

}  // namespace

std::string printType(const Type& type)
{
    std::ostringstream out;
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, PrimitiveType>)
            {
                out << primitiveToString(node.kind);
            }
            else if constexpr (std::is_same_v<T, DictType>)
            {
                out << "dict<" << printType(*node.value) << '>';
            }
            else if constexpr (std::is_same_v<T, ArrayType>)
            {
                out << "array<" << printType(*node.element) << '>';
            }
            else if constexpr (std::is_same_v<T, TupleType>)
            {
                out << "tuple(";
                printTypeList(out, node.members, ", ");
                out << ')';
            }
            else if constexpr (std::is_same_v<T, ObjectType>)
            {
                out << "object {";
                printFields(out, node.fields);
                out << '}';
            }
            else if constexpr (std::is_same_v<T, ClassType>)
            {
                out << "class {";
                printFields(out, node.fields);
                out << '}';
            }
            else if constexpr (std::is_same_v<T, FunctionType>)
            {
                out << "function(";
                printFields(out, node.params);
                out << ") -> " << printType(*node.returns);
            }
            else if constexpr (std::is_same_v<T, NamedType>)
            {
                out << "named " << node.name;
            }
            else if constexpr (std::is_same_v<T, UnionType>)
            {
                out << "union(";
                printTypeList(out, node.members, " | ");
                out << ')';
            }
            else if constexpr (std::is_same_v<T, OptionalType>)
            {
                out << "optional<" << printType(*node.type) << '>';
            }
            else
            {
                static_assert(kUnhandledAlternative<T>, "unhandled type alternative");
            }
        },
        type.value);
    return out.str();
}

std::string printDeclaration(const Declaration& decl)
{
    std::ostringstream out;
    printDeclarationAt(out, decl, 0);
    return out.str();
}

}  // namespace tsbind
