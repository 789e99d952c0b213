//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the JSON declaration-tree reader.
///
//===----------------------------------------------------------------------===//

#include "tsbind/Frontend/DeclarationReader.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"
#include "tsbind/Frontend/TreeLocation.h"
#include "tsbind/Support/Diagnostics.h"

namespace tsbind
{
namespace
{

std::optional<PrimitiveKind> parsePrimitiveKind(llvm::StringRef kind)
{
    if (kind == "number")
    {
        return PrimitiveKind::Number;
    }
    if (kind == "string")
    {
        return PrimitiveKind::String;
    }
    if (kind == "boolean")
    {
        return PrimitiveKind::Boolean;
    }
    if (kind == "unit")
    {
        return PrimitiveKind::Unit;
    }
    if (kind == "null")
    {
        return PrimitiveKind::Null;
    }
    if (kind == "any")
    {
        return PrimitiveKind::Any;
    }
    if (kind == "unknown")
    {
        return PrimitiveKind::Unknown;
    }
    if (kind == "regex")
    {
        return PrimitiveKind::Regex;
    }
    return std::nullopt;
}

class TreeReader final
{
public:
    explicit TreeReader(DiagnosticEngine& diagnostics)
        : diagnostics_(diagnostics)
    {
    }

    DeclRef readDeclaration(const llvm::json::Value& value, const TreeLocation& location)
    {
        const auto* object = expectObject(value, location);
        if (object == nullptr)
        {
            return nullptr;
        }
        const auto kind = expectString(*object, "kind", location);
        if (!kind)
        {
            return nullptr;
        }

        if (*kind == "module")
        {
            const auto name = expectString(*object, "name", location);
            if (!name)
            {
                return nullptr;
            }
            const auto* statements = expectArray(*object, "statements", location);
            if (statements == nullptr)
            {
                return nullptr;
            }
            std::vector<DeclRef> children;
            children.reserve(statements->size());
            for (std::size_t i = 0; i < statements->size(); ++i)
            {
                DeclRef child = readDeclaration((*statements)[i], location.member("statements").element(i));
                if (!child)
                {
                    return nullptr;
                }
                children.push_back(std::move(child));
            }
            return makeModuleDecl(*name, std::move(children));
        }

        if (*kind == "exports")
        {
            TypeRef type = readMemberType(*object, "type", location);
            return type ? makeExportsDecl(std::move(type)) : nullptr;
        }

        if (*kind == "var" || *kind == "func" || *kind == "type" || *kind == "class")
        {
            const auto name = expectString(*object, "name", location);
            if (!name)
            {
                return nullptr;
            }
            TypeRef type = readMemberType(*object, "type", location);
            if (!type)
            {
                return nullptr;
            }
            if (*kind == "var")
            {
                return makeVarDecl(*name, std::move(type));
            }
            if (*kind == "func")
            {
                return makeFuncDecl(*name, std::move(type));
            }
            if (*kind == "type")
            {
                return makeTypeDecl(*name, std::move(type));
            }
            if (!std::holds_alternative<ClassType>(type->value))
            {
                diagnostics_.error(location.member("type"),
                                   "class declaration '" + *name + "' requires a class type");
                return nullptr;
            }
            return makeClassDecl(*name, std::move(type));
        }

        diagnostics_.warning(location, "unrecognized declaration kind '" + *kind + "'");
        return makeUnknownDecl();
    }

    TypeRef readType(const llvm::json::Value& value, const TreeLocation& location)
    {
        const auto* object = expectObject(value, location);
        if (object == nullptr)
        {
            return nullptr;
        }
        const auto kind = expectString(*object, "kind", location);
        if (!kind)
        {
            return nullptr;
        }

        if (const auto primitive = parsePrimitiveKind(*kind))
        {
            return makePrimitive(*primitive);
        }
        if (*kind == "dict")
        {
            TypeRef inner = readMemberType(*object, "value", location);
            return inner ? makeDict(std::move(inner)) : nullptr;
        }
        if (*kind == "array")
        {
            TypeRef inner = readMemberType(*object, "element", location);
            return inner ? makeArray(std::move(inner)) : nullptr;
        }
        if (*kind == "optional")
        {
            TypeRef inner = readMemberType(*object, "type", location);
            return inner ? makeOptional(std::move(inner)) : nullptr;
        }
        if (*kind == "named")
        {
            const auto name = expectString(*object, "name", location);
            return name ? makeNamed(*name) : nullptr;
        }
        if (*kind == "tuple")
        {
            auto members = readTypeList(*object, "members", location);
            return members ? makeTuple(std::move(*members)) : nullptr;
        }
        if (*kind == "union")
        {
            auto members = readTypeList(*object, "members", location);
            if (!members)
            {
                return nullptr;
            }
            if (members->empty())
            {
                diagnostics_.error(location.member("members"), "union type requires at least one member");
                return nullptr;
            }
            return makeUnion(std::move(*members));
        }
        if (*kind == "object" || *kind == "class")
        {
            auto fields = readFieldList(*object, "fields", location);
            if (!fields)
            {
                return nullptr;
            }
            return *kind == "object" ? makeObject(std::move(*fields)) : makeClass(std::move(*fields));
        }
        if (*kind == "function")
        {
            auto params = readFieldList(*object, "params", location);
            if (!params)
            {
                return nullptr;
            }
            TypeRef returns = readMemberType(*object, "returns", location);
            return returns ? makeFunction(std::move(*params), std::move(returns)) : nullptr;
        }

        diagnostics_.error(location.member("kind"), "unrecognized type kind '" + *kind + "'");
        return nullptr;
    }

private:
    const llvm::json::Object* expectObject(const llvm::json::Value& value, const TreeLocation& location)
    {
        const auto* object = value.getAsObject();
        if (object == nullptr)
        {
            diagnostics_.error(location, "expected a JSON object");
        }
        return object;
    }

    std::optional<std::string> expectString(const llvm::json::Object& object,
                                            llvm::StringRef           key,
                                            const TreeLocation&       location)
    {
        if (const auto text = object.getString(key))
        {
            return text->str();
        }
        diagnostics_.error(location.member(key.str()), "expected a string member '" + key.str() + "'");
        return std::nullopt;
    }

    const llvm::json::Array* expectArray(const llvm::json::Object& object,
                                         llvm::StringRef           key,
                                         const TreeLocation&       location)
    {
        const auto* array = object.getArray(key);
        if (array == nullptr)
        {
            diagnostics_.error(location.member(key.str()), "expected an array member '" + key.str() + "'");
        }
        return array;
    }

    TypeRef readMemberType(const llvm::json::Object& object, llvm::StringRef key, const TreeLocation& location)
    {
        const auto* value = object.get(key);
        if (value == nullptr)
        {
            diagnostics_.error(location.member(key.str()), "missing type member '" + key.str() + "'");
            return nullptr;
        }
        return readType(*value, location.member(key.str()));
    }

    std::optional<std::vector<TypeRef>> readTypeList(const llvm::json::Object& object,
                                                     llvm::StringRef           key,
                                                     const TreeLocation&       location)
    {
        const auto* array = expectArray(object, key, location);
        if (array == nullptr)
        {
            return std::nullopt;
        }
        std::vector<TypeRef> out;
        out.reserve(array->size());
        for (std::size_t i = 0; i < array->size(); ++i)
        {
            TypeRef member = readType((*array)[i], location.member(key.str()).element(i));
            if (!member)
            {
                return std::nullopt;
            }
            out.push_back(std::move(member));
        }
        return out;
    }

    std::optional<std::vector<TypeField>> readFieldList(const llvm::json::Object& object,
                                                        llvm::StringRef           key,
                                                        const TreeLocation&       location)
    {
        const auto* array = expectArray(object, key, location);
        if (array == nullptr)
        {
            return std::nullopt;
        }
        std::vector<TypeField> out;
        out.reserve(array->size());
        for (std::size_t i = 0; i < array->size(); ++i)
        {
            const TreeLocation fieldLocation = location.member(key.str()).element(i);
            const auto*        field         = expectObject((*array)[i], fieldLocation);
            if (field == nullptr)
            {
                return std::nullopt;
            }
            auto name = expectString(*field, "name", fieldLocation);
            if (!name)
            {
                return std::nullopt;
            }
            TypeRef type = readMemberType(*field, "type", fieldLocation);
            if (!type)
            {
                return std::nullopt;
            }
            out.push_back(TypeField{std::move(*name), std::move(type)});
        }
        return out;
    }

    DiagnosticEngine& diagnostics_;
};

}  // namespace

llvm::Expected<DeclRef> parseDeclarationTree(llvm::StringRef    text,
                                             const std::string& fileName,
                                             DiagnosticEngine&  diagnostics)
{
    const TreeLocation root{fileName};

    auto document = llvm::json::parse(text);
    if (!document)
    {
        const std::string message = llvm::toString(document.takeError());
        diagnostics.error(root, "invalid JSON: " + message);
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "failed to parse %s", fileName.c_str());
    }

    TreeReader reader(diagnostics);
    DeclRef    decl = reader.readDeclaration(*document, root);
    if (!decl)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "malformed declaration tree in %s",
                                       fileName.c_str());
    }
    return decl;
}

llvm::Expected<DeclRef> loadDeclarationFile(const std::string& path, DiagnosticEngine& diagnostics)
{
    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        diagnostics.error(TreeLocation{path}, "cannot read input: " + buffer.getError().message());
        return llvm::createStringError(buffer.getError(), "failed to read %s", path.c_str());
    }
    return parseDeclarationTree((*buffer)->getBuffer(), path, diagnostics);
}

}  // namespace tsbind
