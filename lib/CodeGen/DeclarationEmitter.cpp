//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements declaration body emission.
///
/// Each declaration kind combines encoded types with the ReasonML templates.
///
//===----------------------------------------------------------------------===//

#include "tsbind/CodeGen/DeclarationEmitter.h"

#include <type_traits>
#include <utility>
#include <vector>

#include "tsbind/CodeGen/ConstructorResolver.h"
#include "tsbind/CodeGen/NamingPolicy.h"
#include "tsbind/CodeGen/ReasonRender.h"
#include "tsbind/CodeGen/TypeEncoder.h"

namespace tsbind
{
namespace
{

llvm::Expected<std::string> emitBinding(const std::string& name, llvm::StringRef moduleId, const Type& type)
{
    auto encoded = encodeType(type);
    if (!encoded)
    {
        return encoded.takeError();
    }
    return renderVariableDeclaration(normalizeIdentifier(name),
                                     normalizeIdentifier(moduleId),
                                     *encoded,
                                     /*isDefaultExport=*/false);
}

llvm::Expected<std::string> emitClass(const ClassDecl& decl, llvm::StringRef moduleId)
{
    auto constructorType = resolveConstructorType(decl.name, *decl.type);
    if (!constructorType)
    {
        return constructorType.takeError();
    }
    auto classType = encodeType(*decl.type);
    if (!classType)
    {
        return classType.takeError();
    }
    return renderClassDeclaration(lowercaseFirst(decl.name),
                                  decl.name,
                                  normalizeIdentifier(moduleId),
                                  *classType,
                                  *constructorType);
}

}  // namespace

llvm::Expected<std::string> emitDeclaration(const Declaration& decl, llvm::StringRef moduleId)
{
    return std::visit(
        [moduleId](const auto& node) -> llvm::Expected<std::string> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, VarDecl> || std::is_same_v<T, FuncDecl>)
            {
                return emitBinding(node.name, moduleId, *node.type);
            }
            else if constexpr (std::is_same_v<T, ExportsDecl>)
            {
                auto encoded = encodeType(*node.type);
                if (!encoded)
                {
                    return encoded.takeError();
                }
                const std::string module = normalizeIdentifier(moduleId);
                return renderVariableDeclaration(module, module, *encoded, /*isDefaultExport=*/true);
            }
            else if constexpr (std::is_same_v<T, ModuleDecl>)
            {
                std::vector<std::string> children;
                children.reserve(node.statements.size());
                for (const DeclRef& statement : node.statements)
                {
                    auto child = emitDeclaration(*statement, node.name);
                    if (!child)
                    {
                        return child.takeError();
                    }
                    children.push_back(std::move(*child));
                }
                return renderModuleDeclaration(node.name, children);
            }
            else if constexpr (std::is_same_v<T, TypeDecl>)
            {
                return std::string();
            }
            else if constexpr (std::is_same_v<T, ClassDecl>)
            {
                return emitClass(node, moduleId);
            }
            else if constexpr (std::is_same_v<T, UnknownDecl>)
            {
                return std::string(kUnknownDeclarationMarker);
            }
            else
            {
                static_assert(kUnhandledAlternative<T>, "unhandled declaration alternative");
            }
        },
        decl.value);
}

}  // namespace tsbind
