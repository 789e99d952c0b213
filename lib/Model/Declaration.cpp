//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements declaration factory helpers.
///
//===----------------------------------------------------------------------===//

#include "tsbind/Model/Declaration.h"

#include <utility>

namespace tsbind
{
namespace
{

template <typename T>
DeclRef makeNode(T node)
{
    return std::make_shared<const Declaration>(Declaration{std::move(node)});
}

}  // namespace

DeclRef makeVarDecl(std::string name, TypeRef type)
{
    return makeNode(VarDecl{std::move(name), std::move(type)});
}

DeclRef makeFuncDecl(std::string name, TypeRef type)
{
    return makeNode(FuncDecl{std::move(name), std::move(type)});
}

DeclRef makeTypeDecl(std::string name, TypeRef type)
{
    return makeNode(TypeDecl{std::move(name), std::move(type)});
}

DeclRef makeClassDecl(std::string name, TypeRef type)
{
    return makeNode(ClassDecl{std::move(name), std::move(type)});
}

DeclRef makeExportsDecl(TypeRef type)
{
    return makeNode(ExportsDecl{std::move(type)});
}

DeclRef makeModuleDecl(std::string name, std::vector<DeclRef> statements)
{
    return makeNode(ModuleDecl{std::move(name), std::move(statements)});
}

DeclRef makeUnknownDecl()
{
    return makeNode(UnknownDecl{});
}

}  // namespace tsbind
