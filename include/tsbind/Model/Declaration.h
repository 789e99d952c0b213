//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declaration tree describing the public surface of one foreign module.
///
//===----------------------------------------------------------------------===//
#ifndef TSBIND_MODEL_DECLARATION_H
#define TSBIND_MODEL_DECLARATION_H

#include "tsbind/Model/Type.h"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace tsbind
{

struct Declaration;

/// @brief Shared immutable handle to a declaration node.
using DeclRef = std::shared_ptr<const Declaration>;

/// @brief Exported variable binding.
struct VarDecl final
{
    std::string name;
    TypeRef     type;
};

/// @brief Exported function binding.
struct FuncDecl final
{
    std::string name;
    TypeRef     type;
};

/// @brief Type alias declaration.
struct TypeDecl final
{
    std::string name;
    TypeRef     type;
};

/// @brief Class declaration. `type` is always class-shaped.
struct ClassDecl final
{
    std::string name;
    TypeRef     type;
};

/// @brief Anonymous default export of the owning module.
struct ExportsDecl final
{
    TypeRef type;
};

/// @brief Module scope; statements are processed in declaration order.
struct ModuleDecl final
{
    std::string          name;
    std::vector<DeclRef> statements;
};

/// @brief Sentinel for input the upstream parser did not recognize.
struct UnknownDecl final
{
};

/// @brief One node of a declaration tree.
struct Declaration final
{
    std::variant<VarDecl, FuncDecl, TypeDecl, ClassDecl, ExportsDecl, ModuleDecl, UnknownDecl> value;
};

DeclRef makeVarDecl(std::string name, TypeRef type);
DeclRef makeFuncDecl(std::string name, TypeRef type);
DeclRef makeTypeDecl(std::string name, TypeRef type);
DeclRef makeClassDecl(std::string name, TypeRef type);
DeclRef makeExportsDecl(TypeRef type);
DeclRef makeModuleDecl(std::string name, std::vector<DeclRef> statements);
DeclRef makeUnknownDecl();

}  // namespace tsbind

#endif  // TSBIND_MODEL_DECLARATION_H
