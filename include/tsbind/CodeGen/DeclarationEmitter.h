//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Rendering of declaration bodies into ReasonML bindings.
///
//===----------------------------------------------------------------------===//
#ifndef TSBIND_CODEGEN_DECLARATION_EMITTER_H
#define TSBIND_CODEGEN_DECLARATION_EMITTER_H

#include "tsbind/Model/Declaration.h"

#include <string>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace tsbind
{

/// @brief Renders the body text of one declaration.
///
/// @details
/// | Declaration | Output |
/// |---|---|
/// | `VarDecl`, `FuncDecl` | `external` binding to a member of `moduleId` |
/// | `ExportsDecl` | `external` binding to `moduleId` itself |
/// | `ModuleDecl` | module wrapper around the emitted statements |
/// | `TypeDecl` | empty; fully covered by precode |
/// | `ClassDecl` | class type alias plus `[@bs.new]` constructor binding |
/// | `UnknownDecl` | @ref kUnknownDeclarationMarker |
///
/// Statements of a nested module are emitted with that module as their owner.
///
/// @param[in] decl Declaration to render.
/// @param[in] moduleId Declared identifier of the owning module.
/// @return Rendered text or a @ref TranslateError.
llvm::Expected<std::string> emitDeclaration(const Declaration& decl, llvm::StringRef moduleId);

}  // namespace tsbind

#endif  // TSBIND_CODEGEN_DECLARATION_EMITTER_H
