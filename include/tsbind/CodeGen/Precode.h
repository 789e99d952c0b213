//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Hoisted auxiliary declarations emitted ahead of binding bodies.
///
/// Precode currently consists of type aliases: one variant alias per distinct
/// union shape plus the alias produced by each type declaration.
///
//===----------------------------------------------------------------------===//
#ifndef TSBIND_CODEGEN_PRECODE_H
#define TSBIND_CODEGEN_PRECODE_H

#include "tsbind/CodeGen/TranslateOptions.h"
#include "tsbind/Model/Declaration.h"
#include "tsbind/Model/Type.h"

#include <string>
#include <vector>

#include "llvm/Support/Error.h"

namespace tsbind
{

/// @brief Collects union alias declarations reachable from one type.
///
/// @details
/// Traversal order: a union yields its own alias and is not entered further;
/// functions visit parameters in declaration order and skip the return type
/// unless @ref TranslateOptions::hoistReturnTypeUnions is set; objects and
/// classes visit fields in order; optionals, arrays, and dicts visit their
/// inner type. Duplicates are kept.
///
/// @param[in] type Type to scan.
/// @param[in] options Translation options.
/// @return Alias declarations in traversal order.
llvm::Expected<std::vector<std::string>> collectTypePrecode(const Type& type, const TranslateOptions& options);

/// @brief Collects precode for one declaration, recursing into modules.
///
/// @details
/// A type declaration contributes its own alias before the precode of its
/// aliased type. Duplicates are kept.
///
/// @param[in] decl Declaration to scan.
/// @param[in] options Translation options.
/// @return Alias declarations in traversal order.
llvm::Expected<std::vector<std::string>> collectDeclarationPrecode(const Declaration&      decl,
                                                                   const TranslateOptions& options);

/// @brief Renders the de-duplicated precode block of one declaration.
/// @param[in] decl Declaration to scan.
/// @param[in] options Translation options.
/// @return First occurrences joined with newlines.
llvm::Expected<std::string> renderPrecode(const Declaration& decl, const TranslateOptions& options);

}  // namespace tsbind

#endif  // TSBIND_CODEGEN_PRECODE_H
