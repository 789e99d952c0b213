//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Reader for JSON-serialized declaration trees produced by the upstream parser.
///
/// Every node is a JSON object with a `kind` member. Type kinds:
/// `number`, `string`, `boolean`, `unit`, `null`, `any`, `unknown`, `regex`,
/// `dict` (`value`), `array` (`element`), `tuple` (`members`), `object` and
/// `class` (`fields`: `[{name, type}]`), `function` (`params`: `[{name, type}]`,
/// `returns`), `named` (`name`), `union` (`members`, non-empty), and
/// `optional` (`type`). Declaration kinds: `var`, `func`, `type`, `class`
/// (`name`, `type`), `exports` (`type`), and `module` (`name`, `statements`).
///
//===----------------------------------------------------------------------===//
#ifndef TSBIND_FRONTEND_DECLARATION_READER_H
#define TSBIND_FRONTEND_DECLARATION_READER_H

#include "tsbind/Model/Declaration.h"

#include <string>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace tsbind
{
class DiagnosticEngine;

/// @brief Builds a declaration tree from JSON text.
///
/// @details
/// Malformed nodes are reported as error diagnostics located by node path.
/// Declarations of an unrecognized kind become `UnknownDecl` with a warning.
///
/// @param[in] text JSON document text.
/// @param[in] fileName Name used in diagnostic locations.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Root declaration, or an error after diagnostics were reported.
llvm::Expected<DeclRef> parseDeclarationTree(llvm::StringRef    text,
                                             const std::string& fileName,
                                             DiagnosticEngine&  diagnostics);

/// @brief Reads and parses one declaration-tree file.
/// @param[in] path Input file path.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Root declaration or a read/parse error.
llvm::Expected<DeclRef> loadDeclarationFile(const std::string& path, DiagnosticEngine& diagnostics);

}  // namespace tsbind

#endif  // TSBIND_FRONTEND_DECLARATION_READER_H
