//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Shape-derived identifiers for types.
///
/// The same name is used as the key of a hoisted alias declaration and at
/// every site that references it, so both always agree.
///
//===----------------------------------------------------------------------===//
#ifndef TSBIND_CODEGEN_TYPE_NAMING_H
#define TSBIND_CODEGEN_TYPE_NAMING_H

#include "tsbind/Model/Type.h"

#include <string>

#include "llvm/Support/Error.h"

namespace tsbind
{

/// @brief Derives the deterministic identifier of a type from its shape.
///
/// @details
/// Primitives map to fixed names (`number`, `string`, `bool`, `unit`, `null`,
/// `any`, `unknown`, `regex`); containers prefix their element name
/// (`dict_`, `array_`, `tuple_of_`); unions join member names with `_or_`;
/// named references lowercase their first letter. Objects and functions use
/// the fixed names `object` and `func`; optionals name to the empty string.
///
/// @param[in] type Type to name.
/// @return Identifier, or an unnameable-type @ref TranslateError for classes.
llvm::Expected<std::string> typeName(const Type& type);

}  // namespace tsbind

#endif  // TSBIND_CODEGEN_TYPE_NAMING_H
