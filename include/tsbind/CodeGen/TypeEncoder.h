//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Recursive rendering of model types into ReasonML type syntax.
///
//===----------------------------------------------------------------------===//
#ifndef TSBIND_CODEGEN_TYPE_ENCODER_H
#define TSBIND_CODEGEN_TYPE_ENCODER_H

#include "tsbind/Model/Type.h"

#include <string>

#include "llvm/Support/Error.h"

namespace tsbind
{

/// @brief Encodes one type as ReasonML type text.
///
/// @details
/// Unions render as a reference to their hoisted alias; the alias itself is
/// produced by the precode generator. Class types render as a structural
/// object type without their `constructor` member. `unknown` renders as
/// @ref kUntranslatableTypeMarker.
///
/// @param[in] type Type to encode.
/// @return Encoded text, or a @ref TranslateError raised while naming a union.
llvm::Expected<std::string> encodeType(const Type& type);

/// @brief Returns true when any parameter of the function is optional.
/// @param[in] function Function type.
/// @return True if at least one parameter is `OptionalType`.
bool hasOptionalParam(const FunctionType& function);

}  // namespace tsbind

#endif  // TSBIND_CODEGEN_TYPE_ENCODER_H
