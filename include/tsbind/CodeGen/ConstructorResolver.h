//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Derivation of class constructor function types.
///
//===----------------------------------------------------------------------===//
#ifndef TSBIND_CODEGEN_CONSTRUCTOR_RESOLVER_H
#define TSBIND_CODEGEN_CONSTRUCTOR_RESOLVER_H

#include "tsbind/Model/Type.h"

#include <string>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace tsbind
{

/// @brief Name of the class member that declares the constructor.
inline constexpr const char* kConstructorMemberName = "constructor";

/// @brief Returns the constructor function type of a class.
///
/// @details
/// The first member named `constructor` is returned as declared. Without one,
/// a default constructor taking `unit` and returning `Named(className)` is
/// synthesized.
///
/// @param[in] className Declared class identifier.
/// @param[in] type Class type.
/// @return Constructor type, or an invalid-constructor-target @ref TranslateError
///         when `type` is not class-shaped.
llvm::Expected<TypeRef> constructorTypeOf(llvm::StringRef className, const Type& type);

/// @brief Encodes the constructor function type of a class.
/// @param[in] className Declared class identifier.
/// @param[in] type Class type.
/// @return Encoded constructor type or a @ref TranslateError.
llvm::Expected<std::string> resolveConstructorType(llvm::StringRef className, const Type& type);

}  // namespace tsbind

#endif  // TSBIND_CODEGEN_CONSTRUCTOR_RESOLVER_H
