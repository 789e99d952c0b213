//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Shared naming-policy helpers for binding generation.
///
/// This interface centralizes identifier normalization, first-letter case
/// projections, and order-preserving de-duplication used by the emitters.
///
//===----------------------------------------------------------------------===//
#ifndef TSBIND_CODEGEN_NAMING_POLICY_H
#define TSBIND_CODEGEN_NAMING_POLICY_H

#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"

namespace tsbind
{

/// @brief Removes one pair of matching surrounding quotes (`"` or `'`).
/// @param[in] name Declared identifier, possibly quoted.
/// @return View of `name` without its quotes, or `name` itself.
llvm::StringRef stripIdentifierQuotes(llvm::StringRef name);

/// @brief Normalizes a declared identifier into a host-language identifier.
///
/// @details
/// One pair of surrounding quotes (`"` or `'`) is stripped and every
/// character outside `[A-Za-z0-9_]` is mapped to `_`. Applying the function
/// to its own output returns the same text.
///
/// @param[in] name Declared identifier, possibly quoted.
/// @return Normalized identifier.
std::string normalizeIdentifier(llvm::StringRef name);

/// @brief Lowercases the first character of an identifier.
/// @param[in] name Source identifier.
/// @return Identifier with an ASCII-lowercased first character.
std::string lowercaseFirst(llvm::StringRef name);

/// @brief Uppercases the first character of an identifier.
/// @param[in] name Source identifier.
/// @return Identifier with an ASCII-uppercased first character.
std::string capitalizeFirst(llvm::StringRef name);

/// @brief Removes repeated entries, keeping the first occurrence of each.
/// @param[in] items Input list.
/// @return Distinct entries in first-occurrence order.
std::vector<std::string> dedupePreservingOrder(const std::vector<std::string>& items);

}  // namespace tsbind

#endif  // TSBIND_CODEGEN_NAMING_POLICY_H
