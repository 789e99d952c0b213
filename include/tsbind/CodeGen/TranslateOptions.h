//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Options shared by the translation core.
///
//===----------------------------------------------------------------------===//
#ifndef TSBIND_CODEGEN_TRANSLATE_OPTIONS_H
#define TSBIND_CODEGEN_TRANSLATE_OPTIONS_H

namespace tsbind
{

/// @brief Options consumed by the translation core.
struct TranslateOptions final
{
    /// @brief Also hoist unions that appear in function return positions.
    ///
    /// @details
    /// Off by default: only parameter types are scanned, so a union used
    /// solely as a return type is referenced but never declared.
    bool hoistReturnTypeUnions{false};
};

}  // namespace tsbind

#endif  // TSBIND_CODEGEN_TRANSLATE_OPTIONS_H
