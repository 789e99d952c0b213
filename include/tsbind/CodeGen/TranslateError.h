//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Fatal translation errors.
///
//===----------------------------------------------------------------------===//
#ifndef TSBIND_CODEGEN_TRANSLATE_ERROR_H
#define TSBIND_CODEGEN_TRANSLATE_ERROR_H

#include <string>
#include <system_error>

#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

namespace tsbind
{

/// @brief Categories of translation failure. Both abort the translation unit.
enum class TranslateErrorKind
{
    /// @brief The naming function was applied to a class type.
    UnnameableType,

    /// @brief The constructor resolver was applied to a non-class type.
    InvalidConstructorTarget,
};

/// @brief Error payload raised by the naming function and constructor resolver.
class TranslateError final : public llvm::ErrorInfo<TranslateError>
{
public:
    /// @brief Error class identity for LLVM RTTI.
    static char ID;

    /// @brief Creates one translation error.
    /// @param[in] kind Failure category.
    /// @param[in] message Human-readable message text.
    TranslateError(TranslateErrorKind kind, std::string message);

    /// @brief Returns the failure category.
    [[nodiscard]] TranslateErrorKind kind() const
    {
        return kind_;
    }

    /// @brief Returns the message text without the kind label.
    std::string message() const override
    {
        return message_;
    }

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

private:
    TranslateErrorKind kind_;
    std::string        message_;
};

/// @brief Builds an `llvm::Error` carrying a @ref TranslateError.
/// @param[in] kind Failure category.
/// @param[in] message Human-readable message text.
/// @return Failure value.
llvm::Error makeTranslateError(TranslateErrorKind kind, std::string message);

/// @brief Stable spelling of an error kind, used in diagnostics.
/// @param[in] kind Failure category.
/// @return Kind label.
const char* translateErrorKindName(TranslateErrorKind kind);

}  // namespace tsbind

#endif  // TSBIND_CODEGEN_TRANSLATE_ERROR_H
