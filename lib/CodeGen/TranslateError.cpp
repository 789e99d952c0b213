//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the translation error payload.
///
//===----------------------------------------------------------------------===//

#include "tsbind/CodeGen/TranslateError.h"

#include <utility>

namespace tsbind
{

char TranslateError::ID = 0;

TranslateError::TranslateError(const TranslateErrorKind kind, std::string message)
    : kind_(kind)
    , message_(std::move(message))
{
}

void TranslateError::log(llvm::raw_ostream& os) const
{
    os << translateErrorKindName(kind_) << ": " << message_;
}

std::error_code TranslateError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

llvm::Error makeTranslateError(const TranslateErrorKind kind, std::string message)
{
    return llvm::make_error<TranslateError>(kind, std::move(message));
}

const char* translateErrorKindName(const TranslateErrorKind kind)
{
    switch (kind)
    {
    case TranslateErrorKind::UnnameableType:
        return "unnameable type";
    case TranslateErrorKind::InvalidConstructorTarget:
        return "invalid constructor target";
    }
    return "translation error";
}

}  // namespace tsbind
