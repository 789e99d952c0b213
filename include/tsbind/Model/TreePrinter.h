//===----------------------------------------------------------------------===//
///
/// @file
/// Tree pretty-printing declarations for debugging and diagnostics.
///
//===----------------------------------------------------------------------===//
#ifndef TSBIND_MODEL_TREE_PRINTER_H
#define TSBIND_MODEL_TREE_PRINTER_H

#include "tsbind/Model/Declaration.h"

#include <string>

namespace tsbind
{

/// @brief Produces a single-line representation of a type.
/// @param[in] type Type to print.
/// @return Pretty-printed type text.
std::string printType(const Type& type);

/// @brief Produces an indented representation of a declaration tree.
/// @param[in] decl Root declaration.
/// @return Pretty-printed tree text, one declaration per line.
std::string printDeclaration(const Declaration& decl);

}  // namespace tsbind

#endif  // TSBIND_MODEL_TREE_PRINTER_H
