//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// ReasonML text templates for generated bindings.
///
/// Every helper takes already-encoded fragments and lays out final source
/// syntax. None of them inspect the type model.
///
//===----------------------------------------------------------------------===//
#ifndef TSBIND_CODEGEN_REASON_RENDER_H
#define TSBIND_CODEGEN_REASON_RENDER_H

#include <string>
#include <vector>

namespace tsbind
{

/// @brief Type text emitted where the input type could not be described.
inline constexpr const char* kUntranslatableTypeMarker = "__UNTRANSLATABLE__";

/// @brief Declaration text emitted for unrecognized declarations.
inline constexpr const char* kUnknownDeclarationMarker = "/* untranslatable declaration */";

/// @brief One encoded `(name, type)` pair.
struct EncodedField final
{
    /// @brief Field or parameter name as declared.
    std::string name;

    /// @brief Encoded type text.
    std::string type;
};

/// @brief One encoded class member.
struct EncodedClassMember final
{
    /// @brief Member name as declared.
    std::string name;

    /// @brief Encoded type text.
    std::string type;

    /// @brief True for function-typed members called with method semantics.
    bool isMethod{false};
};

/// @brief One variant of a hoisted union alias.
struct UnionVariant final
{
    /// @brief Constructor tag (already capitalized).
    std::string tag;

    /// @brief Encoded payload type.
    std::string payload;
};

/// @brief Renders an `external` binding to a module member or default export.
/// @param[in] name Normalized binding identifier.
/// @param[in] moduleId Normalized owning module identifier.
/// @param[in] encodedType Encoded binding type.
/// @param[in] isDefaultExport True when binding the module itself.
/// @return One declaration line.
std::string renderVariableDeclaration(const std::string& name,
                                      const std::string& moduleId,
                                      const std::string& encodedType,
                                      bool               isDefaultExport);

/// @brief Renders a nested module wrapper.
///
/// @details
/// The declared name is projected into a module identifier (quotes stripped,
/// disallowed characters mapped, first letter capitalized). Child lines are
/// indented by two spaces.
///
/// @param[in] name Declared module name.
/// @param[in] children Rendered child declarations in order.
/// @return Module declaration text.
std::string renderModuleDeclaration(const std::string& name, const std::vector<std::string>& children);

/// @brief Renders a class type alias plus its constructor binding.
/// @param[in] normalizedName Lowercase-first class type name.
/// @param[in] exportedName Declared class name, used as the JavaScript export.
/// @param[in] moduleId Normalized owning module identifier.
/// @param[in] encodedClassType Encoded structural class type.
/// @param[in] encodedConstructorType Encoded constructor function type.
/// @return Two-line class declaration.
std::string renderClassDeclaration(const std::string& normalizedName,
                                   const std::string& exportedName,
                                   const std::string& moduleId,
                                   const std::string& encodedClassType,
                                   const std::string& encodedConstructorType);

/// @brief Renders an anonymous structural object type.
std::string renderObjectType(const std::vector<EncodedField>& fields);

/// @brief Renders a structural class type with method annotations.
std::string renderClassType(const std::vector<EncodedClassMember>& members);

/// @brief Renders a fixed-arity tuple type.
std::string renderTupleType(const std::vector<std::string>& members);

/// @brief Renders a function type.
///
/// @details
/// Without optional parameters the plain positional form is used
/// (`(float, string) => unit`, or `unit => r` for no parameters). With any
/// optional parameter the labeled form is used, terminated by a `unit`
/// argument (`(~a: float, ~b: string=?, unit) => r`).
///
/// @param[in] params Encoded parameters in declaration order.
/// @param[in] hasOptionalParam True when any parameter is optional.
/// @param[in] returnType Encoded return type.
/// @return Function type text.
std::string renderFunctionType(const std::vector<EncodedField>& params,
                               bool                             hasOptionalParam,
                               const std::string&               returnType);

/// @brief Appends the optional-argument marker to an encoded type.
std::string renderOptionalType(const std::string& encodedType);

/// @brief Renders a type alias declaration.
std::string renderTypeAlias(const std::string& name, const std::string& encodedType);

/// @brief Renders a hoisted union alias as a variant type.
/// @param[in] name Alias name.
/// @param[in] variants Variants in member order.
/// @return Variant type declaration.
std::string renderUnionAlias(const std::string& name, const std::vector<UnionVariant>& variants);

}  // namespace tsbind

#endif  // TSBIND_CODEGEN_REASON_RENDER_H
