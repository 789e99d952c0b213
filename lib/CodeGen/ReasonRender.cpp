//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements ReasonML text templates.
///
/// These helpers produce deterministic BuckleScript binding text used by the
/// declaration emitter and precode generator.
///
//===----------------------------------------------------------------------===//

#include "tsbind/CodeGen/ReasonRender.h"

#include <cstddef>

#include "llvm/ADT/StringRef.h"
#include "tsbind/CodeGen/NamingPolicy.h"

namespace tsbind
{
namespace
{

std::string quoteLabel(llvm::StringRef name)
{
    std::string out = "\"";
    for (const char c : stripIdentifierQuotes(name))
    {
        if (c == '"' || c == '\\')
        {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

std::string joinWith(const std::vector<std::string>& items, const char* separator)
{
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (i > 0)
        {
            out += separator;
        }
        out += items[i];
    }
    return out;
}

std::string indentLines(llvm::StringRef text)
{
    std::string out;
    while (!text.empty())
    {
        const auto split = text.split('\n');
        if (!split.first.empty())
        {
            out += "  ";
            out += split.first.str();
        }
        out += '\n';
        text = split.second;
    }
    return out;
}

}  // namespace

std::string renderVariableDeclaration(const std::string& name,
                                      const std::string& moduleId,
                                      const std::string& encodedType,
                                      const bool         isDefaultExport)
{
    if (isDefaultExport)
    {
        return "[@bs.module] external " + name + ": " + encodedType + " = \"" + moduleId + "\";";
    }
    return "[@bs.module \"" + moduleId + "\"] external " + name + ": " + encodedType + " = \"" + name + "\";";
}

std::string renderModuleDeclaration(const std::string& name, const std::vector<std::string>& children)
{
    const std::string moduleName = capitalizeFirst(normalizeIdentifier(name));
    if (children.empty())
    {
        return "module " + moduleName + " = {};";
    }
    std::string out = "module " + moduleName + " = {\n";
    for (const std::string& child : children)
    {
        out += indentLines(child);
    }
    out += "};";
    return out;
}

std::string renderClassDeclaration(const std::string& normalizedName,
                                   const std::string& exportedName,
                                   const std::string& moduleId,
                                   const std::string& encodedClassType,
                                   const std::string& encodedConstructorType)
{
    return "type " + normalizedName + " = " + encodedClassType + ";\n" + "[@bs.new] [@bs.module \"" + moduleId +
           "\"] external make" + capitalizeFirst(normalizedName) + ": " + encodedConstructorType + " = \"" +
           exportedName + "\";";
}

std::string renderObjectType(const std::vector<EncodedField>& fields)
{
    if (fields.empty())
    {
        return "{.}";
    }
    std::vector<std::string> parts;
    parts.reserve(fields.size());
    for (const EncodedField& field : fields)
    {
        parts.push_back(quoteLabel(field.name) + ": " + field.type);
    }
    return "{. " + joinWith(parts, ", ") + "}";
}

std::string renderClassType(const std::vector<EncodedClassMember>& members)
{
    if (members.empty())
    {
        return "{.}";
    }
    std::vector<std::string> parts;
    parts.reserve(members.size());
    for (const EncodedClassMember& member : members)
    {
        parts.push_back((member.isMethod ? "[@bs.meth] " : "") + quoteLabel(member.name) + ": " + member.type);
    }
    return "{. " + joinWith(parts, ", ") + "}";
}

std::string renderTupleType(const std::vector<std::string>& members)
{
    return "(" + joinWith(members, ", ") + ")";
}

std::string renderFunctionType(const std::vector<EncodedField>& params,
                               const bool                       hasOptionalParam,
                               const std::string&               returnType)
{
    if (params.empty())
    {
        return "unit => " + returnType;
    }
    std::vector<std::string> parts;
    parts.reserve(params.size() + 1);
    for (const EncodedField& param : params)
    {
        if (hasOptionalParam)
        {
            parts.push_back("~" + normalizeIdentifier(param.name) + ": " + param.type);
        }
        else
        {
            parts.push_back(param.type);
        }
    }
    if (hasOptionalParam)
    {
        parts.emplace_back("unit");
    }
    return "(" + joinWith(parts, ", ") + ") => " + returnType;
}

std::string renderOptionalType(const std::string& encodedType)
{
    return encodedType + "=?";
}

std::string renderTypeAlias(const std::string& name, const std::string& encodedType)
{
    return "type " + name + " = " + encodedType + ";";
}

std::string renderUnionAlias(const std::string& name, const std::vector<UnionVariant>& variants)
{
    std::string out = "type " + name + " =";
    for (const UnionVariant& variant : variants)
    {
        out += "\n  | " + variant.tag + "(" + variant.payload + ")";
    }
    out += ";";
    return out;
}

}  // namespace tsbind
