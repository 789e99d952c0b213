//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements precode collection for hoisted alias declarations.
///
//===----------------------------------------------------------------------===//

#include "tsbind/CodeGen/Precode.h"

#include <cstddef>
#include <type_traits>
#include <utility>

#include "tsbind/CodeGen/NamingPolicy.h"
#include "tsbind/CodeGen/ReasonRender.h"
#include "tsbind/CodeGen/TypeEncoder.h"
#include "tsbind/CodeGen/TypeNaming.h"

namespace tsbind
{
namespace
{

class PrecodeCollector final
{
public:
    explicit PrecodeCollector(const TranslateOptions& options)
        : options_(options)
    {
    }

    llvm::Error visitType(const Type& type)
    {
        return std::visit(
            [this, &type](const auto& node) -> llvm::Error {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, PrimitiveType> || std::is_same_v<T, TupleType> ||
                              std::is_same_v<T, NamedType>)
                {
                    return llvm::Error::success();
                }
                else if constexpr (std::is_same_v<T, DictType>)
                {
                    return visitType(*node.value);
                }
                else if constexpr (std::is_same_v<T, ArrayType>)
                {
                    return visitType(*node.element);
                }
                else if constexpr (std::is_same_v<T, OptionalType>)
                {
                    return visitType(*node.type);
                }
                else if constexpr (std::is_same_v<T, ObjectType> || std::is_same_v<T, ClassType>)
                {
                    return visitFields(node.fields);
                }
                else if constexpr (std::is_same_v<T, FunctionType>)
                {
                    if (llvm::Error err = visitFields(node.params))
                    {
                        return err;
                    }
                    if (options_.hoistReturnTypeUnions)
                    {
                        return visitType(*node.returns);
                    }
                    return llvm::Error::success();
                }
                else if constexpr (std::is_same_v<T, UnionType>)
                {
                    return emitUnionAlias(type, node);
                }
                else
                {
                    static_assert(kUnhandledAlternative<T>, "unhandled type alternative");
                }
            },
            type.value);
    }

    llvm::Error visitDeclaration(const Declaration& decl)
    {
        return std::visit(
            [this](const auto& node) -> llvm::Error {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, VarDecl> || std::is_same_v<T, FuncDecl> ||
                              std::is_same_v<T, ClassDecl> || std::is_same_v<T, ExportsDecl>)
                {
                    return visitType(*node.type);
                }
                else if constexpr (std::is_same_v<T, TypeDecl>)
                {
                    auto encoded = encodeType(*node.type);
                    if (!encoded)
                    {
                        return encoded.takeError();
                    }
                    aliases_.push_back(renderTypeAlias(lowercaseFirst(node.name), *encoded));
                    return visitType(*node.type);
                }
                else if constexpr (std::is_same_v<T, ModuleDecl>)
                {
                    for (const DeclRef& statement : node.statements)
                    {
                        if (llvm::Error err = visitDeclaration(*statement))
                        {
                            return err;
                        }
                    }
                    return llvm::Error::success();
                }
                else if constexpr (std::is_same_v<T, UnknownDecl>)
                {
                    return llvm::Error::success();
                }
                else
                {
                    static_assert(kUnhandledAlternative<T>, "unhandled declaration alternative");
                }
            },
            decl.value);
    }

    std::vector<std::string> takeAliases()
    {
        return std::move(aliases_);
    }

private:
    llvm::Error visitFields(const std::vector<TypeField>& fields)
    {
        for (const TypeField& field : fields)
        {
            if (llvm::Error err = visitType(*field.type))
            {
                return err;
            }
        }
        return llvm::Error::success();
    }

    llvm::Error emitUnionAlias(const Type& type, const UnionType& node)
    {
        auto aliasName = typeName(type);
        if (!aliasName)
        {
            return aliasName.takeError();
        }

        std::vector<UnionVariant> variants;
        variants.reserve(node.members.size());
        for (const TypeRef& member : node.members)
        {
            auto memberName = typeName(*member);
            if (!memberName)
            {
                return memberName.takeError();
            }
            auto payload = encodeType(*member);
            if (!payload)
            {
                return payload.takeError();
            }
            variants.push_back(UnionVariant{capitalizeFirst(*memberName), std::move(*payload)});
        }
        aliases_.push_back(renderUnionAlias(*aliasName, variants));
        return llvm::Error::success();
    }

    const TranslateOptions&  options_;
    std::vector<std::string> aliases_;
};

std::string joinLines(const std::vector<std::string>& lines)
{
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
        {
            out += '\n';
        }
        out += lines[i];
    }
    return out;
}

}  // namespace

llvm::Expected<std::vector<std::string>> collectTypePrecode(const Type& type, const TranslateOptions& options)
{
    PrecodeCollector collector(options);
    if (llvm::Error err = collector.visitType(type))
    {
        return std::move(err);
    }
    return collector.takeAliases();
}

llvm::Expected<std::vector<std::string>> collectDeclarationPrecode(const Declaration&      decl,
                                                                   const TranslateOptions& options)
{
    PrecodeCollector collector(options);
    if (llvm::Error err = collector.visitDeclaration(decl))
    {
        return std::move(err);
    }
    return collector.takeAliases();
}

llvm::Expected<std::string> renderPrecode(const Declaration& decl, const TranslateOptions& options)
{
    auto aliases = collectDeclarationPrecode(decl, options);
    if (!aliases)
    {
        return aliases.takeError();
    }
    return joinLines(dedupePreservingOrder(*aliases));
}

}  // namespace tsbind
