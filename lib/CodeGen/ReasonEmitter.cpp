//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements top-level ReasonML translation and file emission.
///
/// Each root is translated in two phases: the de-duplicated precode block,
/// then the declaration bodies.
///
//===----------------------------------------------------------------------===//

#include "tsbind/CodeGen/ReasonEmitter.h"

#include <cstddef>
#include <filesystem>
#include <utility>

#include "llvm/ADT/StringMap.h"
#include "tsbind/CodeGen/DeclarationEmitter.h"
#include "tsbind/CodeGen/NamingPolicy.h"
#include "tsbind/CodeGen/Precode.h"
#include "tsbind/Support/Diagnostics.h"

namespace tsbind
{
namespace
{

llvm::Expected<Artifact> translateModule(const Declaration&      root,
                                         const ModuleDecl&       module,
                                         const TranslateOptions& options)
{
    auto precode = renderPrecode(root, options);
    if (!precode)
    {
        return precode.takeError();
    }

    std::string body;
    for (std::size_t i = 0; i < module.statements.size(); ++i)
    {
        auto statement = emitDeclaration(*module.statements[i], module.name);
        if (!statement)
        {
            return statement.takeError();
        }
        if (i > 0)
        {
            body += '\n';
        }
        body += *statement;
    }
    return Artifact{normalizeIdentifier(module.name), *precode + "\n" + body};
}

llvm::Expected<Artifact> translateTypeAlias(const Declaration& root, const TranslateOptions& options)
{
    auto precode = renderPrecode(root, options);
    if (!precode)
    {
        return precode.takeError();
    }
    auto body = emitDeclaration(root, "");
    if (!body)
    {
        return body.takeError();
    }
    return Artifact{"", *precode + *body};
}

}  // namespace

llvm::Expected<std::optional<Artifact>> translate(const Declaration& root, const TranslateOptions& options)
{
    if (const auto* module = std::get_if<ModuleDecl>(&root.value))
    {
        auto artifact = translateModule(root, *module, options);
        if (!artifact)
        {
            return artifact.takeError();
        }
        return std::optional<Artifact>(std::move(*artifact));
    }
    if (std::holds_alternative<TypeDecl>(root.value))
    {
        auto artifact = translateTypeAlias(root, options);
        if (!artifact)
        {
            return artifact.takeError();
        }
        return std::optional<Artifact>(std::move(*artifact));
    }
    return std::optional<Artifact>();
}

std::string artifactFileName(const Artifact& artifact, const std::string& sourcePath)
{
    std::string stem = artifact.name;
    if (stem.empty())
    {
        stem = normalizeIdentifier(std::filesystem::path(sourcePath).stem().string());
    }
    return stem + ".re";
}

llvm::Error emitReason(const std::vector<TranslationInput>& inputs,
                       const ReasonEmitOptions&             options,
                       DiagnosticEngine&                    diagnostics)
{
    if (options.outDir.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "output directory is required");
    }

    const std::filesystem::path  outRoot(options.outDir);
    std::size_t                  failedInputs = 0;
    llvm::StringMap<std::string> plannedOutputs;
    for (const TranslationInput& input : inputs)
    {
        const TreeLocation location{input.sourcePath};

        auto artifact = translate(*input.root, options.translate);
        if (!artifact)
        {
            diagnostics.error(location, llvm::toString(artifact.takeError()));
            ++failedInputs;
            continue;
        }
        if (!artifact->has_value())
        {
            diagnostics.note(location, "top-level declaration is neither a module nor a type alias; nothing emitted");
            continue;
        }

        const Artifact&   generated = **artifact;
        const std::string fileName  = artifactFileName(generated, input.sourcePath);
        const auto        claimed   = plannedOutputs.try_emplace(fileName, input.sourcePath);
        if (!claimed.second)
        {
            diagnostics.error(location,
                              "output '" + fileName + "' is already generated from " + claimed.first->second);
            ++failedInputs;
            continue;
        }
        if (llvm::Error err = writeGeneratedFile(outRoot / fileName, generated.text + "\n", options.writePolicy))
        {
            return err;
        }
    }

    if (failedInputs > 0)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "generation failed for %zu input(s)",
                                       failedInputs);
    }
    return llvm::Error::success();
}

}  // namespace tsbind
