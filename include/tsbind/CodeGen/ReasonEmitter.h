//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Public entry points and options for ReasonML binding emission.
///
//===----------------------------------------------------------------------===//
#ifndef TSBIND_CODEGEN_REASON_EMITTER_H
#define TSBIND_CODEGEN_REASON_EMITTER_H

#include "tsbind/CodeGen/EmitCommon.h"
#include "tsbind/CodeGen/TranslateOptions.h"
#include "tsbind/Model/Declaration.h"

#include <optional>
#include <string>
#include <vector>

#include "llvm/Support/Error.h"

namespace tsbind
{
class DiagnosticEngine;

/// @brief Translated output of one top-level declaration.
struct Artifact final
{
    /// @brief Normalized module file name; empty for bare type declarations.
    std::string name;

    /// @brief Generated ReasonML source text.
    std::string text;
};

/// @brief Translates one top-level declaration.
///
/// @details
/// A module yields its normalized name and the precode block followed by a
/// newline and its statements joined by newlines. A bare type declaration
/// yields an empty name and its precode. Any other root yields no artifact.
///
/// @param[in] root Top-level declaration.
/// @param[in] options Translation options.
/// @return Artifact, `std::nullopt` for unsupported roots, or a @ref TranslateError.
llvm::Expected<std::optional<Artifact>> translate(const Declaration& root, const TranslateOptions& options = {});

/// @brief One declaration tree paired with the file it was read from.
struct TranslationInput final
{
    /// @brief Input file path; its stem names artifacts that carry no name.
    std::string sourcePath;

    /// @brief Root declaration.
    DeclRef root;
};

/// @brief Configuration options for ReasonML file emission.
struct ReasonEmitOptions final
{
    /// @brief Output directory root.
    std::string outDir;

    /// @brief Translation core options.
    TranslateOptions translate;

    /// @brief Output write policy.
    EmitWritePolicy writePolicy;
};

/// @brief Returns the output file name of one artifact.
/// @param[in] artifact Translated artifact.
/// @param[in] sourcePath Input file path used when the artifact has no name.
/// @return File name with the `.re` extension.
std::string artifactFileName(const Artifact& artifact, const std::string& sourcePath);

/// @brief Translates every input and writes one `.re` file per artifact.
///
/// @details
/// Inputs without an artifact are reported as notes and skipped. A failed
/// input is reported as an error diagnostic; the remaining inputs are still
/// processed and the call fails afterwards. An input whose artifact maps to a
/// file already produced by an earlier input fails the same way instead of
/// replacing that file.
///
/// @param[in] inputs Declaration trees to translate.
/// @param[in] options Emission configuration.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Success or detailed failure.
llvm::Error emitReason(const std::vector<TranslationInput>& inputs,
                       const ReasonEmitOptions&             options,
                       DiagnosticEngine&                    diagnostics);

}  // namespace tsbind

#endif  // TSBIND_CODEGEN_REASON_EMITTER_H
