//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `tsbindc` command-line binding generator.
///
/// This tool reads declaration trees from JSON, translates them into ReasonML
/// BuckleScript bindings, and writes the result to files or stdout.
///
//===----------------------------------------------------------------------===//

#include <llvm/ADT/StringRef.h>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "tsbind/CodeGen/ReasonEmitter.h"
#include "tsbind/Frontend/DeclarationReader.h"
#include "tsbind/Model/TreePrinter.h"
#include "tsbind/Support/Diagnostics.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

/// @brief Checks whether a command token is implemented by `tsbindc`.
///
/// @param[in] command Command token from argv.
/// @return `true` if the command is one of the supported subcommands.
bool isKnownCommand(llvm::StringRef command)
{
    return command == "ast" || command == "reason" || command == "print";
}

bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: tsbindc <ast|reason|print> --input <file> [--input <file> ...] [options]\n"
                 << "Try: tsbindc --help\n";
}

/// @brief Prints the full help text and optional command-focused details.
///
/// @param[in] selectedCommand Optional command name used for focused help.
void printHelp(const std::string& selectedCommand = "")
{
    llvm::errs() << "NAME\n"
                 << "  tsbindc - ReasonML binding generator for foreign module declarations\n\n"
                 << "SYNOPSIS\n"
                 << "  tsbindc <command> --input <file> [--input <file> ...] [options]\n"
                 << "  tsbindc --help\n"
                 << "  tsbindc <command> --help\n\n"
                 << "DESCRIPTION\n"
                 << "  tsbindc reads JSON declaration trees describing the exported types of a foreign\n"
                 << "  module and translates each tree into ReasonML BuckleScript bindings. Each input\n"
                 << "  holds one root declaration, normally a module or a bare type alias.\n\n"
                 << "COMMANDS\n"
                 << "  ast     Print the parsed declaration tree of every input.\n"
                 << "  print   Print translated bindings to stdout.\n"
                 << "  reason  Write translated bindings as .re files under --out-dir.\n\n"
                 << "OPTIONS\n"
                 << "  --input <file>\n"
                 << "      JSON declaration tree. Repeat to translate several inputs.\n"
                 << "  --out-dir <dir>\n"
                 << "      Output directory root for generated files (reason).\n"
                 << "  --dry-run\n"
                 << "      Translate and plan outputs without writing files (reason).\n"
                 << "  --no-overwrite\n"
                 << "      Fail instead of replacing an existing output file (reason).\n"
                 << "  --hoist-return-unions\n"
                 << "      Also hoist union aliases found in function return types.\n"
                 << "  --help, -h\n"
                 << "      Print this help text. With a command, prints command-focused guidance.\n\n"
                 << "RUN SUMMARY\n"
                 << "  On successful command execution, tsbindc prints a summary to stderr with:\n"
                 << "    - files generated\n"
                 << "    - output root\n"
                 << "    - elapsed wall time\n\n"
                 << "EXAMPLES\n"
                 << "  tsbindc ast --input decls/left-pad.json\n"
                 << "  tsbindc print --input decls/left-pad.json\n"
                 << "  tsbindc reason --input decls/left-pad.json --input decls/chalk.json --out-dir src/bindings\n\n"
                 << "EXIT STATUS\n"
                 << "  0 on success, non-zero on input/translation/write failure or invalid CLI usage.\n";

    if (!selectedCommand.empty() && isKnownCommand(selectedCommand))
    {
        llvm::errs() << "\nCOMMAND FOCUS (" << selectedCommand << ")\n";
        if (selectedCommand == "ast")
        {
            llvm::errs() << "  Emits tree text to stdout. --out-dir is not used.\n";
        }
        else if (selectedCommand == "print")
        {
            llvm::errs() << "  Emits translated bindings to stdout. --out-dir is not used.\n";
        }
        else if (selectedCommand == "reason")
        {
            llvm::errs() << "  Requires --out-dir. Honors --dry-run, --no-overwrite, and --hoist-return-unions.\n";
        }
    }
}

/// @brief Emits collected diagnostics to stderr.
///
/// @param[in] diag Diagnostic engine containing accumulated diagnostics.
void printDiagnostics(const tsbind::DiagnosticEngine& diag)
{
    for (const auto& d : diag.diagnostics())
    {
        llvm::errs() << d.location.str() << ": " << tsbind::diagnosticLevelName(d.level) << ": " << d.message << "\n";
    }
}

std::string resolveOutputRoot(const std::string& root)
{
    if (root.empty())
    {
        return "stdout";
    }
    std::error_code ec;
    const auto      abs = std::filesystem::absolute(root, ec);
    if (!ec)
    {
        return abs.string();
    }
    return root;
}

/// @brief Prints the post-run command summary.
///
/// @param[in] command Executed top-level command.
/// @param[in] outputRoot Resolved output root description.
/// @param[in] generatedFiles Number of generated files.
/// @param[in] elapsed Wall-clock execution duration.
void printRunSummary(llvm::StringRef                           command,
                     llvm::StringRef                           outputRoot,
                     const std::uint64_t                       generatedFiles,
                     const std::chrono::steady_clock::duration elapsed)
{
    const auto elapsedMs         = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    const auto elapsedWholeSec   = elapsedMs / 1000;
    const auto elapsedFractionMs = elapsedMs % 1000;
    llvm::errs() << "Run summary:\n"
                 << "  command: " << command << "\n"
                 << "  output root: " << outputRoot << "\n"
                 << "  files generated: " << generatedFiles << "\n"
                 << "  elapsed: " << elapsedWholeSec << ".";
    if (elapsedFractionMs < 100)
    {
        llvm::errs() << "0";
    }
    if (elapsedFractionMs < 10)
    {
        llvm::errs() << "0";
    }
    llvm::errs() << elapsedFractionMs << "s\n";
}

}  // namespace

/// @brief Program entry point for `tsbindc`.
///
/// @param[in] argc Argument count.
/// @param[in] argv Argument vector.
/// @return Zero on success, non-zero on CLI, input, translation, or write failure.
int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    if (argc < 2)
    {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    if (isHelpToken(command) || command == "help")
    {
        printHelp();
        return 0;
    }
    if (!isKnownCommand(command))
    {
        llvm::errs() << "Unknown command: " << command << "\n";
        printUsage();
        return 1;
    }

    std::vector<std::string>  inputPaths;
    bool                      helpRequested = false;
    tsbind::ReasonEmitOptions emitOptions;

    for (int i = 2; i < argc; ++i)
    {
        const std::string arg          = argv[i];
        auto              requireValue = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc)
            {
                llvm::errs() << "Missing value for " << name << "\n";
                printUsage();
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--input")
        {
            inputPaths.push_back(requireValue(arg));
        }
        else if (isHelpToken(arg))
        {
            helpRequested = true;
        }
        else if (arg == "--out-dir")
        {
            emitOptions.outDir = requireValue(arg);
        }
        else if (arg == "--dry-run")
        {
            emitOptions.writePolicy.dryRun = true;
        }
        else if (arg == "--no-overwrite")
        {
            emitOptions.writePolicy.noOverwrite = true;
        }
        else if (arg == "--hoist-return-unions")
        {
            emitOptions.translate.hoistReturnTypeUnions = true;
        }
        else
        {
            llvm::errs() << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (helpRequested)
    {
        printHelp(command);
        return 0;
    }

    if (inputPaths.empty())
    {
        llvm::errs() << "At least one --input is required\n";
        return 1;
    }

    const auto               startTime = std::chrono::steady_clock::now();
    tsbind::DiagnosticEngine diagnostics;
    auto                     finish = [&](const std::string& outputRoot, const std::uint64_t generatedFiles) -> int {
        printDiagnostics(diagnostics);
        printRunSummary(command, outputRoot, generatedFiles, std::chrono::steady_clock::now() - startTime);
        return diagnostics.hasErrors() ? 1 : 0;
    };

    std::vector<tsbind::TranslationInput> inputs;
    inputs.reserve(inputPaths.size());
    for (const std::string& path : inputPaths)
    {
        auto root = tsbind::loadDeclarationFile(path, diagnostics);
        if (!root)
        {
            llvm::consumeError(root.takeError());
            continue;
        }
        inputs.push_back(tsbind::TranslationInput{path, std::move(*root)});
    }
    if (diagnostics.hasErrors())
    {
        printDiagnostics(diagnostics);
        return 1;
    }

    if (command == "ast")
    {
        for (const auto& input : inputs)
        {
            llvm::outs() << "// " << input.sourcePath << "\n" << tsbind::printDeclaration(*input.root);
        }
        return finish("stdout", 0);
    }

    if (command == "print")
    {
        for (const auto& input : inputs)
        {
            auto artifact = tsbind::translate(*input.root, emitOptions.translate);
            if (!artifact)
            {
                diagnostics.error(tsbind::TreeLocation{input.sourcePath}, llvm::toString(artifact.takeError()));
                continue;
            }
            if (!artifact->has_value())
            {
                diagnostics.note(tsbind::TreeLocation{input.sourcePath},
                                 "top-level declaration is neither a module nor a type alias; nothing emitted");
                continue;
            }
            llvm::outs() << "/* " << tsbind::artifactFileName(**artifact, input.sourcePath) << " */\n"
                         << (*artifact)->text << "\n";
        }
        return finish("stdout", 0);
    }

    if (emitOptions.outDir.empty())
    {
        llvm::errs() << "--out-dir is required for 'reason' command\n";
        return 1;
    }

    std::vector<std::string> generatedFiles;
    emitOptions.writePolicy.recordedOutputs = &generatedFiles;
    if (llvm::Error err = tsbind::emitReason(inputs, emitOptions, diagnostics))
    {
        llvm::errs() << llvm::toString(std::move(err)) << "\n";
        printDiagnostics(diagnostics);
        return 1;
    }

    return finish(resolveOutputRoot(emitOptions.outDir), generatedFiles.size());
}
