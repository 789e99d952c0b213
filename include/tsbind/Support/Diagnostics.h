//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations for diagnostic reporting interfaces used by the reader, the emitters, and the CLI.
///
//===----------------------------------------------------------------------===//
#ifndef TSBIND_SUPPORT_DIAGNOSTICS_H
#define TSBIND_SUPPORT_DIAGNOSTICS_H

#include "tsbind/Frontend/TreeLocation.h"

#include <string>
#include <vector>

namespace tsbind
{

/// @brief Severity level for a diagnostic message.
enum class DiagnosticLevel
{

    /// @brief Informational note.
    Note,

    /// @brief Non-fatal warning.
    Warning,

    /// @brief Fatal error.
    Error,
};

/// @brief Single diagnostic record produced by the pipeline.
struct Diagnostic
{
    /// @brief Severity level.
    DiagnosticLevel level;

    /// @brief Input location associated with the message.
    TreeLocation location;

    /// @brief Human-readable message text.
    std::string message;
};

/// @brief Accumulates diagnostics emitted across all stages.
class DiagnosticEngine final
{
public:
    /// @brief Appends a diagnostic entry.
    /// @param[in] level Severity level.
    /// @param[in] location Input location associated with the message.
    /// @param[in] message Human-readable message text.
    void report(DiagnosticLevel level, const TreeLocation& location, std::string message);

    /// @brief Emits a note-level diagnostic.
    void note(const TreeLocation& location, std::string message);

    /// @brief Emits a warning-level diagnostic.
    void warning(const TreeLocation& location, std::string message);

    /// @brief Emits an error-level diagnostic.
    void error(const TreeLocation& location, std::string message);

    /// @brief Indicates whether any error diagnostics were recorded.
    /// @return True when at least one error exists.
    [[nodiscard]] bool hasErrors() const;

    /// @brief Returns all recorded diagnostics in insertion order.
    /// @return Immutable diagnostic list.
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const
    {
        return diagnostics_;
    }

private:
    /// @brief Backing storage for collected diagnostics.
    std::vector<Diagnostic> diagnostics_;
};

/// @brief Returns the lowercase label of a diagnostic level.
/// @param[in] level Severity level.
/// @return `note`, `warning`, or `error`.
const char* diagnosticLevelName(DiagnosticLevel level);

}  // namespace tsbind

#endif  // TSBIND_SUPPORT_DIAGNOSTICS_H
