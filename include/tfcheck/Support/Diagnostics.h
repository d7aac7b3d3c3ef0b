//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations for tool diagnostics reported outside the lint violation stream.
///
/// Discovery failures, unreadable files, and rule execution failures are
/// recorded here so that they never masquerade as lint findings.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_SUPPORT_DIAGNOSTICS_H
#define TFCHECK_SUPPORT_DIAGNOSTICS_H

#include "tfcheck/Frontend/SourceLocation.h"

#include <string>
#include <vector>

namespace tfcheck
{

/// @brief Severity level for a diagnostic message.
enum class DiagnosticLevel
{

    /// @brief Informational note.
    Note,

    /// @brief Non-fatal warning.
    Warning,

    /// @brief Failure of one unit of work.
    Error,
};

/// @brief Single diagnostic record produced by the tool.
struct Diagnostic
{
    /// @brief Severity level.
    DiagnosticLevel level;

    /// @brief Source location associated with the message.
    SourceLocation location;

    /// @brief Human-readable message text.
    std::string message;
};

/// @brief Returns the lowercase spelling of a diagnostic level.
/// @param[in] level Diagnostic level.
/// @return `note`, `warning` or `error`.
[[nodiscard]] const char* diagnosticLevelName(DiagnosticLevel level);

/// @brief Accumulates diagnostics emitted across discovery and rule execution.
class DiagnosticEngine final
{
public:
    /// @brief Appends a diagnostic entry.
    /// @param[in] level Severity level.
    /// @param[in] location Source location associated with the message.
    /// @param[in] message Human-readable message text.
    void report(DiagnosticLevel level, const SourceLocation& location, std::string message);

    /// @brief Emits a note-level diagnostic.
    void note(const SourceLocation& location, std::string message);

    /// @brief Emits a warning-level diagnostic.
    void warning(const SourceLocation& location, std::string message);

    /// @brief Emits an error-level diagnostic.
    void error(const SourceLocation& location, std::string message);

    /// @brief Moves all diagnostics of another engine into this one.
    /// @param[in] other Engine drained by this call.
    void append(DiagnosticEngine&& other);

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

}  // namespace tfcheck

#endif  // TFCHECK_SUPPORT_DIAGNOSTICS_H
