//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements tool diagnostic collection.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Support/Diagnostics.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace tfcheck
{

const char* diagnosticLevelName(const DiagnosticLevel level)
{
    switch (level)
    {
    case DiagnosticLevel::Note:
        return "note";
    case DiagnosticLevel::Warning:
        return "warning";
    case DiagnosticLevel::Error:
        return "error";
    }
    return "error";
}

void DiagnosticEngine::report(DiagnosticLevel level, const SourceLocation& location, std::string message)
{
    diagnostics_.push_back(Diagnostic{level, location, std::move(message)});
}

void DiagnosticEngine::note(const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Note, location, std::move(message));
}

void DiagnosticEngine::warning(const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Warning, location, std::move(message));
}

void DiagnosticEngine::error(const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Error, location, std::move(message));
}

void DiagnosticEngine::append(DiagnosticEngine&& other)
{
    diagnostics_.insert(diagnostics_.end(),
                        std::make_move_iterator(other.diagnostics_.begin()),
                        std::make_move_iterator(other.diagnostics_.end()));
    other.diagnostics_.clear();
}

bool DiagnosticEngine::hasErrors() const
{
    return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic& d) {
        return d.level == DiagnosticLevel::Error;
    });
}

}  // namespace tfcheck
