//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Text and JSON rendering of run results.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_LINT_REPORT_H
#define TFCHECK_LINT_REPORT_H

#include "tfcheck/Lint/Engine.h"

#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

#include <optional>
#include <string>
#include <vector>

namespace tfcheck::lint
{

/// @brief Output format of a report.
enum class ReportFormat
{
    /// @brief One `path:line: severity: [RULE] message` line per violation.
    Text,

    /// @brief One JSON object with `violations`, `diagnostics` and `summary`.
    Json,
};

/// @brief Parses a `--format` value.
[[nodiscard]] std::optional<ReportFormat> parseReportFormat(const std::string& text);

/// @brief Formats one violation as a text line without terminator.
[[nodiscard]] std::string formatViolation(const Violation& violation);

/// @brief Converts a run result to its JSON report.
[[nodiscard]] llvm::json::Value reportToJson(const LintRunResult& result);

/// @brief Writes a run result in the given format.
void writeReport(const LintRunResult& result, ReportFormat format, llvm::raw_ostream& os);

/// @brief Writes the rule catalogue, one rule per line.
void writeRuleList(const std::vector<RuleDescriptor>& descriptors, llvm::raw_ostream& os);

}  // namespace tfcheck::lint

#endif  // TFCHECK_LINT_REPORT_H
