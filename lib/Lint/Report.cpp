//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements text and JSON report rendering.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Lint/Report.h"

#include "llvm/Support/FormatVariadic.h"

#include <cstdint>
#include <utility>

namespace tfcheck::lint
{
namespace
{

llvm::json::Object violationToJson(const Violation& violation)
{
    return llvm::json::Object{
        {"file", violation.filePath},
        {"line", static_cast<std::int64_t>(violation.line)},
        {"rule", violation.ruleId},
        {"category", categoryCode(violation.category)},
        {"severity", severityName(violation.severity)},
        {"message", violation.message},
    };
}

llvm::json::Object diagnosticToJson(const Diagnostic& diagnostic)
{
    return llvm::json::Object{
        {"level", diagnosticLevelName(diagnostic.level)},
        {"location", diagnostic.location.str()},
        {"message", diagnostic.message},
    };
}

const char* scopeName(const RuleScope scope)
{
    return scope == RuleScope::File ? "file" : "directory";
}

}  // namespace

std::optional<ReportFormat> parseReportFormat(const std::string& text)
{
    if (text == "text")
    {
        return ReportFormat::Text;
    }
    if (text == "json")
    {
        return ReportFormat::Json;
    }
    return std::nullopt;
}

std::string formatViolation(const Violation& violation)
{
    return llvm::formatv("{0}:{1}: {2}: [{3}] {4}",
                         violation.filePath,
                         violation.line,
                         severityName(violation.severity),
                         violation.ruleId,
                         violation.message)
        .str();
}

llvm::json::Value reportToJson(const LintRunResult& result)
{
    llvm::json::Array violations;
    for (const Violation& violation : result.violations)
    {
        violations.push_back(violationToJson(violation));
    }
    llvm::json::Array diagnostics;
    for (const Diagnostic& diagnostic : result.diagnostics.diagnostics())
    {
        diagnostics.push_back(diagnosticToJson(diagnostic));
    }
    return llvm::json::Object{
        {"violations", std::move(violations)},
        {"diagnostics", std::move(diagnostics)},
        {"summary",
         llvm::json::Object{
             {"files", static_cast<std::int64_t>(result.stats.files)},
             {"directories", static_cast<std::int64_t>(result.stats.directories)},
             {"errors", static_cast<std::int64_t>(result.countBySeverity(Severity::Error))},
             {"warnings", static_cast<std::int64_t>(result.countBySeverity(Severity::Warning))},
             {"suppressed", static_cast<std::int64_t>(result.stats.suppressed)},
             {"parseFailures", static_cast<std::int64_t>(result.stats.parseFailures)},
         }},
    };
}

void writeReport(const LintRunResult& result, const ReportFormat format, llvm::raw_ostream& os)
{
    if (format == ReportFormat::Json)
    {
        os << llvm::formatv("{0:2}", reportToJson(result)) << "\n";
        return;
    }
    for (const Violation& violation : result.violations)
    {
        os << formatViolation(violation) << "\n";
    }
    for (const Diagnostic& diagnostic : result.diagnostics.diagnostics())
    {
        os << diagnostic.location.str() << ": " << diagnosticLevelName(diagnostic.level) << ": " << diagnostic.message
           << "\n";
    }
    os << llvm::formatv("{0} error(s), {1} warning(s) in {2} file(s)\n",
                        result.countBySeverity(Severity::Error),
                        result.countBySeverity(Severity::Warning),
                        result.stats.files);
}

void writeRuleList(const std::vector<RuleDescriptor>& descriptors, llvm::raw_ostream& os)
{
    for (const RuleDescriptor& descriptor : descriptors)
    {
        os << llvm::formatv("{0,-7} {1,-8} {2,-10} {3}\n",
                            descriptor.id,
                            severityName(descriptor.severity),
                            scopeName(descriptor.scope),
                            descriptor.name);
    }
}

}  // namespace tfcheck::lint
