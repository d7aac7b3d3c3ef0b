//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements run telemetry recording and sink forwarding.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Lint/Telemetry.h"

#include <utility>
#include <vector>

namespace tfcheck::lint
{

const char* runEventKindName(const RunEventKind kind)
{
    switch (kind)
    {
    case RunEventKind::FilesDiscovered:
        return "files-discovered";
    case RunEventKind::FileAnalyzed:
        return "file-analyzed";
    case RunEventKind::DirectoryAnalyzed:
        return "directory-analyzed";
    case RunEventKind::RuleSummary:
        return "rule-summary";
    case RunEventKind::RunFinished:
        return "run-finished";
    }
    return "unknown";
}

void RunTelemetry::setSink(RunEventSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void RunTelemetry::record(const RunEventKind  kind,
                          std::string         subject,
                          const std::uint64_t count,
                          const std::uint64_t elapsedMicros)
{
    RunEventSink sink;
    RunEvent     event{kind, std::move(subject), count, elapsedMicros};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++eventCounts_[kind];
        sink = sink_;
    }
    if (sink)
    {
        sink(event);
    }
}

void RunTelemetry::recordRuleExecution(const std::string& ruleId, const std::uint64_t violations)
{
    std::lock_guard<std::mutex> lock(mutex_);
    RuleTotals&                 totals = ruleTotals_[ruleId];
    ++totals.executions;
    totals.violations += violations;
}

std::uint64_t RunTelemetry::eventCount(const RunEventKind kind) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = eventCounts_.find(kind);
    return it == eventCounts_.end() ? 0U : it->second;
}

std::uint64_t RunTelemetry::ruleExecutions(const std::string_view ruleId) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = ruleTotals_.find(ruleId);
    return it == ruleTotals_.end() ? 0U : it->second.executions;
}

std::uint64_t RunTelemetry::ruleViolations(const std::string_view ruleId) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = ruleTotals_.find(ruleId);
    return it == ruleTotals_.end() ? 0U : it->second.violations;
}

void RunTelemetry::flushRuleSummaries()
{
    std::vector<std::pair<std::string, std::uint64_t>> totals;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [ruleId, ruleTotals] : ruleTotals_)
        {
            totals.emplace_back(ruleId, ruleTotals.violations);
        }
    }
    for (auto& [ruleId, violations] : totals)
    {
        record(RunEventKind::RuleSummary, std::move(ruleId), violations, 0);
    }
}

}  // namespace tfcheck::lint
