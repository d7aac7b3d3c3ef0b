//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Run telemetry aggregation and sink integration.
///
/// The engine records run events here; an optional sink receives each event
/// as it happens, for progress output and tests.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_LINT_TELEMETRY_H
#define TFCHECK_LINT_TELEMETRY_H

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace tfcheck::lint
{

/// @brief Kind of one run event.
enum class RunEventKind
{
    /// @brief Discovery finished; `count` is the number of files.
    FilesDiscovered,

    /// @brief One file finished its per-file phase; `count` is its violation count.
    FileAnalyzed,

    /// @brief One directory finished its cross-file phase.
    DirectoryAnalyzed,

    /// @brief Totals of one rule after the run; `count` is its violation count.
    RuleSummary,

    /// @brief The run finished; `count` is the total violation count.
    RunFinished,
};

/// @brief Immutable telemetry sample.
struct RunEvent final
{
    /// @brief Event kind.
    RunEventKind kind{RunEventKind::FilesDiscovered};

    /// @brief File path, directory path, or rule ID the event is about.
    std::string subject;

    /// @brief Event-specific count.
    std::uint64_t count{0};

    /// @brief Elapsed time in microseconds.
    std::uint64_t elapsedMicros{0};
};

/// @brief Sink callback invoked for each event.
using RunEventSink = std::function<void(const RunEvent&)>;

/// @brief Returns a stable lowercase name of an event kind.
[[nodiscard]] const char* runEventKindName(RunEventKind kind);

/// @brief Thread-safe run telemetry recorder.
class RunTelemetry final
{
public:
    /// @brief Sets the sink callback for newly recorded events.
    /// @param[in] sink Sink callback. Empty sink disables forwarding.
    void setSink(RunEventSink sink);

    /// @brief Records one event.
    void record(RunEventKind kind, std::string subject, std::uint64_t count, std::uint64_t elapsedMicros);

    /// @brief Adds the outcome of one rule invocation to the per-rule totals.
    void recordRuleExecution(const std::string& ruleId, std::uint64_t violations);

    /// @brief Returns the number of recorded events of one kind.
    [[nodiscard]] std::uint64_t eventCount(RunEventKind kind) const;

    /// @brief Returns the number of invocations recorded for a rule.
    [[nodiscard]] std::uint64_t ruleExecutions(std::string_view ruleId) const;

    /// @brief Returns the number of violations recorded for a rule.
    [[nodiscard]] std::uint64_t ruleViolations(std::string_view ruleId) const;

    /// @brief Emits one `RuleSummary` event per executed rule in rule ID order.
    void flushRuleSummaries();

private:
    struct RuleTotals final
    {
        std::uint64_t executions{0};
        std::uint64_t violations{0};
    };

    mutable std::mutex                         mutex_;
    RunEventSink                               sink_;
    std::map<RunEventKind, std::uint64_t>      eventCounts_;
    std::map<std::string, RuleTotals, std::less<>> ruleTotals_;
};

}  // namespace tfcheck::lint

#endif  // TFCHECK_LINT_TELEMETRY_H
