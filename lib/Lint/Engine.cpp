//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the two-phase rule dispatcher.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Lint/Engine.h"

#include "tfcheck/Frontend/Discovery.h"
#include "tfcheck/Lint/DirectoryIndex.h"
#include "tfcheck/Lint/Document.h"
#include "tfcheck/Support/WorkerPool.h"

#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <limits>
#include <memory>
#include <set>
#include <tuple>
#include <unordered_map>
#include <utility>

namespace tfcheck::lint
{

char ConfigurationError::ID = 0;

ConfigurationError::ConfigurationError(std::string message)
    : message_(std::move(message))
{
}

void ConfigurationError::log(llvm::raw_ostream& os) const
{
    os << "configuration error: " << message_;
}

std::error_code ConfigurationError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

bool LintRunResult::hasErrorViolations() const
{
    return countBySeverity(Severity::Error) > 0;
}

std::size_t LintRunResult::countBySeverity(const Severity severity) const
{
    return static_cast<std::size_t>(std::count_if(violations.begin(), violations.end(), [severity](const Violation& v) {
        return v.severity == severity;
    }));
}

namespace
{

using Clock = std::chrono::steady_clock;

std::uint64_t elapsedMicros(const Clock::time_point start)
{
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count());
}

bool isSelected(const RuleDescriptor& descriptor, const LintConfig& config)
{
    if (std::find(config.excludedRules.begin(), config.excludedRules.end(), descriptor.id) != config.excludedRules.end())
    {
        return false;
    }
    if (config.categories.empty())
    {
        return true;
    }
    return std::any_of(config.categories.begin(), config.categories.end(), [&descriptor](const std::string& code) {
        const auto category = parseCategoryCode(code);
        return category && *category == descriptor.category;
    });
}

/// Per-task output; each task owns exactly one slot.
struct ResultSlot final
{
    std::vector<Violation> violations;
    DiagnosticEngine       diagnostics;
    std::uint64_t          invocations{0};
    std::uint64_t          suppressed{0};
};

struct DirectoryGroup final
{
    std::string                      path;
    std::vector<const LintDocument*> documents;
};

void invokeRule(const LintRule&    rule,
                const RuleContext& context,
                RuleLog&           log,
                const std::string& subject,
                RunTelemetry*      telemetry,
                ResultSlot&        slot)
{
    try
    {
        rule.check(context, log);
    }
    catch (const std::exception& ex)
    {
        slot.diagnostics.error({subject, 1, 1}, "rule " + rule.id() + " failed: " + ex.what());
    }
    ++slot.invocations;
    slot.suppressed += log.suppressedCount();
    std::vector<Violation> emitted = log.takeViolations();
    if (telemetry != nullptr)
    {
        telemetry->recordRuleExecution(rule.id(), emitted.size());
    }
    slot.violations.insert(slot.violations.end(),
                           std::make_move_iterator(emitted.begin()),
                           std::make_move_iterator(emitted.end()));
}

void analyzeDocument(const LintDocument&                 document,
                     const std::vector<const LintRule*>& rules,
                     const LintConfig&                   config,
                     const VersionOracle*                oracle,
                     RunTelemetry*                       telemetry,
                     ResultSlot&                         slot)
{
    const std::string& path = document.source.path;
    if (document.parseFailure)
    {
        slot.violations.push_back(Violation{path,
                                            kSystemRuleId,
                                            RuleCategory::System,
                                            Severity::Error,
                                            "Failed to parse file: " + document.parseFailure->message,
                                            document.parseFailure->line});
    }

    const SuppressionLookup lookup = [&document](const std::string& filePath) -> const SuppressionMap* {
        return filePath == document.source.path ? &document.suppressions : nullptr;
    };
    const RuleContext context{&document, nullptr, &config, oracle};
    for (const LintRule* rule : rules)
    {
        if (rule->descriptor().structural && !document.isParsed())
        {
            continue;
        }
        RuleLog log(rule->descriptor(), path, lookup);
        invokeRule(*rule, context, log, path, telemetry, slot);
    }
}

void analyzeDirectory(const DirectoryGroup&               group,
                      const std::vector<const LintRule*>& rules,
                      const LintConfig&                   config,
                      const VersionOracle*                oracle,
                      RunTelemetry*                       telemetry,
                      ResultSlot&                         slot)
{
    const DirectoryIndex index = DirectoryIndex::build(group.path, group.documents);

    std::unordered_map<std::string, const SuppressionMap*> suppressions;
    for (const LintDocument* document : group.documents)
    {
        suppressions.emplace(document->source.path, &document->suppressions);
    }
    const SuppressionLookup lookup = [&suppressions](const std::string& filePath) -> const SuppressionMap* {
        const auto it = suppressions.find(filePath);
        return it == suppressions.end() ? nullptr : it->second;
    };

    const RuleContext context{nullptr, &index, &config, oracle};
    for (const LintRule* rule : rules)
    {
        RuleLog log(rule->descriptor(), group.path, lookup);
        invokeRule(*rule, context, log, group.path, telemetry, slot);
    }
}

std::vector<DirectoryGroup> groupByDirectory(const std::vector<LintDocument>& documents)
{
    std::vector<DirectoryGroup> groups;
    for (const LintDocument& document : documents)
    {
        if (groups.empty() || groups.back().path != document.source.directory)
        {
            groups.push_back(DirectoryGroup{document.source.directory, {}});
        }
        groups.back().documents.push_back(&document);
    }
    return groups;
}

/// Orders violations by directory, then directory findings before file findings,
/// then file traversal order, line, and rule ID.
void sortViolations(std::vector<Violation>& violations, const std::vector<DirectoryGroup>& groups)
{
    using Key = std::tuple<std::size_t, int, std::size_t>;
    std::unordered_map<std::string, Key> keys;
    for (std::size_t rank = 0; rank < groups.size(); ++rank)
    {
        keys.emplace(groups[rank].path, Key{rank, 0, 0});
        for (const LintDocument* document : groups[rank].documents)
        {
            keys[document->source.path] = Key{rank, 1, document->order};
        }
    }
    const Key unknown{std::numeric_limits<std::size_t>::max(), 0, 0};
    const auto keyOf = [&keys, &unknown](const Violation& violation) {
        const auto it = keys.find(violation.filePath);
        return it == keys.end() ? unknown : it->second;
    };
    std::stable_sort(violations.begin(), violations.end(), [&keyOf](const Violation& lhs, const Violation& rhs) {
        return std::make_tuple(keyOf(lhs), lhs.line, std::cref(lhs.ruleId)) <
               std::make_tuple(keyOf(rhs), rhs.line, std::cref(rhs.ruleId));
    });
}

void mergeSlot(ResultSlot& slot, LintRunResult& result)
{
    result.violations.insert(result.violations.end(),
                             std::make_move_iterator(slot.violations.begin()),
                             std::make_move_iterator(slot.violations.end()));
    result.diagnostics.append(std::move(slot.diagnostics));
    result.stats.ruleInvocations += slot.invocations;
    result.stats.suppressed += slot.suppressed;
}

void drainPool(WorkerPool& pool, DiagnosticEngine& diagnostics)
{
    for (const std::string& failure : pool.wait())
    {
        diagnostics.error({"<worker>", 1, 1}, "analysis task failed: " + failure);
    }
}

}  // namespace

LintEngine::LintEngine(LintRegistry registry)
    : registry_(std::move(registry))
{
}

llvm::Error LintEngine::validateConfig(const LintConfig& config) const
{
    for (const std::string& code : config.categories)
    {
        const auto category = parseCategoryCode(code);
        if (!category || *category == RuleCategory::System)
        {
            return llvm::make_error<ConfigurationError>("unknown rule category '" + code + "'");
        }
    }
    std::set<std::string> known;
    for (const RuleDescriptor& descriptor : registry_.descriptors())
    {
        known.insert(descriptor.id);
    }
    for (const std::string& id : config.excludedRules)
    {
        if (known.count(id) == 0U)
        {
            return llvm::make_error<ConfigurationError>("unknown rule id '" + id + "'");
        }
    }
    return llvm::Error::success();
}

llvm::Expected<LintRunResult> LintEngine::run(const LintRunOptions& options) const
{
    if (llvm::Error err = validateConfig(options.config))
    {
        return std::move(err);
    }
    DiagnosticEngine        discovery;
    std::vector<SourceFile> sources = discoverSources(options.paths, options.config.discovery, discovery);
    LintRunResult           result  = analyze(std::move(sources), options.config, options.oracle);
    discovery.append(std::move(result.diagnostics));
    result.diagnostics = std::move(discovery);
    return result;
}

llvm::Expected<LintRunResult> LintEngine::runSources(std::vector<SourceFile> sources,
                                                     const LintConfig&       config,
                                                     const VersionOracle*    oracle) const
{
    if (llvm::Error err = validateConfig(config))
    {
        return std::move(err);
    }
    return analyze(std::move(sources), config, oracle);
}

LintRunResult LintEngine::analyze(std::vector<SourceFile> sources,
                                  const LintConfig&       config,
                                  const VersionOracle*    oracle) const
{
    const Clock::time_point start = Clock::now();
    sortInTraversalOrder(sources);

    LintRunResult result;
    result.stats.files = sources.size();
    if (telemetry_ != nullptr)
    {
        telemetry_->record(RunEventKind::FilesDiscovered, "", sources.size(), elapsedMicros(start));
    }

    const std::vector<std::unique_ptr<LintRule>> rules = registry_.createRules();
    std::vector<const LintRule*>                 fileRules;
    std::vector<const LintRule*>                 directoryRules;
    for (const std::unique_ptr<LintRule>& rule : rules)
    {
        if (!isSelected(rule->descriptor(), config))
        {
            continue;
        }
        (rule->descriptor().scope == RuleScope::File ? fileRules : directoryRules).push_back(rule.get());
    }

    WorkerPool pool(config.jobs);

    std::vector<LintDocument> documents(sources.size());
    std::vector<ResultSlot>   fileSlots(sources.size());
    for (std::size_t i = 0; i < sources.size(); ++i)
    {
        const bool accepted = pool.submit([&, i]() {
            const Clock::time_point fileStart = Clock::now();
            documents[i]                      = buildLintDocument(std::move(sources[i]), i);
            analyzeDocument(documents[i], fileRules, config, oracle, telemetry_, fileSlots[i]);
            if (telemetry_ != nullptr)
            {
                telemetry_->record(RunEventKind::FileAnalyzed,
                                   documents[i].source.path,
                                   fileSlots[i].violations.size(),
                                   elapsedMicros(fileStart));
            }
        });
        if (!accepted)
        {
            result.diagnostics.error({sources[i].path, 1, 1}, "worker pool rejected file analysis task");
        }
    }
    drainPool(pool, result.diagnostics);

    for (const LintDocument& document : documents)
    {
        if (document.parseFailure)
        {
            ++result.stats.parseFailures;
        }
    }

    const std::vector<DirectoryGroup> groups = groupByDirectory(documents);
    result.stats.directories                 = groups.size();
    std::vector<ResultSlot> directorySlots(groups.size());
    for (std::size_t i = 0; i < groups.size(); ++i)
    {
        const bool accepted = pool.submit([&, i]() {
            const Clock::time_point directoryStart = Clock::now();
            analyzeDirectory(groups[i], directoryRules, config, oracle, telemetry_, directorySlots[i]);
            if (telemetry_ != nullptr)
            {
                telemetry_->record(RunEventKind::DirectoryAnalyzed,
                                   groups[i].path,
                                   directorySlots[i].violations.size(),
                                   elapsedMicros(directoryStart));
            }
        });
        if (!accepted)
        {
            result.diagnostics.error({groups[i].path, 1, 1}, "worker pool rejected directory analysis task");
        }
    }
    drainPool(pool, result.diagnostics);

    for (ResultSlot& slot : fileSlots)
    {
        mergeSlot(slot, result);
    }
    for (ResultSlot& slot : directorySlots)
    {
        mergeSlot(slot, result);
    }
    sortViolations(result.violations, groups);

    result.stats.elapsedMicros = elapsedMicros(start);
    if (telemetry_ != nullptr)
    {
        telemetry_->flushRuleSummaries();
        telemetry_->record(RunEventKind::RunFinished, "", result.violations.size(), result.stats.elapsedMicros);
    }
    return result;
}

}  // namespace tfcheck::lint
