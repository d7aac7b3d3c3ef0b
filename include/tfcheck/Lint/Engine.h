//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Rule dispatcher: runs the registered rules over discovered sources.
///
/// A run has two phases. Every file is scanned, extracted and checked by the
/// file rules on the worker pool; after the barrier each directory gets a
/// fresh @ref DirectoryIndex and the directory rules run over it. Both
/// streams are merged and ordered deterministically.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_LINT_ENGINE_H
#define TFCHECK_LINT_ENGINE_H

#include "tfcheck/Frontend/SourceFile.h"
#include "tfcheck/Lint/LintConfig.h"
#include "tfcheck/Lint/Registry.h"
#include "tfcheck/Lint/Telemetry.h"
#include "tfcheck/Lint/Violation.h"
#include "tfcheck/Support/Diagnostics.h"

#include "llvm/Support/Error.h"

#include <cstdint>
#include <string>
#include <vector>

namespace tfcheck::lint
{

class VersionOracle;

/// @brief Rejected run configuration.
class ConfigurationError final : public llvm::ErrorInfo<ConfigurationError>
{
public:
    static char ID;

    explicit ConfigurationError(std::string message);

    void log(llvm::raw_ostream& os) const override;

    [[nodiscard]] std::error_code convertToErrorCode() const override;

    /// @brief Returns the description.
    [[nodiscard]] const std::string& description() const
    {
        return message_;
    }

private:
    std::string message_;
};

/// @brief Inputs of one run.
struct LintRunOptions final
{
    /// @brief Files and directories to analyze.
    std::vector<std::string> paths;

    /// @brief Effective configuration.
    LintConfig config;

    /// @brief Provider version oracle; null disables SC.004.
    const VersionOracle* oracle{nullptr};
};

/// @brief Counters of one run.
struct LintRunStats final
{
    std::uint64_t files{0};
    std::uint64_t directories{0};
    std::uint64_t parseFailures{0};
    std::uint64_t ruleInvocations{0};
    std::uint64_t suppressed{0};
    std::uint64_t elapsedMicros{0};
};

/// @brief Outcome of one run.
struct LintRunResult final
{
    /// @brief Ordered violations.
    std::vector<Violation> violations;

    /// @brief Tool failures that are not violations.
    DiagnosticEngine diagnostics;

    /// @brief Run counters.
    LintRunStats stats;

    /// @brief Returns true when any error-severity violation exists.
    [[nodiscard]] bool hasErrorViolations() const;

    /// @brief Returns the number of violations with a given severity.
    [[nodiscard]] std::size_t countBySeverity(Severity severity) const;
};

/// @brief Executes registered rules over Terraform sources.
class LintEngine final
{
public:
    /// @brief Constructs an engine with a rule registry.
    explicit LintEngine(LintRegistry registry = LintRegistry());

    /// @brief Sets the telemetry recorder; may be null.
    void setTelemetry(RunTelemetry* telemetry)
    {
        telemetry_ = telemetry;
    }

    /// @brief Checks category codes and excluded rule IDs against the registry.
    /// @return A @ref ConfigurationError naming the first unknown entry.
    [[nodiscard]] llvm::Error validateConfig(const LintConfig& config) const;

    /// @brief Discovers and analyzes the given paths.
    /// @return Run result, or a @ref ConfigurationError before any file is read.
    [[nodiscard]] llvm::Expected<LintRunResult> run(const LintRunOptions& options) const;

    /// @brief Analyzes already loaded sources.
    /// @param[in] sources Sources; reordered into traversal order.
    /// @param[in] config Effective configuration.
    /// @param[in] oracle Provider version oracle; may be null.
    /// @return Run result, or a @ref ConfigurationError.
    [[nodiscard]] llvm::Expected<LintRunResult> runSources(std::vector<SourceFile> sources,
                                                           const LintConfig&       config,
                                                           const VersionOracle*    oracle = nullptr) const;

    /// @brief Returns descriptors of every registered rule.
    [[nodiscard]] std::vector<RuleDescriptor> descriptors() const
    {
        return registry_.descriptors();
    }

private:
    [[nodiscard]] LintRunResult analyze(std::vector<SourceFile> sources,
                                        const LintConfig&       config,
                                        const VersionOracle*    oracle) const;

    LintRegistry  registry_;
    RunTelemetry* telemetry_{nullptr};
};

}  // namespace tfcheck::lint

#endif  // TFCHECK_LINT_ENGINE_H
