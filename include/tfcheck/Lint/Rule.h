//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Lint rule contract, rule metadata, and the reporting log.
///
/// Every rule implements @ref LintRule. A rule sees either one document or
/// one directory and reports through a @ref RuleLog, which is the only side
/// effect available to it.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_LINT_RULE_H
#define TFCHECK_LINT_RULE_H

#include "tfcheck/Lint/Document.h"
#include "tfcheck/Lint/LintConfig.h"
#include "tfcheck/Lint/Violation.h"

#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace tfcheck::lint
{

class DirectoryIndex;
class VersionOracle;

/// @brief Granularity a rule operates on.
enum class RuleScope
{
    /// @brief One document at a time.
    File,

    /// @brief All documents of one directory at once.
    Directory,
};

/// @brief Static metadata of one rule.
struct RuleDescriptor final
{
    /// @brief Rule identifier such as `ST.001`.
    std::string id;

    /// @brief Rule category.
    RuleCategory category{RuleCategory::Style};

    /// @brief One-line rule title.
    std::string name;

    /// @brief Severity of violations.
    Severity severity{Severity::Error};

    /// @brief Operating granularity.
    RuleScope scope{RuleScope::File};

    /// @brief True when the rule needs a parsed block tree.
    bool structural{true};
};

/// @brief Inputs available to a rule invocation.
struct RuleContext final
{
    /// @brief Document under analysis; set for file-scoped rules.
    const LintDocument* document{nullptr};

    /// @brief Directory under analysis; set for directory-scoped rules.
    const DirectoryIndex* directory{nullptr};

    /// @brief Run configuration.
    const LintConfig* config{nullptr};

    /// @brief Provider version oracle; may be null.
    const VersionOracle* oracle{nullptr};
};

/// @brief Looks up the suppression map of a file by path.
using SuppressionLookup = std::function<const SuppressionMap*(const std::string& filePath)>;

/// @brief Reporting channel of one rule invocation.
///
/// Each report is checked against the suppression map of the file it is
/// attributed to and dropped when suppressed; a repeated (file, line) report
/// of the same invocation is dropped as well.
class RuleLog final
{
public:
    /// @brief Creates a log for one rule invocation.
    /// @param[in] descriptor Rule metadata.
    /// @param[in] defaultFile Path used by the single-file overload.
    /// @param[in] suppressions Suppression lookup.
    RuleLog(const RuleDescriptor& descriptor, std::string defaultFile, SuppressionLookup suppressions);

    /// @brief Reports a violation in the default file.
    void report(std::uint32_t line, std::string message);

    /// @brief Reports a violation in a given file.
    void report(const std::string& filePath, std::uint32_t line, std::string message);

    /// @brief Reports a violation with an explicit severity.
    void report(const std::string& filePath, std::uint32_t line, std::string message, Severity severity);

    /// @brief Returns the accepted violations in report order.
    [[nodiscard]] const std::vector<Violation>& violations() const
    {
        return violations_;
    }

    /// @brief Moves the accepted violations out.
    [[nodiscard]] std::vector<Violation> takeViolations();

    /// @brief Returns the number of reports dropped by suppression.
    [[nodiscard]] std::uint32_t suppressedCount() const
    {
        return suppressedCount_;
    }

private:
    const RuleDescriptor&                              descriptor_;
    std::string                                        defaultFile_;
    SuppressionLookup                                  suppressions_;
    std::vector<Violation>                             violations_;
    std::set<std::tuple<std::string, std::uint32_t>>   reported_;
    std::uint32_t                                      suppressedCount_{0};
};

/// @brief Interface implemented by one lint rule.
class LintRule
{
public:
    virtual ~LintRule() = default;

    /// @brief Returns the rule metadata.
    [[nodiscard]] virtual const RuleDescriptor& descriptor() const = 0;

    /// @brief Returns the stable rule identifier.
    [[nodiscard]] const std::string& id() const
    {
        return descriptor().id;
    }

    /// @brief Executes the rule.
    /// @param[in] context Document or directory under analysis.
    /// @param[in,out] log Reporting channel.
    virtual void check(const RuleContext& context, RuleLog& log) const = 0;
};

/// @brief Rule base that stores its descriptor.
class DescribedRule : public LintRule
{
public:
    [[nodiscard]] const RuleDescriptor& descriptor() const override
    {
        return descriptor_;
    }

protected:
    explicit DescribedRule(RuleDescriptor descriptor)
        : descriptor_(std::move(descriptor))
    {
    }

private:
    RuleDescriptor descriptor_;
};

}  // namespace tfcheck::lint

#endif  // TFCHECK_LINT_RULE_H
