//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the rule reporting log.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Lint/Rule.h"

#include <utility>

namespace tfcheck::lint
{

RuleLog::RuleLog(const RuleDescriptor& descriptor, std::string defaultFile, SuppressionLookup suppressions)
    : descriptor_(descriptor)
    , defaultFile_(std::move(defaultFile))
    , suppressions_(std::move(suppressions))
{
}

void RuleLog::report(const std::uint32_t line, std::string message)
{
    report(defaultFile_, line, std::move(message), descriptor_.severity);
}

void RuleLog::report(const std::string& filePath, const std::uint32_t line, std::string message)
{
    report(filePath, line, std::move(message), descriptor_.severity);
}

void RuleLog::report(const std::string& filePath,
                     const std::uint32_t line,
                     std::string        message,
                     const Severity     severity)
{
    if (suppressions_)
    {
        const SuppressionMap* map = suppressions_(filePath);
        if (map != nullptr && map->isSuppressed(descriptor_.id, line))
        {
            ++suppressedCount_;
            return;
        }
    }
    if (!reported_.emplace(filePath, line).second)
    {
        return;
    }
    violations_.push_back(
        Violation{filePath, descriptor_.id, descriptor_.category, severity, std::move(message), line});
}

std::vector<Violation> RuleLog::takeViolations()
{
    std::vector<Violation> out = std::move(violations_);
    violations_.clear();
    return out;
}

}  // namespace tfcheck::lint
