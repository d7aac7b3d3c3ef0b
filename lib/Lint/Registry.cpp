//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements rule registration.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Lint/Registry.h"

#include <algorithm>
#include <utility>

namespace tfcheck::lint
{

void registerBuiltinRules(LintRegistry& registry)
{
    registerStyleRules(registry);
    registerInputOutputRules(registry);
    registerCommentRules(registry);
    registerSafetyRules(registry);
}

LintRegistry::LintRegistry()
{
    registerBuiltinRules(*this);
}

LintRegistry::LintRegistry(EmptyTag)
{
}

LintRegistry LintRegistry::empty()
{
    return LintRegistry(EmptyTag{});
}

void LintRegistry::registerRuleFactory(LintRuleFactory factory)
{
    if (!factory)
    {
        return;
    }
    factories_.push_back(std::move(factory));
}

std::vector<std::unique_ptr<LintRule>> LintRegistry::createRules() const
{
    std::vector<std::unique_ptr<LintRule>> rules;
    rules.reserve(factories_.size());
    for (const LintRuleFactory& factory : factories_)
    {
        std::unique_ptr<LintRule> rule = factory();
        if (!rule)
        {
            continue;
        }
        rules.push_back(std::move(rule));
    }
    std::stable_sort(rules.begin(),
                     rules.end(),
                     [](const std::unique_ptr<LintRule>& lhs, const std::unique_ptr<LintRule>& rhs) {
                         return lhs->id() < rhs->id();
                     });
    return rules;
}

std::vector<RuleDescriptor> LintRegistry::descriptors() const
{
    std::vector<RuleDescriptor> out;
    for (const std::unique_ptr<LintRule>& rule : createRules())
    {
        out.push_back(rule->descriptor());
    }
    return out;
}

}  // namespace tfcheck::lint
