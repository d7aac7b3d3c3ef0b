//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Rule registry and the built-in rule families.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_LINT_REGISTRY_H
#define TFCHECK_LINT_REGISTRY_H

#include "tfcheck/Lint/Rule.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tfcheck::lint
{

/// @brief Factory creating one rule instance.
using LintRuleFactory = std::function<std::unique_ptr<LintRule>()>;

/// @brief Registry of rule factories.
class LintRegistry final
{
public:
    /// @brief Creates a registry with the built-in rules registered.
    LintRegistry();

    /// @brief Creates an empty registry.
    [[nodiscard]] static LintRegistry empty();

    /// @brief Registers one rule factory.
    /// @param[in] factory Factory; ignored when empty.
    void registerRuleFactory(LintRuleFactory factory);

    /// @brief Instantiates every registered rule.
    /// @return Rules sorted by identifier.
    [[nodiscard]] std::vector<std::unique_ptr<LintRule>> createRules() const;

    /// @brief Returns descriptors of every registered rule sorted by identifier.
    [[nodiscard]] std::vector<RuleDescriptor> descriptors() const;

private:
    struct EmptyTag
    {
    };
    explicit LintRegistry(EmptyTag);

    std::vector<LintRuleFactory> factories_;
};

/// @brief Registers ST rules.
void registerStyleRules(LintRegistry& registry);

/// @brief Registers IO rules.
void registerInputOutputRules(LintRegistry& registry);

/// @brief Registers DC rules.
void registerCommentRules(LintRegistry& registry);

/// @brief Registers SC rules.
void registerSafetyRules(LintRegistry& registry);

/// @brief Registers every built-in rule family.
void registerBuiltinRules(LintRegistry& registry);

}  // namespace tfcheck::lint

#endif  // TFCHECK_LINT_REGISTRY_H
