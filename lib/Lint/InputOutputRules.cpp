//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the IO rule family.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Lint/DirectoryIndex.h"
#include "tfcheck/Lint/FormattingFacts.h"
#include "tfcheck/Lint/Registry.h"

#include <memory>
#include <set>
#include <string>
#include <utility>

namespace tfcheck::lint
{
namespace
{

bool isEmptyStringLiteral(const std::string& value)
{
    return value == "\"\"" || value == "''";
}

class VariableFileLocationRule final : public DescribedRule
{
public:
    VariableFileLocationRule()
        : DescribedRule({"IO.001",
                         RuleCategory::InputOutput,
                         "Variables are defined in the variables file",
                         Severity::Error,
                         RuleScope::Directory})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const std::string& expected = context.config->files.variables;
        for (const VariableDefinition& definition : context.directory->variables())
        {
            const std::string& fileName = definition.document->source.fileName;
            if (fileName == expected)
            {
                continue;
            }
            log.report(definition.document->source.path,
                       definition.line,
                       "Variable '" + definition.name + "' should be defined in " + expected + ", not in " + fileName);
        }
    }
};

class OutputFileLocationRule final : public DescribedRule
{
public:
    OutputFileLocationRule()
        : DescribedRule({"IO.002",
                         RuleCategory::InputOutput,
                         "Outputs are defined in the outputs file",
                         Severity::Error,
                         RuleScope::Directory})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const std::string& expected = context.config->files.outputs;
        for (const LintDocument* document : context.directory->documents())
        {
            if (!document->root || document->isVariableValues() || document->source.fileName == expected)
            {
                continue;
            }
            for (const Block& block : document->root->children)
            {
                if (block.kind != BlockKind::Output || !block.typeLabel)
                {
                    continue;
                }
                log.report(document->source.path,
                           block.startLine,
                           "Output '" + block.typeLabel->text + "' should be defined in " + expected + ", not in " +
                               document->source.fileName);
            }
        }
    }
};

class RequiredVariableValueRule final : public DescribedRule
{
public:
    RequiredVariableValueRule()
        : DescribedRule({"IO.003",
                         RuleCategory::InputOutput,
                         "Required variables are declared in the variable values file",
                         Severity::Error,
                         RuleScope::Directory})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const LintConfig&           config   = *context.config;
        const std::set<std::string> declared = context.directory->valueFileKeys(config.files.tfvars);
        for (const VariableDefinition& definition : context.directory->variables())
        {
            if (definition.hasDefault || config.isAllowListed(definition.name) || declared.count(definition.name) != 0U)
            {
                continue;
            }
            log.report(definition.document->source.path,
                       definition.line,
                       "Required variable '" + definition.name + "' used and must be declared in " +
                           config.files.tfvars);
        }
    }
};

/// Shared check for variable and output names.
class BlockNamingRule final : public DescribedRule
{
public:
    BlockNamingRule(RuleDescriptor descriptor, const BlockKind kind, std::string noun)
        : DescribedRule(std::move(descriptor))
        , kind_(kind)
        , noun_(std::move(noun))
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        for (const Block& block : context.document->root->children)
        {
            if (block.kind != kind_ || !block.typeLabel || isSnakeCaseIdentifier(block.typeLabel->text))
            {
                continue;
            }
            log.report(block.startLine,
                       noun_ + " '" + block.typeLabel->text +
                           "' should use snake_case naming convention (lowercase letters, digits and underscores, "
                           "starting with a letter)");
        }
    }

private:
    BlockKind   kind_;
    std::string noun_;
};

/// Shared check for variable and output descriptions.
class DescriptionRule final : public DescribedRule
{
public:
    DescriptionRule(RuleDescriptor descriptor, const BlockKind kind, std::string noun)
        : DescribedRule(std::move(descriptor))
        , kind_(kind)
        , noun_(std::move(noun))
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        for (const Block& block : context.document->root->children)
        {
            if (block.kind != kind_ || !block.typeLabel)
            {
                continue;
            }
            const Parameter* description = block.findParameter("description");
            if (description == nullptr)
            {
                log.report(block.startLine, noun_ + " '" + block.typeLabel->text + "' must include a description field");
            }
            else if (isEmptyStringLiteral(description->value))
            {
                log.report(block.startLine,
                           noun_ + " '" + block.typeLabel->text + "' has an empty description field");
            }
        }
    }

private:
    BlockKind   kind_;
    std::string noun_;
};

class VariableTypeRule final : public DescribedRule
{
public:
    VariableTypeRule()
        : DescribedRule({"IO.008", RuleCategory::InputOutput, "Variables declare a type"})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        for (const Block& block : context.document->root->children)
        {
            if (block.kind == BlockKind::Variable && block.typeLabel && block.findParameter("type") == nullptr)
            {
                log.report(block.startLine, "Variable '" + block.typeLabel->text + "' must include a type field");
            }
        }
    }
};

class UnusedVariableRule final : public DescribedRule
{
public:
    UnusedVariableRule()
        : DescribedRule({"IO.009",
                         RuleCategory::InputOutput,
                         "Defined variables are referenced",
                         Severity::Warning,
                         RuleScope::Directory})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const DirectoryIndex& index = *context.directory;
        for (const VariableDefinition& definition : index.variables())
        {
            if (context.config->isAllowListed(definition.name) || index.referenceCount(definition.name) != 0U)
            {
                continue;
            }
            log.report(definition.document->source.path,
                       definition.line,
                       "Variable '" + definition.name + "' is defined but never used");
        }
    }
};

}  // namespace

void registerInputOutputRules(LintRegistry& registry)
{
    registry.registerRuleFactory([]() { return std::make_unique<VariableFileLocationRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<OutputFileLocationRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<RequiredVariableValueRule>(); });
    registry.registerRuleFactory([]() {
        return std::make_unique<BlockNamingRule>(
            RuleDescriptor{"IO.004", RuleCategory::InputOutput, "Variable names use snake_case"},
            BlockKind::Variable,
            "Variable");
    });
    registry.registerRuleFactory([]() {
        return std::make_unique<BlockNamingRule>(
            RuleDescriptor{"IO.005", RuleCategory::InputOutput, "Output names use snake_case"},
            BlockKind::Output,
            "Output");
    });
    registry.registerRuleFactory([]() {
        return std::make_unique<DescriptionRule>(
            RuleDescriptor{"IO.006", RuleCategory::InputOutput, "Variables carry a non-empty description"},
            BlockKind::Variable,
            "Variable");
    });
    registry.registerRuleFactory([]() {
        return std::make_unique<DescriptionRule>(
            RuleDescriptor{"IO.007", RuleCategory::InputOutput, "Outputs carry a non-empty description"},
            BlockKind::Output,
            "Output");
    });
    registry.registerRuleFactory([]() { return std::make_unique<VariableTypeRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<UnusedVariableRule>(); });
}

}  // namespace tfcheck::lint
