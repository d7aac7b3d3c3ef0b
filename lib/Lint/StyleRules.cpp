//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the ST rule family.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Lint/DirectoryIndex.h"
#include "tfcheck/Lint/FormattingFacts.h"
#include "tfcheck/Lint/Registry.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace tfcheck::lint
{
namespace
{

bool isWhitespaceOnly(const std::string& text)
{
    return text.find_first_not_of(" \t") == std::string::npos;
}

bool endsWith(const std::string& text, const std::string& suffix)
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string joinNames(const std::vector<std::string>& names)
{
    std::string out;
    for (const std::string& name : names)
    {
        if (!out.empty())
        {
            out += ", ";
        }
        out += name;
    }
    return out;
}

std::string plural(const std::uint32_t count, const char* noun)
{
    return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
}

class InstanceLabelRule final : public DescribedRule
{
public:
    InstanceLabelRule()
        : DescribedRule({"ST.001", RuleCategory::Style, "Resource and data source instance names use the fixed label"})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const std::string& expected = context.config->fixedInstanceLabel;
        for (const Block& block : context.document->root->children)
        {
            if ((block.kind != BlockKind::Resource && block.kind != BlockKind::Data) || !block.typeLabel ||
                !block.nameLabel || block.nameLabel->text == expected)
            {
                continue;
            }
            const char* what = block.kind == BlockKind::Data ? "Data source" : "Resource";
            log.report(block.startLine,
                       std::string(what) + " '" + block.typeLabel->text + "' instance name '" +
                           block.nameLabel->text + "' should be '" + expected + "'");
        }
    }
};

class DataSourceVariableDefaultRule final : public DescribedRule
{
public:
    DataSourceVariableDefaultRule()
        : DescribedRule({"ST.002",
                         RuleCategory::Style,
                         "Variables used in data sources have default values",
                         Severity::Error,
                         RuleScope::Directory})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const DirectoryIndex& index = *context.directory;
        for (const LintDocument* document : index.documents())
        {
            if (!document->root || document->isVariableValues())
            {
                continue;
            }
            const std::vector<const VariableReference*> references = index.referencesIn(*document);
            for (const Block& block : document->root->children)
            {
                if (block.kind != BlockKind::Data)
                {
                    continue;
                }
                for (const VariableReference* reference : references)
                {
                    if (reference->line < block.startLine || reference->line > block.endLine)
                    {
                        continue;
                    }
                    const VariableDefinition* definition = index.findVariable(reference->name);
                    if (definition == nullptr)
                    {
                        log.report(document->source.path,
                                   reference->line,
                                   "Variable '" + reference->name +
                                       "' used in data source is not defined in the current directory");
                    }
                    else if (!definition->hasDefault)
                    {
                        log.report(document->source.path,
                                   reference->line,
                                   "Variable '" + reference->name + "' used in data source must have a default value");
                    }
                }
            }
        }
    }
};

class ParameterAlignmentRule final : public DescribedRule
{
public:
    ParameterAlignmentRule()
        : DescribedRule({"ST.003", RuleCategory::Style, "Parameter assignments are aligned"})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        for (LayoutIssue& issue : alignmentIssues(*context.document))
        {
            log.report(issue.line, std::move(issue.message));
        }
    }
};

class TabIndentationRule final : public DescribedRule
{
public:
    TabIndentationRule()
        : DescribedRule(
              {"ST.004", RuleCategory::Style, "Indentation uses spaces", Severity::Error, RuleScope::File, false})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const LintDocument& document = *context.document;
        for (std::uint32_t n = 1; n <= document.source.lineCount(); ++n)
        {
            if (auto problem = tabProblem(document, n))
            {
                log.report(n, std::move(*problem));
            }
        }
    }
};

class IndentationLevelRule final : public DescribedRule
{
public:
    IndentationLevelRule()
        : DescribedRule({"ST.005",
                         RuleCategory::Style,
                         "Indentation is two spaces per nesting level",
                         Severity::Error,
                         RuleScope::File,
                         false})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const LintDocument& document = *context.document;
        for (std::uint32_t n = 1; n <= document.source.lineCount(); ++n)
        {
            if (auto problem = indentationProblem(document, n))
            {
                log.report(n, std::move(*problem));
            }
        }
    }
};

std::string topLevelDesignation(const Block& block)
{
    const auto labelText = [](const std::optional<BlockLabel>& label) {
        return label ? label->text : std::string();
    };
    switch (block.kind)
    {
    case BlockKind::Resource:
        return "resource '" + labelText(block.typeLabel) + "'";
    case BlockKind::Data:
        return "data source '" + labelText(block.typeLabel) + "'";
    case BlockKind::Variable:
        return "variable '" + labelText(block.typeLabel) + "'";
    case BlockKind::Output:
        return "output '" + labelText(block.typeLabel) + "'";
    case BlockKind::Locals:
        return "locals";
    default:
        break;
    }
    return block.typeLabel ? block.keyword + " '" + block.typeLabel->text + "'" : block.keyword;
}

class TopLevelBlockSpacingRule final : public DescribedRule
{
public:
    TopLevelBlockSpacingRule()
        : DescribedRule({"ST.006", RuleCategory::Style, "Top-level blocks are separated by one blank line"})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const LintDocument&       document = *context.document;
        const std::vector<Block>& blocks   = document.root->children;
        for (std::size_t i = 1; i < blocks.size(); ++i)
        {
            const Block& previous = blocks[i - 1];
            const Block& next     = blocks[i];
            if (previous.endLine >= next.startLine)
            {
                continue;
            }
            const std::uint32_t blanks = blankLinesBetween(document, previous.endLine, next.startLine);
            const std::string   pair   = topLevelDesignation(previous) + " and " + topLevelDesignation(next);
            if (blanks == 0)
            {
                log.report(next.startLine,
                           "Missing blank line between " + pair + ", the number of blank line should be 1.");
            }
            else if (blanks > 1)
            {
                log.report(previous.endLine + 2,
                           "Too many blank lines between " + pair + ", the number of blank line should be 1.");
            }
        }
    }
};

enum class MemberKind
{
    MetaArgument,
    Parameter,
    StructureBlock,
    DynamicBlock,
};

MemberKind memberKind(const BlockMember& member)
{
    if (member.isMeta)
    {
        return MemberKind::MetaArgument;
    }
    switch (member.shape)
    {
    case ParameterShape::Scalar:
    case ParameterShape::CollectionLiteral:
        return MemberKind::Parameter;
    case ParameterShape::NestedBlock:
        return MemberKind::StructureBlock;
    case ParameterShape::DynamicBlock:
        return MemberKind::DynamicBlock;
    }
    return MemberKind::Parameter;
}

const char* memberKindName(const MemberKind kind)
{
    switch (kind)
    {
    case MemberKind::MetaArgument:
        return "meta-argument";
    case MemberKind::Parameter:
        return "parameter";
    case MemberKind::StructureBlock:
        return "structure block";
    case MemberKind::DynamicBlock:
        return "dynamic block";
    }
    return "parameter";
}

bool isBlockMember(const MemberKind kind)
{
    return kind == MemberKind::StructureBlock || kind == MemberKind::DynamicBlock;
}

/// Visits every pair of adjacent members on distinct lines inside non-root blocks.
template <typename Visitor>
void forEachAdjacentMemberPair(const LintDocument& document, Visitor&& visitor)
{
    forEachBlock(*document.root, [&](const Block& block) {
        if (block.kind == BlockKind::Root)
        {
            return;
        }
        const std::vector<BlockMember> members = memberSequence(block);
        for (std::size_t i = 1; i < members.size(); ++i)
        {
            if (members[i - 1].endLine >= members[i].line)
            {
                continue;
            }
            visitor(block, members[i - 1], members[i]);
        }
    });
}

std::string spacingMessage(const BlockMember&  first,
                           const BlockMember&  second,
                           const std::uint32_t blanks,
                           const Block&        owner,
                           const char*         recommendation)
{
    return "Found " + plural(blanks, "blank line") + " between " + memberKindName(memberKind(first)) + " '" +
           first.name + "' and " + memberKindName(memberKind(second)) + " '" + second.name + "' in " +
           describeBlock(owner) + ". " + recommendation;
}

class SameNameBlockSpacingRule final : public DescribedRule
{
public:
    SameNameBlockSpacingRule()
        : DescribedRule({"ST.007", RuleCategory::Style, "Same-name nested blocks are separated by at most one blank line"})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const LintDocument& document = *context.document;
        forEachAdjacentMemberPair(document, [&](const Block& owner, const BlockMember& first, const BlockMember& second) {
            const MemberKind kind = memberKind(first);
            if (!isBlockMember(kind) || kind != memberKind(second) || first.name != second.name)
            {
                return;
            }
            const std::uint32_t blanks = blankLinesBetween(document, first.endLine, second.line);
            if (blanks > 1)
            {
                log.report(second.line,
                           spacingMessage(first, second, blanks, owner, "0 or 1 blank line is recommended."));
            }
        });
    }
};

class MemberKindSpacingRule final : public DescribedRule
{
public:
    MemberKindSpacingRule()
        : DescribedRule({"ST.008", RuleCategory::Style, "Members of different kinds are separated by one blank line"})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const LintDocument& document = *context.document;
        forEachAdjacentMemberPair(document, [&](const Block& owner, const BlockMember& first, const BlockMember& second) {
            const MemberKind firstKind  = memberKind(first);
            const MemberKind secondKind = memberKind(second);
            const bool       differentBlocks =
                isBlockMember(firstKind) && isBlockMember(secondKind) && first.name != second.name;
            if (firstKind == secondKind && !differentBlocks)
            {
                return;
            }
            const std::uint32_t blanks = blankLinesBetween(document, first.endLine, second.line);
            if (blanks != 1)
            {
                log.report(second.line, spacingMessage(first, second, blanks, owner, "1 blank line is recommended."));
            }
        });
    }
};

class VariableOrderRule final : public DescribedRule
{
public:
    VariableOrderRule()
        : DescribedRule({"ST.009",
                         RuleCategory::Style,
                         "Variable definitions follow their order of use",
                         Severity::Warning,
                         RuleScope::Directory})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const DirectoryIndex& index     = *context.directory;
        const LintConfig&     config    = *context.config;
        const LintDocument*   main      = index.findDocument(config.files.main);
        const LintDocument*   variables = index.findDocument(config.files.variables);
        if (main == nullptr || variables == nullptr)
        {
            return;
        }

        std::set<std::string>    defined;
        std::vector<std::string> usage;
        std::set<std::string>    used;
        for (const VariableDefinition& definition : index.variables())
        {
            if (definition.document == variables)
            {
                defined.insert(definition.name);
            }
        }
        for (const VariableReference* reference : index.referencesIn(*main))
        {
            if (defined.count(reference->name) != 0U && !config.isAllowListed(reference->name) &&
                used.insert(reference->name).second)
            {
                usage.push_back(reference->name);
            }
        }

        std::vector<const VariableDefinition*> actual;
        for (const VariableDefinition& definition : index.variables())
        {
            if (definition.document == variables && used.count(definition.name) != 0U &&
                std::none_of(actual.begin(), actual.end(), [&](const VariableDefinition* seen) {
                    return seen->name == definition.name;
                }))
            {
                actual.push_back(&definition);
            }
        }

        std::vector<std::string> actualNames;
        for (const VariableDefinition* definition : actual)
        {
            actualNames.push_back(definition->name);
        }
        for (std::size_t i = 0; i < actual.size(); ++i)
        {
            if (actual[i]->name == usage[i])
            {
                continue;
            }
            log.report(variables->source.path,
                       actual[i]->line,
                       "Variable '" + actual[i]->name + "' is not in the correct order. Expected order: " +
                           joinNames(usage) + ". Current order: " + joinNames(actualNames));
        }
    }
};

class LabelQuotingRule final : public DescribedRule
{
public:
    LabelQuotingRule()
        : DescribedRule({"ST.010", RuleCategory::Style, "Block labels are enclosed in double quotes"})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        forEachBlock(*context.document->root, [&](const Block& block) {
            const bool typeBad = block.typeLabel && block.typeLabel->quote != '"';
            const bool nameBad = block.nameLabel && block.nameLabel->quote != '"';
            if (!typeBad && !nameBad)
            {
                return;
            }
            if (block.kind == BlockKind::Resource)
            {
                log.report(block.startLine, "Resource type and name must be enclosed in double quotes");
            }
            else if (block.kind == BlockKind::Data)
            {
                log.report(block.startLine, "Data source type and name must be enclosed in double quotes");
            }
            else
            {
                const BlockLabel& label = typeBad ? *block.typeLabel : *block.nameLabel;
                log.report(block.startLine,
                           "Label '" + label.text + "' of " + block.keyword +
                               " block must be enclosed in double quotes");
            }
        });
    }
};

class TrailingWhitespaceRule final : public DescribedRule
{
public:
    TrailingWhitespaceRule()
        : DescribedRule({"ST.011",
                         RuleCategory::Style,
                         "Lines carry no trailing whitespace",
                         Severity::Warning,
                         RuleScope::File,
                         false})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const LintDocument& document = *context.document;
        for (std::uint32_t n = 1; n <= document.source.lineCount(); ++n)
        {
            const std::string& line = document.source.line(n);
            if (document.scan.isHeredocLine(n) || line.empty())
            {
                continue;
            }
            const auto last = line.find_last_not_of(" \t");
            const auto tail = last == std::string::npos ? 0 : last + 1;
            if (tail == line.size())
            {
                continue;
            }
            std::vector<std::string> kinds;
            for (std::size_t i = tail; i < line.size(); ++i)
            {
                kinds.emplace_back(line[i] == '\t' ? "tab" : "space");
            }
            log.report(n, "Line contains trailing whitespace characters: " + joinNames(kinds));
        }
    }
};

class FileBoundaryLinesRule final : public DescribedRule
{
public:
    FileBoundaryLinesRule()
        : DescribedRule({"ST.012",
                         RuleCategory::Style,
                         "Files start without blank lines and end with one newline",
                         Severity::Warning,
                         RuleScope::File,
                         false})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const SourceFile&   source = context.document->source;
        const std::uint32_t count  = source.lineCount();
        std::uint32_t       first  = 1;
        while (first <= count && isWhitespaceOnly(source.line(first)))
        {
            ++first;
        }
        if (first > count)
        {
            if (count > 0)
            {
                log.report(1,
                           "File has " + plural(count, "empty line") +
                               " before first non-empty line (should have 0)");
            }
            return;
        }
        std::uint32_t last = count;
        while (last > first && isWhitespaceOnly(source.line(last)))
        {
            --last;
        }

        const std::uint32_t leading = first - 1;
        if (leading > 0)
        {
            log.report(first,
                       "File has " + plural(leading, "empty line") +
                           " before first non-empty line (should have 0)");
        }
        const std::uint32_t trailing = (count - last) + (source.endsWithNewline ? 1U : 0U);
        if (trailing != 1)
        {
            log.report(last,
                       "File has " + std::to_string(trailing) +
                           " empty lines after last non-empty line (should have 1)");
        }
    }
};

const std::set<std::string>& skippedDirectoryNames()
{
    static const std::set<std::string> names{"__pycache__", "node_modules", "venv",     "env",
                                             "build",       "dist",         "target",   "bin",
                                             "obj",         "coverage",     "htmlcov",  "terraform.tfstate.d"};
    return names;
}

std::string lowercase(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

std::string directoryBaseName(const std::string& directory)
{
    llvm::SmallString<256> path(directory);
    if (llvm::sys::fs::make_absolute(path))
    {
        path = directory;
    }
    llvm::sys::path::remove_dots(path, true);
    return llvm::sys::path::filename(path).str();
}

class DirectoryNamingRule final : public DescribedRule
{
public:
    DirectoryNamingRule()
        : DescribedRule({"ST.013",
                         RuleCategory::Style,
                         "Directory names use letters, digits and hyphens",
                         Severity::Warning,
                         RuleScope::Directory,
                         false})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        static const std::regex pattern(R"(^[A-Za-z][A-Za-z0-9-]*[A-Za-z]$)");
        const std::string       name = directoryBaseName(context.directory->directory());
        if (name.empty() || name.front() == '.' || skippedDirectoryNames().count(lowercase(name)) != 0U)
        {
            return;
        }
        if (std::regex_match(name, pattern) && name.find("--") == std::string::npos)
        {
            return;
        }
        log.report(context.directory->directory(),
                   0,
                   "Directory name '" + name +
                       "' does not follow naming convention. Must contain only letters, numbers, and hyphens, "
                       "and start/end with a letter.");
    }
};

class FileNamingRule final : public DescribedRule
{
public:
    FileNamingRule()
        : DescribedRule({"ST.014",
                         RuleCategory::Style,
                         "File names use letters, digits and underscores",
                         Severity::Warning,
                         RuleScope::File,
                         false})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        static const std::regex pattern(R"(^[A-Za-z][A-Za-z0-9_]*[A-Za-z]$)");
        const std::string&      fileName = context.document->source.fileName;
        if (fileName.empty() || fileName.front() == '.' || endsWith(fileName, ".auto.tfvars"))
        {
            return;
        }
        const std::string stem = llvm::sys::path::stem(fileName).str();
        if (std::regex_match(stem, pattern) && stem.find("__") == std::string::npos)
        {
            return;
        }
        log.report(1,
                   "File name '" + fileName +
                       "' does not follow naming convention. Must contain only letters, numbers, and underscores, "
                       "and start/end with a letter.");
    }
};

}  // namespace

void registerStyleRules(LintRegistry& registry)
{
    registry.registerRuleFactory([]() { return std::make_unique<InstanceLabelRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<DataSourceVariableDefaultRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<ParameterAlignmentRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<TabIndentationRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<IndentationLevelRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<TopLevelBlockSpacingRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<SameNameBlockSpacingRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<MemberKindSpacingRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<VariableOrderRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<LabelQuotingRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<TrailingWhitespaceRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<FileBoundaryLinesRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<DirectoryNamingRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<FileNamingRule>(); });
}

}  // namespace tfcheck::lint
