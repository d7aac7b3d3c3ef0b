//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the SC rule family.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Lint/DirectoryIndex.h"
#include "tfcheck/Lint/Registry.h"
#include "tfcheck/Lint/VersionConstraint.h"
#include "tfcheck/Lint/VersionOracle.h"

#include "llvm/Support/Error.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace tfcheck::lint
{
namespace
{

std::string lowercase(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

std::string unquote(const std::string& value)
{
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
    {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

bool isStringLiteral(const std::string& value)
{
    return value.size() >= 2 && value.front() == '"' && value.back() == '"' &&
           value.find("${") == std::string::npos;
}

const Block* findTerraformBlock(const LintDocument& document)
{
    if (!document.root)
    {
        return nullptr;
    }
    for (const Block& block : document.root->children)
    {
        if (block.kind == BlockKind::Terraform)
        {
            return &block;
        }
    }
    return nullptr;
}

/// Returns true when the index access at `position` is enclosed by a `try(...)` call on the same line.
bool isWrappedInTry(const std::string& text, const std::size_t position)
{
    static const std::regex tryCall(R"(\btry\s*\()");
    const std::string       before = text.substr(0, position);
    for (auto it = std::sregex_iterator(before.begin(), before.end(), tryCall); it != std::sregex_iterator(); ++it)
    {
        std::size_t at    = static_cast<std::size_t>(it->position(0) + it->length(0));
        int         depth = 1;
        while (at < text.size() && depth > 0)
        {
            if (text[at] == '(')
            {
                ++depth;
            }
            else if (text[at] == ')')
            {
                --depth;
            }
            ++at;
        }
        if (depth == 0 && at > position)
        {
            return true;
        }
    }
    return false;
}

/// Tracks the parentheses of `try(` calls that stay open across lines.
class TryScopes final
{
public:
    explicit TryScopes(const LintDocument& document)
        : document_(document)
    {
        std::vector<bool> open;
        for (std::uint32_t n = 1; n <= document.source.lineCount(); ++n)
        {
            openAtLineStart_.push_back(open);
            const ScannedLine& scanned = document.scan.line(n);
            for (const BracketEvent& event : scanned.brackets)
            {
                if (event.isOpening())
                {
                    open.push_back(event.bracket == '(' && opensTryCall(scanned.skeleton, event.column));
                }
                else if (!open.empty())
                {
                    open.pop_back();
                }
            }
        }
    }

    /// Returns true when a `try(` call is open at `column` of `line`.
    [[nodiscard]] bool encloses(const std::uint32_t line, const std::size_t column) const
    {
        std::vector<bool> open = openAtLineStart_[line - 1];
        for (const BracketEvent& event : document_.scan.line(line).brackets)
        {
            if (event.column >= column)
            {
                break;
            }
            if (event.isOpening())
            {
                open.push_back(event.bracket == '(' &&
                               opensTryCall(document_.scan.line(line).skeleton, event.column));
            }
            else if (!open.empty())
            {
                open.pop_back();
            }
        }
        return std::find(open.begin(), open.end(), true) != open.end();
    }

private:
    static bool opensTryCall(const std::string& skeleton, std::size_t column)
    {
        while (column > 0 && (skeleton[column - 1] == ' ' || skeleton[column - 1] == '\t'))
        {
            --column;
        }
        if (column < 3 || skeleton.compare(column - 3, 3, "try") != 0)
        {
            return false;
        }
        if (column == 3)
        {
            return true;
        }
        const unsigned char before = static_cast<unsigned char>(skeleton[column - 4]);
        return std::isalnum(before) == 0 && before != '_' && before != '-' && before != '.';
    }

    const LintDocument&            document_;
    std::vector<std::vector<bool>> openAtLineStart_;
};

class UnsafeIndexRule final : public DescribedRule
{
public:
    UnsafeIndexRule()
        : DescribedRule({"SC.001",
                         RuleCategory::Security,
                         "Index access on possibly empty collections is wrapped in try()",
                         Severity::Warning,
                         RuleScope::Directory})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        static const std::regex dataAccess(
            R"(\bdata\.[A-Za-z0-9_-]+\.[A-Za-z0-9_-]+\.[A-Za-z0-9_-]+\[\d+\](?:\.[A-Za-z0-9_-]+)*)");
        static const std::regex variableAccess(R"(\bvar\.([A-Za-z0-9_-]+)\[\d+\](?:\.[A-Za-z0-9_-]+)*)");
        static const std::regex localAccess(R"(\blocal\.([A-Za-z0-9_-]+)\[\d+\](?:\.[A-Za-z0-9_-]+)*)");

        const DirectoryIndex&       index         = *context.directory;
        const std::set<std::string> listVariables = collectListVariables(index);
        const std::set<std::string> forLocals     = collectForExpressionLocals(index);

        for (const LintDocument* document : index.documents())
        {
            if (document->isVariableValues())
            {
                continue;
            }
            const TryScopes tryScopes(*document);
            for (std::uint32_t n = 1; n <= document->source.lineCount(); ++n)
            {
                if (document->scan.line(n).kind != LineClass::Code)
                {
                    continue;
                }
                const std::string text = referenceText(*document, n);
                scan(*document, tryScopes, n, text, dataAccess, "data source list attribute", nullptr, log);
                scan(*document, tryScopes, n, text, variableAccess, "optional list parameter", &listVariables, log);
                scan(*document, tryScopes, n, text, localAccess, "for expression result", &forLocals, log);
            }
        }
    }

private:
    static void scan(const LintDocument&          document,
                     const TryScopes&             tryScopes,
                     const std::uint32_t          line,
                     const std::string&           text,
                     const std::regex&            pattern,
                     const char*                  scenario,
                     const std::set<std::string>* roots,
                     RuleLog&                     log)
    {
        for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern); it != std::sregex_iterator(); ++it)
        {
            if (roots != nullptr && roots->count(it->str(1)) == 0U)
            {
                continue;
            }
            const auto position = static_cast<std::size_t>(it->position(0));
            if (isWrappedInTry(text, position) || tryScopes.encloses(line, position))
            {
                continue;
            }
            const std::string access = it->str(0);
            log.report(document.source.path,
                       line,
                       std::string("Unsafe array index access detected in ") + scenario + ": '" + access +
                           "'. Use try() function to prevent index out of bounds errors. Suggestion: try(" + access +
                           ", \"default_value\")");
        }
    }

    static std::set<std::string> collectListVariables(const DirectoryIndex& index)
    {
        static const std::regex listType(R"(^\s*(optional\s*\(\s*)?list\s*\()");
        std::set<std::string>   out;
        for (const VariableDefinition& definition : index.variables())
        {
            const Parameter* type = definition.block->findParameter("type");
            if (type != nullptr && std::regex_search(type->value, listType))
            {
                out.insert(definition.name);
            }
        }
        return out;
    }

    static std::set<std::string> collectForExpressionLocals(const DirectoryIndex& index)
    {
        static const std::regex forExpression(R"(^\s*[\[{]\s*for\b)");
        std::set<std::string>   out;
        for (const LocalDefinition& local : index.locals())
        {
            if (std::regex_search(local.parameter->value, forExpression))
            {
                out.insert(local.name);
            }
        }
        return out;
    }
};

class RequiredVersionDeclarationRule final : public DescribedRule
{
public:
    RequiredVersionDeclarationRule()
        : DescribedRule({"SC.002",
                         RuleCategory::Security,
                         "The providers file declares required_version",
                         Severity::Warning,
                         RuleScope::Directory})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const LintDocument* providers = context.directory->findDocument(context.config->files.providers);
        if (providers == nullptr || !providers->root)
        {
            return;
        }
        const std::string& path      = providers->source.path;
        const Block*       terraform = findTerraformBlock(*providers);
        if (terraform == nullptr)
        {
            log.report(path, 1, "Missing terraform block with required_version declaration");
            return;
        }
        const Parameter* required = terraform->findParameter("required_version");
        if (required == nullptr)
        {
            log.report(path, terraform->startLine, "terraform block found but missing required_version declaration");
            return;
        }
        const std::string constraint = unquote(required->value);
        if (!isStringLiteral(required->value))
        {
            log.report(path,
                       required->line,
                       "Invalid version constraint format: '" + constraint + "'. Use format like '>= 1.3.0' or '~> 1.0'");
            return;
        }
        auto clauses = parseVersionConstraint(constraint);
        if (!clauses)
        {
            llvm::consumeError(clauses.takeError());
            log.report(path,
                       required->line,
                       "Invalid version constraint format: '" + constraint + "'. Use format like '>= 1.3.0' or '~> 1.0'");
        }
    }
};

/// One language feature with the Terraform release that introduced it.
struct FeatureRequirement final
{
    std::string     feature;
    SemanticVersion minimum;
};

void requireFeature(std::vector<FeatureRequirement>& out, const char* feature, const SemanticVersion minimum)
{
    if (std::none_of(out.begin(), out.end(), [&](const FeatureRequirement& seen) { return seen.feature == feature; }))
    {
        out.push_back(FeatureRequirement{feature, minimum});
    }
}

bool referencesOtherVariable(const Block& validation, const std::string& self)
{
    static const std::regex reference(R"(\bvar\.([A-Za-z0-9_-]+))");
    for (const Parameter& parameter : validation.parameters)
    {
        for (auto it = std::sregex_iterator(parameter.value.begin(), parameter.value.end(), reference);
             it != std::sregex_iterator();
             ++it)
        {
            if (it->str(1) != self)
            {
                return true;
            }
        }
    }
    return false;
}

void collectDocumentFeatures(const Block& root, std::vector<FeatureRequirement>& out)
{
    for (const Block& block : root.children)
    {
        if (block.kind == BlockKind::Variable || block.kind == BlockKind::Output)
        {
            const Parameter* sensitive = block.findParameter("sensitive");
            if (sensitive != nullptr && sensitive->value == "true")
            {
                requireFeature(out, "sensitive", {0, 14, 0});
            }
        }
        if (block.kind == BlockKind::Variable)
        {
            if (block.findParameter("nullable") != nullptr)
            {
                requireFeature(out, "nullable", {1, 1, 0});
            }
            const Parameter* type = block.findParameter("type");
            if (type != nullptr && type->value.find("optional(") != std::string::npos)
            {
                requireFeature(out, "optional()", {1, 3, 0});
            }
            const std::string self = block.typeLabel ? block.typeLabel->text : std::string();
            for (const Block& child : block.children)
            {
                if (child.keyword == "validation" && referencesOtherVariable(child, self))
                {
                    requireFeature(out, "other variables are referenced in validation.condition", {1, 9, 0});
                }
            }
        }
        if (block.keyword == "moved")
        {
            requireFeature(out, "moved", {1, 1, 0});
        }
        else if (block.keyword == "import")
        {
            requireFeature(out, "import", {1, 5, 0});
            if (block.findParameter("for_each") != nullptr)
            {
                requireFeature(out, "import.for_each", {1, 7, 0});
            }
        }
        else if (block.keyword == "check")
        {
            requireFeature(out, "check", {1, 5, 0});
        }
        else if (block.keyword == "removed")
        {
            requireFeature(out, "removed", {1, 7, 0});
        }
        forEachBlock(block, [&](const Block& nested) {
            if (nested.keyword == "precondition" || nested.keyword == "postcondition")
            {
                requireFeature(out,
                               nested.keyword == "precondition" ? "lifecycle.precondition" : "lifecycle.postcondition",
                               {1, 2, 0});
            }
        });
    }
}

class RequiredVersionCompatibilityRule final : public DescribedRule
{
public:
    RequiredVersionCompatibilityRule()
        : DescribedRule({"SC.003",
                         RuleCategory::Security,
                         "required_version admits only releases supporting the features in use",
                         Severity::Error,
                         RuleScope::Directory})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const DirectoryIndex& index     = *context.directory;
        const LintDocument*   providers = index.findDocument(context.config->files.providers);
        const Block*          terraform = providers == nullptr ? nullptr : findTerraformBlock(*providers);
        const Parameter* required = terraform == nullptr ? nullptr : terraform->findParameter("required_version");
        if (required == nullptr || !isStringLiteral(required->value))
        {
            return;
        }
        const std::string declared = unquote(required->value);
        auto              clauses  = parseVersionConstraint(declared);
        if (!clauses)
        {
            // Malformed constraints are reported by the declaration check.
            llvm::consumeError(clauses.takeError());
            return;
        }
        const SemanticVersion admitted = lowerBound(*clauses);

        std::vector<FeatureRequirement> features;
        for (const LintDocument* document : index.documents())
        {
            if (document->root && !document->isVariableValues())
            {
                collectDocumentFeatures(*document->root, features);
            }
        }

        SemanticVersion          minimum{0, 12, 0};
        std::vector<std::string> offending;
        for (const FeatureRequirement& requirement : features)
        {
            minimum = std::max(minimum, requirement.minimum);
            if (requirement.minimum > admitted)
            {
                offending.push_back(requirement.feature);
            }
        }
        if (admitted >= minimum)
        {
            return;
        }

        std::string description;
        if (offending.empty())
        {
            description = "(no special feature used)";
        }
        else
        {
            description = offending.size() == 1 ? "based on feature '" : "based on features '";
            for (std::size_t i = 0; i < offending.size(); ++i)
            {
                description += (i == 0 ? "" : "', '") + offending[i];
            }
            description += "' used";
        }
        log.report(providers->source.path,
                   required->line,
                   "Declared version '" + declared + "' is too low. Required: '>= " + minimum.str() + "' " +
                       description);
    }
};

class ProviderVersionRule final : public DescribedRule
{
public:
    ProviderVersionRule()
        : DescribedRule({"SC.004",
                         RuleCategory::Security,
                         "Provider version constraints resolve to the intended releases",
                         Severity::Error,
                         RuleScope::Directory})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        if (context.oracle == nullptr)
        {
            return;
        }
        const LintConfig&   config    = *context.config;
        const LintDocument* providers = context.directory->findDocument(config.files.providers);
        const Block*        terraform = providers == nullptr ? nullptr : findTerraformBlock(*providers);
        const Block*        required  = terraform == nullptr ? nullptr : terraform->findChild("required_providers");
        if (required == nullptr)
        {
            return;
        }

        for (const Parameter& provider : required->parameters)
        {
            if (!config.oracleProviders.empty() &&
                std::find(config.oracleProviders.begin(), config.oracleProviders.end(), provider.name) ==
                    config.oracleProviders.end())
            {
                continue;
            }
            const Parameter* version = nullptr;
            for (const Parameter& entry : provider.entries)
            {
                if (entry.name == "version")
                {
                    version = &entry;
                }
            }
            if (version == nullptr)
            {
                continue;
            }
            if (!verify(*context.oracle, providers->source.path, provider.name, *version, log))
            {
                return;
            }
        }
    }

private:
    /// Returns false when the oracle could not answer; the remaining providers are not queried.
    static bool verify(const VersionOracle& oracle,
                       const std::string&   path,
                       const std::string&   provider,
                       const Parameter&     version,
                       RuleLog&             log)
    {
        const std::string constraint = unquote(version.value);
        auto              verdict    = oracle.isVersionValid(provider, constraint);
        if (!verdict)
        {
            log.report(path,
                       version.line,
                       "Provider version check for '" + provider +
                           "' could not be completed: " + llvm::toString(verdict.takeError()),
                       Severity::Warning);
            return false;
        }
        const std::string subject = "Version constraint '" + constraint + "' for provider '" + provider + "'";
        switch (*verdict)
        {
        case VersionVerdict::Valid:
            return true;
        case VersionVerdict::TooPermissive:
            log.report(path,
                       version.line,
                       subject +
                           " is too permissive. A previous provider version also works; consider using a more "
                           "restrictive version constraint.");
            return true;
        case VersionVerdict::TooRestrictive:
            log.report(path, version.line, subject + " is too restrictive for the configuration in use.");
            return true;
        case VersionVerdict::Unresolvable:
            log.report(path, version.line, subject + " does not resolve to an available provider release.");
            return true;
        }
        return true;
    }
};

bool isSensitiveName(const std::string& name)
{
    static const std::set<std::string> exact{"email", "age", "access_key", "secret_key", "sex", "signature"};
    const std::string                  lower = lowercase(name);
    if (exact.count(lower) != 0U)
    {
        return true;
    }
    for (const char* fragment : {"phone", "password", "pwd"})
    {
        if (lower.find(fragment) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

class SensitiveDeclarationRule final : public DescribedRule
{
public:
    SensitiveDeclarationRule()
        : DescribedRule({"SC.005", RuleCategory::Security, "Sensitive-looking variables are declared sensitive"})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        for (const Block& block : context.document->root->children)
        {
            if (block.kind != BlockKind::Variable || !block.typeLabel || !isSensitiveName(block.typeLabel->text))
            {
                continue;
            }
            const Parameter* sensitive = block.findParameter("sensitive");
            if (sensitive != nullptr && sensitive->value == "true")
            {
                continue;
            }
            log.report(block.startLine,
                       "Sensitive variable '" + block.typeLabel->text +
                           "' must be declared with 'sensitive = true' to prevent data exposure in Terraform state "
                           "and logs.");
        }
    }
};

}  // namespace

void registerSafetyRules(LintRegistry& registry)
{
    registry.registerRuleFactory([]() { return std::make_unique<UnsafeIndexRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<RequiredVersionDeclarationRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<RequiredVersionCompatibilityRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<ProviderVersionRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<SensitiveDeclarationRule>(); });
}

}  // namespace tfcheck::lint
