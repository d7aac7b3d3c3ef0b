//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "tfcheck/Frontend/SourceFile.h"
#include "tfcheck/Lint/Engine.h"
#include "llvm/Support/Error.h"

namespace
{

using FileSet = std::vector<std::pair<std::string, std::string>>;

constexpr const char* kModuleDirectory = "/tmp/tfcheck/crossfile/module";

tfcheck::lint::LintRunResult lintDirectory(const FileSet& files, const tfcheck::lint::LintConfig& config = {})
{
    std::vector<tfcheck::SourceFile> sources;
    for (const auto& [name, text] : files)
    {
        sources.push_back(tfcheck::makeSourceFile(std::string(kModuleDirectory) + "/" + name, text));
    }
    tfcheck::lint::LintEngine                    engine;
    llvm::Expected<tfcheck::lint::LintRunResult> result = engine.runSources(std::move(sources), config);
    if (!result)
    {
        std::cerr << "lint run failed: " << llvm::toString(result.takeError()) << "\n";
        return {};
    }
    return std::move(*result);
}

/// Returns "file:line" for each violation of `ruleId`, file being the base name.
std::vector<std::string> sitesOf(const tfcheck::lint::LintRunResult& result, const std::string& ruleId)
{
    std::vector<std::string> sites;
    for (const tfcheck::lint::Violation& violation : result.violations)
    {
        if (violation.ruleId != ruleId)
        {
            continue;
        }
        const auto slash = violation.filePath.find_last_of('/');
        sites.push_back(violation.filePath.substr(slash == std::string::npos ? 0 : slash + 1) + ":" +
                        std::to_string(violation.line));
    }
    return sites;
}

bool expectSites(const tfcheck::lint::LintRunResult& result,
                 const std::string&                 ruleId,
                 const std::vector<std::string>&    expected,
                 const char*                        what)
{
    const std::vector<std::string> actual = sitesOf(result, ruleId);
    if (actual == expected)
    {
        return true;
    }
    std::cerr << what << ": unexpected " << ruleId << " sites:";
    for (const std::string& site : actual)
    {
        std::cerr << " " << site;
    }
    std::cerr << "\n";
    return false;
}

const std::string kDocumentedVariable = "variable \"flavor\" {\n"
                                        "  type        = string\n"
                                        "  description = \"Instance flavor\"\n"
                                        "}\n";

}  // namespace

bool runCrossFileRuleTests()
{
    {
        const auto result = lintDirectory({{"main.tf",
                                            "variable \"stray\" {\n"
                                            "  type = string\n"
                                            "}\n"
                                            "\n"
                                            "output \"id\" {\n"
                                            "  value = var.stray\n"
                                            "}\n"},
                                           {"outputs.tf",
                                            "output \"name\" {\n"
                                            "  value = \"x\"\n"
                                            "}\n"}});
        if (!expectSites(result, "IO.001", {"main.tf:1"}, "variable location") ||
            !expectSites(result, "IO.002", {"main.tf:5"}, "output location"))
        {
            return false;
        }
    }

    {
        // A required variable missing from the value file.
        const auto missing = lintDirectory({{"variables.tf", kDocumentedVariable}});
        if (!expectSites(missing, "IO.003", {"variables.tf:1"}, "required variable"))
        {
            return false;
        }
        const auto* violation = &missing.violations.front();
        for (const auto& candidate : missing.violations)
        {
            if (candidate.ruleId == "IO.003")
            {
                violation = &candidate;
            }
        }
        if (violation->message != "Required variable 'flavor' used and must be declared in terraform.tfvars" ||
            violation->severity != tfcheck::lint::Severity::Error)
        {
            std::cerr << "unexpected required variable message: " << violation->message << "\n";
            return false;
        }

        const auto declared =
            lintDirectory({{"variables.tf", kDocumentedVariable}, {"terraform.tfvars", "flavor = \"small\"\n"}});
        if (!expectSites(declared, "IO.003", {}, "declared variable"))
        {
            return false;
        }

        const auto allowListed = lintDirectory({{"variables.tf",
                                                 "variable \"region_name\" {\n"
                                                 "  type = string\n"
                                                 "}\n"
                                                 "\n"
                                                 "variable \"tenant_id\" {\n"
                                                 "  type = string\n"
                                                 "}\n"}});
        if (!expectSites(allowListed, "IO.003", {}, "allow-listed variables") ||
            !expectSites(allowListed, "IO.009", {}, "allow-listed unused variables"))
        {
            return false;
        }
    }

    {
        const auto result = lintDirectory({{"variables.tf",
                                            "variable \"BadName\" {\n"
                                            "  type        = string\n"
                                            "  description = \"\"\n"
                                            "  default     = \"x\"\n"
                                            "}\n"
                                            "\n"
                                            "variable \"untyped\" {\n"
                                            "  default = 1\n"
                                            "}\n"},
                                           {"outputs.tf",
                                            "output \"bad-name\" {\n"
                                            "  value = var.BadName\n"
                                            "}\n"
                                            "\n"
                                            "output \"good_name\" {\n"
                                            "  description = \"Fine\"\n"
                                            "  value       = var.untyped\n"
                                            "}\n"}});
        if (!expectSites(result, "IO.004", {"variables.tf:1"}, "variable naming") ||
            !expectSites(result, "IO.005", {"outputs.tf:1"}, "output naming") ||
            !expectSites(result, "IO.006", {"variables.tf:1", "variables.tf:7"}, "variable description") ||
            !expectSites(result, "IO.007", {"outputs.tf:1"}, "output description") ||
            !expectSites(result, "IO.008", {"variables.tf:7"}, "variable type") ||
            !expectSites(result, "IO.009", {}, "referenced variables"))
        {
            return false;
        }
    }

    {
        // A reference inside the variable's own block is not a use.
        const auto result = lintDirectory({{"variables.tf",
                                            "variable \"port\" {\n"
                                            "  type    = number\n"
                                            "  default = 80\n"
                                            "\n"
                                            "  validation {\n"
                                            "    condition     = var.port > 0\n"
                                            "    error_message = \"Port must be positive.\"\n"
                                            "  }\n"
                                            "}\n"
                                            "\n"
                                            "variable \"used\" {\n"
                                            "  type    = string\n"
                                            "  default = \"x\"\n"
                                            "}\n"},
                                           {"locals.tf",
                                            "locals {\n"
                                            "  script = <<EOT\n"
                                            "echo ${var.used}\n"
                                            "EOT\n"
                                            "}\n"}});
        if (!expectSites(result, "IO.009", {"variables.tf:1"}, "unused variable"))
        {
            return false;
        }
    }

    {
        const FileSet files{{"variables.tf",
                             "variable \"beta\" {\n"
                             "  type    = string\n"
                             "  default = \"b\"\n"
                             "}\n"
                             "\n"
                             "variable \"alpha\" {\n"
                             "  type    = string\n"
                             "  default = \"a\"\n"
                             "}\n"},
                            {"main.tf",
                             "resource \"x\" \"test\" {\n"
                             "  first  = var.alpha\n"
                             "  second = var.beta\n"
                             "}\n"}};
        const auto result = lintDirectory(files);
        if (!expectSites(result, "ST.009", {"variables.tf:1", "variables.tf:6"}, "variable order"))
        {
            return false;
        }

        // Presenting the files in a different order must not change the outcome.
        const auto reversed = lintDirectory({files[1], files[0]});
        if (result.violations.size() != reversed.violations.size())
        {
            std::cerr << "violation count depends on input order\n";
            return false;
        }
        for (std::size_t i = 0; i < result.violations.size(); ++i)
        {
            const auto& lhs = result.violations[i];
            const auto& rhs = reversed.violations[i];
            if (lhs.filePath != rhs.filePath || lhs.line != rhs.line || lhs.ruleId != rhs.ruleId ||
                lhs.message != rhs.message)
            {
                std::cerr << "violation order depends on input order at index " << i << "\n";
                return false;
            }
        }
    }

    {
        const auto result = lintDirectory({{"variables.tf",
                                            "variable \"zone\" {\n"
                                            "  type = string\n"
                                            "}\n"},
                                           {"main.tf",
                                            "data \"images\" \"test\" {\n"
                                            "  zone   = var.zone\n"
                                            "  filter = var.ghost\n"
                                            "}\n"}});
        if (!expectSites(result, "ST.002", {"main.tf:2", "main.tf:3"}, "data source defaults"))
        {
            return false;
        }
        bool sawUndefined = false;
        for (const auto& violation : result.violations)
        {
            if (violation.ruleId == "ST.002" && violation.message.find("'ghost'") != std::string::npos &&
                violation.message.find("not defined") != std::string::npos)
            {
                sawUndefined = true;
            }
        }
        if (!sawUndefined)
        {
            std::cerr << "expected an undefined data source variable to be reported\n";
            return false;
        }
    }

    return true;
}
