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
#include "tfcheck/Lint/VersionOracle.h"
#include "llvm/Support/Error.h"

namespace
{

using FileSet = std::vector<std::pair<std::string, std::string>>;

/// Oracle with canned verdicts per provider.
class CannedVersionOracle final : public tfcheck::lint::VersionOracle
{
public:
    llvm::Expected<tfcheck::lint::VersionVerdict> isVersionValid(const std::string& provider,
                                                                 const std::string& constraint) const override
    {
        ++calls_;
        lastConstraint_ = constraint;
        if (provider == "huaweicloud")
        {
            return tfcheck::lint::VersionVerdict::TooPermissive;
        }
        if (provider.rfind("offline", 0) == 0)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(), "registry unavailable");
        }
        return tfcheck::lint::VersionVerdict::Valid;
    }

    std::uint32_t calls() const
    {
        return calls_;
    }

    const std::string& lastConstraint() const
    {
        return lastConstraint_;
    }

private:
    mutable std::uint32_t calls_{0};
    mutable std::string   lastConstraint_;
};

tfcheck::lint::LintRunResult lintDirectory(const FileSet&                      files,
                                           const tfcheck::lint::VersionOracle* oracle = nullptr,
                                           const tfcheck::lint::LintConfig&    config = {})
{
    std::vector<tfcheck::SourceFile> sources;
    for (const auto& [name, text] : files)
    {
        sources.push_back(tfcheck::makeSourceFile("/tmp/tfcheck/safety/module/" + name, text));
    }
    tfcheck::lint::LintEngine                    engine;
    llvm::Expected<tfcheck::lint::LintRunResult> result = engine.runSources(std::move(sources), config, oracle);
    if (!result)
    {
        std::cerr << "lint run failed: " << llvm::toString(result.takeError()) << "\n";
        return {};
    }
    return std::move(*result);
}

std::vector<const tfcheck::lint::Violation*> violationsOf(const tfcheck::lint::LintRunResult& result,
                                                          const std::string&                 ruleId)
{
    std::vector<const tfcheck::lint::Violation*> out;
    for (const tfcheck::lint::Violation& violation : result.violations)
    {
        if (violation.ruleId == ruleId)
        {
            out.push_back(&violation);
        }
    }
    return out;
}

bool expectSingle(const tfcheck::lint::LintRunResult& result,
                  const std::string&                 ruleId,
                  const std::uint32_t                line,
                  const std::string&                 message)
{
    const auto found = violationsOf(result, ruleId);
    if (found.size() != 1 || found.front()->line != line || found.front()->message != message)
    {
        std::cerr << "expected one " << ruleId << " at line " << line << " saying '" << message << "', got "
                  << found.size();
        if (!found.empty())
        {
            std::cerr << " first at line " << found.front()->line << ": " << found.front()->message;
        }
        std::cerr << "\n";
        return false;
    }
    return true;
}

std::string providersFile(const std::string& requiredVersion)
{
    return "terraform {\n"
           "  required_version = \"" +
           requiredVersion + "\"\n}\n";
}

}  // namespace

bool runSafetyRuleTests()
{
    {
        const auto result = lintDirectory({{"main.tf",
                                            "locals {\n"
                                            "  ids = [for s in var.subnets : s.id]\n"
                                            "}\n"
                                            "\n"
                                            "resource \"x\" \"test\" {\n"
                                            "  first  = local.ids[0]\n"
                                            "  safe   = try(local.ids[1], \"\")\n"
                                            "  subnet = var.subnets[0]\n"
                                            "  name   = var.name[0]\n"
                                            "  image  = data.images.test.ids[0].name\n"
                                            "}\n"},
                                           {"variables.tf",
                                            "variable \"subnets\" {\n"
                                            "  type = list(string)\n"
                                            "}\n"
                                            "\n"
                                            "variable \"name\" {\n"
                                            "  type = string\n"
                                            "}\n"}});
        const auto found = violationsOf(result, "SC.001");
        if (found.size() != 3 || found[0]->line != 6 || found[1]->line != 8 || found[2]->line != 10)
        {
            std::cerr << "expected unsafe index findings on lines 6, 8 and 10, got " << found.size() << "\n";
            return false;
        }
        if (found[0]->message !=
                "Unsafe array index access detected in for expression result: 'local.ids[0]'. Use try() function "
                "to prevent index out of bounds errors. Suggestion: try(local.ids[0], \"default_value\")" ||
            found[0]->severity != tfcheck::lint::Severity::Warning)
        {
            std::cerr << "unexpected unsafe index message: " << found[0]->message << "\n";
            return false;
        }
        if (found[2]->message.find("'data.images.test.ids[0].name'") == std::string::npos)
        {
            std::cerr << "expected the data source access path to include the attribute chain\n";
            return false;
        }
    }

    {
        // A try() call spanning lines protects every access inside its parentheses.
        const auto result = lintDirectory({{"main.tf",
                                            "resource \"x\" \"test\" {\n"
                                            "  id = try(\n"
                                            "    data.images.test.ids[0].id,\n"
                                            "    null\n"
                                            "  )\n"
                                            "  other = data.images.test.ids[1].id\n"
                                            "  entry = retry(\n"
                                            "    data.images.test.ids[2].id\n"
                                            "  )\n"
                                            "}\n"}});
        const auto found = violationsOf(result, "SC.001");
        if (found.size() != 2 || found[0]->line != 6 || found[1]->line != 8)
        {
            std::cerr << "expected unsafe index findings only outside the multi-line try(), got " << found.size()
                      << "\n";
            return false;
        }
    }

    {
        const auto noBlock = lintDirectory({{"providers.tf", "provider \"huaweicloud\" {\n}\n"}});
        if (!expectSingle(noBlock, "SC.002", 1, "Missing terraform block with required_version declaration"))
        {
            return false;
        }

        const auto noVersion = lintDirectory({{"providers.tf",
                                               "provider \"huaweicloud\" {\n"
                                               "}\n"
                                               "\n"
                                               "terraform {\n"
                                               "}\n"}});
        if (!expectSingle(noVersion, "SC.002", 4, "terraform block found but missing required_version declaration"))
        {
            return false;
        }

        const auto malformed = lintDirectory({{"providers.tf", providersFile(">= one.two")}});
        if (!expectSingle(malformed,
                          "SC.002",
                          2,
                          "Invalid version constraint format: '>= one.two'. Use format like '>= 1.3.0' or '~> 1.0'") ||
            !violationsOf(malformed, "SC.003").empty())
        {
            return false;
        }

        const auto wellFormed = lintDirectory({{"providers.tf", providersFile(">= 1.3.0, < 2.0.0")}});
        if (!violationsOf(wellFormed, "SC.002").empty())
        {
            std::cerr << "a well-formed constraint must not be reported\n";
            return false;
        }

        const auto absent = lintDirectory({{"main.tf", "locals {\n}\n"}});
        if (!violationsOf(absent, "SC.002").empty())
        {
            std::cerr << "a directory without a providers file must not be reported\n";
            return false;
        }
    }

    {
        const std::string variables = "variable \"settings\" {\n"
                                      "  type     = object({ name = optional(string) })\n"
                                      "  nullable = false\n"
                                      "}\n";
        const auto tooLow = lintDirectory({{"providers.tf", providersFile(">= 1.0.0")}, {"variables.tf", variables}});
        if (!expectSingle(tooLow,
                          "SC.003",
                          2,
                          "Declared version '>= 1.0.0' is too low. Required: '>= 1.3.0' based on features "
                          "'nullable', 'optional()' used"))
        {
            return false;
        }

        const auto sufficient =
            lintDirectory({{"providers.tf", providersFile("~> 1.3.0")}, {"variables.tf", variables}});
        if (!violationsOf(sufficient, "SC.003").empty())
        {
            std::cerr << "a sufficient required_version must not be reported\n";
            return false;
        }

        const auto baseline = lintDirectory({{"providers.tf", providersFile(">= 0.11.0")}});
        if (!expectSingle(baseline,
                          "SC.003",
                          2,
                          "Declared version '>= 0.11.0' is too low. Required: '>= 0.12.0' (no special feature used)"))
        {
            return false;
        }

        const auto crossValidation = lintDirectory({{"providers.tf", providersFile(">= 1.5.0")},
                                                    {"variables.tf",
                                                     "variable \"low\" {\n"
                                                     "  type = number\n"
                                                     "}\n"
                                                     "\n"
                                                     "variable \"high\" {\n"
                                                     "  type = number\n"
                                                     "\n"
                                                     "  validation {\n"
                                                     "    condition     = var.high > var.low\n"
                                                     "    error_message = \"High must exceed low.\"\n"
                                                     "  }\n"
                                                     "}\n"}});
        const auto found = violationsOf(crossValidation, "SC.003");
        if (found.size() != 1 ||
            found.front()->message.find("'other variables are referenced in validation.condition'") ==
                std::string::npos ||
            found.front()->message.find("'>= 1.9.0'") == std::string::npos)
        {
            std::cerr << "expected cross-variable validation to require 1.9.0\n";
            return false;
        }
    }

    {
        const std::string providers = "terraform {\n"
                                      "  required_version = \">= 1.3.0\"\n"
                                      "\n"
                                      "  required_providers {\n"
                                      "    huaweicloud = {\n"
                                      "      source  = \"huaweicloud/huaweicloud\"\n"
                                      "      version = \">= 1.40.0\"\n"
                                      "    }\n"
                                      "    offline = {\n"
                                      "      source  = \"example/offline\"\n"
                                      "      version = \"~> 2.0\"\n"
                                      "    }\n"
                                      "  }\n"
                                      "}\n";

        const auto withoutOracle = lintDirectory({{"providers.tf", providers}});
        if (!violationsOf(withoutOracle, "SC.004").empty())
        {
            std::cerr << "provider versions must not be judged without an oracle\n";
            return false;
        }

        const CannedVersionOracle oracle;
        const auto                judged = lintDirectory({{"providers.tf", providers}}, &oracle);
        const auto                found  = violationsOf(judged, "SC.004");
        if (found.size() != 2 || oracle.calls() != 2)
        {
            std::cerr << "expected two provider findings from two oracle calls, got " << found.size() << "\n";
            return false;
        }
        if (found[0]->line != 7 || found[0]->severity != tfcheck::lint::Severity::Error ||
            found[0]->message !=
                "Version constraint '>= 1.40.0' for provider 'huaweicloud' is too permissive. A previous provider "
                "version also works; consider using a more restrictive version constraint.")
        {
            std::cerr << "unexpected permissive constraint finding: " << found[0]->message << "\n";
            return false;
        }
        if (found[1]->line != 11 || found[1]->severity != tfcheck::lint::Severity::Warning ||
            found[1]->message.find("could not be completed: registry unavailable") == std::string::npos)
        {
            std::cerr << "unexpected oracle failure finding: " << found[1]->message << "\n";
            return false;
        }

        tfcheck::lint::LintConfig config;
        config.oracleProviders = {"offline"};
        const CannedVersionOracle filteredOracle;
        const auto filtered = lintDirectory({{"providers.tf", providers}}, &filteredOracle, config);
        if (filteredOracle.calls() != 1 || filteredOracle.lastConstraint() != "~> 2.0" ||
            violationsOf(filtered, "SC.004").size() != 1)
        {
            std::cerr << "expected the provider filter to limit oracle calls\n";
            return false;
        }
    }

    {
        const std::string providers = "terraform {\n"
                                      "  required_version = \">= 1.3.0\"\n"
                                      "\n"
                                      "  required_providers {\n"
                                      "    offline = {\n"
                                      "      version = \"~> 2.0\"\n"
                                      "    }\n"
                                      "    offline_mirror = {\n"
                                      "      version = \"~> 3.0\"\n"
                                      "    }\n"
                                      "  }\n"
                                      "}\n";
        const CannedVersionOracle oracle;
        const auto                result = lintDirectory({{"providers.tf", providers}}, &oracle);
        const auto                found  = violationsOf(result, "SC.004");
        if (found.size() != 1 || oracle.calls() != 1 || found.front()->line != 6 ||
            found.front()->severity != tfcheck::lint::Severity::Warning)
        {
            std::cerr << "expected a single incomplete-check warning for an unreachable oracle, got "
                      << found.size() << "\n";
            return false;
        }
    }

    {
        const auto result = lintDirectory({{"variables.tf",
                                            "variable \"db_password\" {\n"
                                            "  type = string\n"
                                            "}\n"
                                            "\n"
                                            "variable \"email\" {\n"
                                            "  type      = string\n"
                                            "  sensitive = true\n"
                                            "}\n"
                                            "\n"
                                            "variable \"username\" {\n"
                                            "  type = string\n"
                                            "}\n"
                                            "\n"
                                            "variable \"AdminPhone\" {\n"
                                            "  type      = string\n"
                                            "  sensitive = false\n"
                                            "}\n"}});
        const auto found = violationsOf(result, "SC.005");
        if (found.size() != 2 || found[0]->line != 1 || found[1]->line != 14)
        {
            std::cerr << "expected sensitive findings on lines 1 and 14, got " << found.size() << "\n";
            return false;
        }
        if (found[0]->message != "Sensitive variable 'db_password' must be declared with 'sensitive = true' to "
                                 "prevent data exposure in Terraform state and logs.")
        {
            std::cerr << "unexpected sensitive variable message: " << found[0]->message << "\n";
            return false;
        }
    }

    return true;
}
