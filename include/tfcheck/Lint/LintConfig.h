//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Lint run configuration and its JSON representation.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_LINT_LINT_CONFIG_H
#define TFCHECK_LINT_LINT_CONFIG_H

#include "tfcheck/Frontend/Discovery.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstddef>
#include <string>
#include <vector>

namespace tfcheck::lint
{

/// @brief Canonical file names assumed by the directory-level rules.
struct CanonicalFileNames final
{
    /// @brief File that holds all `variable` blocks.
    std::string variables{"variables.tf"};

    /// @brief File that holds all `output` blocks.
    std::string outputs{"outputs.tf"};

    /// @brief Variable value file checked for required variables.
    std::string tfvars{"terraform.tfvars"};

    /// @brief File that declares `required_version` and `required_providers`.
    std::string providers{"providers.tf"};

    /// @brief File whose references define the expected variable order.
    std::string main{"main.tf"};
};

/// @brief Options of one lint run.
struct LintConfig final
{
    /// @brief Selected category codes; empty selects all.
    std::vector<std::string> categories;

    /// @brief Rule IDs that never run.
    std::vector<std::string> excludedRules;

    /// @brief Discovery filters.
    DiscoveryOptions discovery;

    /// @brief Worker count; 0 selects the hardware concurrency.
    std::size_t jobs{0};

    /// @brief Required instance label of `resource` and `data` blocks.
    std::string fixedInstanceLabel{"test"};

    /// @brief Canonical file names.
    CanonicalFileNames files;

    /// @brief Variables exempt from the required, order, and unused checks.
    std::vector<std::string> allowListNames{"access_key",
                                            "secret_key",
                                            "domain_name",
                                            "tenant_name",
                                            "tenant_id",
                                            "user_name",
                                            "user_id",
                                            "project_name",
                                            "project_id"};

    /// @brief Variable name prefixes exempt from the same checks.
    std::vector<std::string> allowListPrefixes{"region"};

    /// @brief Providers verified through the version oracle; empty verifies all.
    std::vector<std::string> oracleProviders;

    /// @brief Returns true when a variable name is on the allow-list.
    [[nodiscard]] bool isAllowListed(const std::string& variableName) const;
};

/// @brief Applies a JSON configuration object on top of an existing configuration.
///
/// Recognized keys: `categories`, `excludedRules`, `includePaths`,
/// `excludePaths`, `jobs`, `fixedInstanceLabel`, `files` (object with
/// `variables`, `outputs`, `tfvars`, `providers`, `main`),
/// `allowList` (object with `names` and `prefixes`), and `oracleProviders`.
/// Unknown keys are ignored.
///
/// @param[in] value Parsed JSON document.
/// @param[in,out] config Configuration updated in place.
/// @return Error when a known key carries a value of the wrong type.
[[nodiscard]] llvm::Error applyLintConfigJson(const llvm::json::Value& value, LintConfig& config);

/// @brief Reads a JSON configuration file and applies it.
/// @param[in] path Configuration file path.
/// @param[in,out] config Configuration updated in place.
/// @return Error on I/O, JSON syntax, or type failures.
[[nodiscard]] llvm::Error loadLintConfigFile(const std::string& path, LintConfig& config);

}  // namespace tfcheck::lint

#endif  // TFCHECK_LINT_LINT_CONFIG_H
