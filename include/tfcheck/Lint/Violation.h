//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Lint violation record, severities, and rule categories.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_LINT_VIOLATION_H
#define TFCHECK_LINT_VIOLATION_H

#include <cstdint>
#include <optional>
#include <string>

namespace tfcheck::lint
{

/// @brief Violation severity.
enum class Severity
{
    /// @brief Non-blocking finding.
    Warning,

    /// @brief Blocking finding.
    Error,
};

/// @brief Rule family, identified by the two-letter prefix of rule IDs.
enum class RuleCategory
{
    /// @brief `ST`: style and formatting.
    Style,

    /// @brief `IO`: input variables and outputs.
    InputOutput,

    /// @brief `DC`: documentation and comments.
    Documentation,

    /// @brief `SC`: safe coding.
    Security,

    /// @brief Pseudo category of `SYSTEM` findings such as parse failures.
    System,
};

/// @brief Pseudo rule ID for findings produced by the tool itself.
inline constexpr const char* kSystemRuleId = "SYSTEM";

/// @brief One lint finding.
struct Violation final
{
    /// @brief Path of the file (or directory) the finding is attributed to.
    std::string filePath;

    /// @brief Rule identifier such as `ST.001`.
    std::string ruleId;

    /// @brief Rule category.
    RuleCategory category{RuleCategory::Style};

    /// @brief Severity.
    Severity severity{Severity::Error};

    /// @brief Human-readable message.
    std::string message;

    /// @brief 1-based line; 0 when the finding concerns a whole directory.
    std::uint32_t line{0};
};

/// @brief Returns `warning` or `error`.
[[nodiscard]] const char* severityName(Severity severity);

/// @brief Returns the two-letter code of a category, or `SYSTEM`.
[[nodiscard]] const char* categoryCode(RuleCategory category);

/// @brief Returns the display title of a category.
[[nodiscard]] const char* categoryTitle(RuleCategory category);

/// @brief Parses a category code such as `ST`.
/// @param[in] code Category code; case-sensitive.
/// @return Category, or empty for an unknown code.
[[nodiscard]] std::optional<RuleCategory> parseCategoryCode(const std::string& code);

/// @brief Derives the category from a rule ID prefix.
/// @param[in] ruleId Rule identifier.
/// @return Category, or empty when the prefix is unknown.
[[nodiscard]] std::optional<RuleCategory> categoryOfRuleId(const std::string& ruleId);

}  // namespace tfcheck::lint

#endif  // TFCHECK_LINT_VIOLATION_H
