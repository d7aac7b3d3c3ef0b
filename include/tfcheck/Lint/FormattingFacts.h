//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Layout facts shared by the formatting rules.
///
/// Tab, indentation and alignment checks depend on each other: alignment is
/// not reported on lines that already carry a tab or indentation finding.
/// Keeping the three computations here lets each rule stay independent.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_LINT_FORMATTING_FACTS_H
#define TFCHECK_LINT_FORMATTING_FACTS_H

#include "tfcheck/Frontend/Block.h"
#include "tfcheck/Lint/Document.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tfcheck::lint
{

/// @brief One line-attributed layout finding.
struct LayoutIssue final
{
    /// @brief 1-based line.
    std::uint32_t line{0};

    /// @brief Description.
    std::string message;
};

/// @brief Returns the number of leading space or tab characters.
[[nodiscard]] std::uint32_t leadingWhitespaceWidth(const std::string& line);

/// @brief Returns true when the leading whitespace of `line` holds a tab.
[[nodiscard]] bool hasTabIndentation(const std::string& line);

/// @brief Returns the ST.004 finding for one line, if any.
[[nodiscard]] std::optional<std::string> tabProblem(const LintDocument& document, std::uint32_t line);

/// @brief Returns the ST.005 finding for one line, if any.
///
/// The expected indentation is two spaces per open bracket line. Lines that
/// continue an expression may go deeper in steps of two.
[[nodiscard]] std::optional<std::string> indentationProblem(const LintDocument& document, std::uint32_t line);

/// @brief Computes ST.003 findings of a parsed document.
[[nodiscard]] std::vector<LayoutIssue> alignmentIssues(const LintDocument& document);

/// @brief Returns a short human-readable block designation.
[[nodiscard]] std::string describeBlock(const Block& block);

/// @brief Returns true for `[a-z][a-z0-9_]*`.
[[nodiscard]] bool isSnakeCaseIdentifier(const std::string& text);

/// @brief Counts blank lines strictly between two lines.
[[nodiscard]] std::uint32_t blankLinesBetween(const LintDocument& document, std::uint32_t after, std::uint32_t before);

}  // namespace tfcheck::lint

#endif  // TFCHECK_LINT_FORMATTING_FACTS_H
