//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Inline suppression directives.
///
/// A comment line `# ST.001 Disable` silences rule `ST.001` from the next
/// line on; `# ST.001 Enable` ends the most recent open range for that rule,
/// the Enable line itself still being silenced. Ranges are per file and per
/// rule ID.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_LINT_SUPPRESSION_H
#define TFCHECK_LINT_SUPPRESSION_H

#include "tfcheck/Frontend/LineScanner.h"
#include "tfcheck/Frontend/SourceFile.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tfcheck::lint
{

/// @brief Line interval where one rule is inactive in one file.
struct SuppressionRange final
{
    /// @brief Suppressed rule ID.
    std::string ruleId;

    /// @brief File the directive appears in.
    std::string filePath;

    /// @brief First suppressed line (the line after the Disable directive).
    std::uint32_t startLine{1};

    /// @brief Last suppressed line (the Enable directive line); empty when open to end of file.
    std::optional<std::uint32_t> endLine;

    /// @brief Returns true when the 1-based line lies in the range.
    [[nodiscard]] bool contains(std::uint32_t line) const
    {
        return line >= startLine && (!endLine || line <= *endLine);
    }
};

/// @brief Per-file suppression ranges keyed by rule ID.
class SuppressionMap final
{
public:
    /// @brief Appends a range.
    void add(SuppressionRange range);

    /// @brief Returns true when the rule is suppressed on the 1-based line.
    [[nodiscard]] bool isSuppressed(const std::string& ruleId, std::uint32_t line) const;

    /// @brief Returns the ranges of one rule in directive order.
    [[nodiscard]] const std::vector<SuppressionRange>& rangesFor(const std::string& ruleId) const;

    /// @brief Returns true when no range exists.
    [[nodiscard]] bool empty() const
    {
        return ranges_.empty();
    }

private:
    std::map<std::string, std::vector<SuppressionRange>> ranges_;
};

/// @brief Parsed suppression directive.
struct SuppressionDirective final
{
    /// @brief Rule ID.
    std::string ruleId;

    /// @brief True for Disable, false for Enable.
    bool disable{true};
};

/// @brief Parses one comment line as a directive.
/// @param[in] line Raw line text.
/// @return Directive, or empty when the line is not one.
[[nodiscard]] std::optional<SuppressionDirective> parseSuppressionDirective(const std::string& line);

/// @brief Collects suppression ranges of one file.
/// @param[in] source Source snapshot.
/// @param[in] scan Scanner output; heredoc lines never carry directives.
/// @return Suppression ranges.
[[nodiscard]] SuppressionMap scanSuppressions(const SourceFile& source, const ScanResult& scan);

}  // namespace tfcheck::lint

#endif  // TFCHECK_LINT_SUPPRESSION_H
