//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Terraform version numbers and version constraint strings.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_LINT_VERSION_CONSTRAINT_H
#define TFCHECK_LINT_VERSION_CONSTRAINT_H

#include "llvm/Support/Error.h"

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tfcheck::lint
{

/// @brief `MAJOR.MINOR.PATCH` version; missing components are zero.
struct SemanticVersion final
{
    std::uint32_t majorVersion{0};
    std::uint32_t minorVersion{0};
    std::uint32_t patchVersion{0};

    auto operator<=>(const SemanticVersion&) const = default;

    /// @brief Formats as `MAJOR.MINOR.PATCH`.
    [[nodiscard]] std::string str() const;
};

/// @brief Parses `1`, `1.2`, `1.2.3` or `v1.2.3`; a pre-release suffix is ignored.
/// @param[in] text Version text.
/// @return Parsed version, or empty when malformed.
[[nodiscard]] std::optional<SemanticVersion> parseSemanticVersion(const std::string& text);

/// @brief One `OPERATOR VERSION` clause of a constraint.
struct ConstraintClause final
{
    /// @brief Operator: `=`, `!=`, `>`, `>=`, `<`, `<=` or `~>`.
    std::string op;

    /// @brief Version operand.
    SemanticVersion version;
};

/// @brief Parses a comma separated constraint such as `>= 1.3.0, < 2.0`.
/// @param[in] text Constraint text without quotes.
/// @return Clauses, or an error naming the malformed clause.
[[nodiscard]] llvm::Expected<std::vector<ConstraintClause>> parseVersionConstraint(const std::string& text);

/// @brief Returns the lower bound admitted by a constraint.
///
/// A constraint admitting only versions at or above the returned bound
/// satisfies any requirement not above it. `>` and `>=` give the same bound
/// for this purpose. Without a lower bounding clause the bound is `0.0.0`.
///
/// @param[in] clauses Parsed clauses.
/// @return Lower bound.
[[nodiscard]] SemanticVersion lowerBound(const std::vector<ConstraintClause>& clauses);

}  // namespace tfcheck::lint

#endif  // TFCHECK_LINT_VERSION_CONSTRAINT_H
