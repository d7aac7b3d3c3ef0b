//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Interface of the provider version oracle.
///
/// Implementations answer whether a provider version constraint matches the
/// releases the provider actually publishes. Network access, caching, and
/// retries belong to implementations; the analyzer only interprets verdicts.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_LINT_VERSION_ORACLE_H
#define TFCHECK_LINT_VERSION_ORACLE_H

#include "llvm/Support/Error.h"

#include <string>

namespace tfcheck::lint
{

/// @brief Oracle verdict for one provider constraint.
enum class VersionVerdict
{
    /// @brief Constraint matches the published releases.
    Valid,

    /// @brief Constraint admits releases lacking required functionality.
    TooPermissive,

    /// @brief Constraint excludes current releases.
    TooRestrictive,

    /// @brief Constraint matches no published release.
    Unresolvable,
};

/// @brief Source of provider version verdicts.
///
/// Calls may come from several worker threads at once.
class VersionOracle
{
public:
    virtual ~VersionOracle() = default;

    /// @brief Judges one provider version constraint.
    /// @param[in] provider Provider local name such as `huaweicloud`.
    /// @param[in] constraint Declared constraint such as `>= 1.40.0`.
    /// @return Verdict, or an error when the oracle is unavailable.
    [[nodiscard]] virtual llvm::Expected<VersionVerdict> isVersionValid(const std::string& provider,
                                                                        const std::string& constraint) const = 0;
};

}  // namespace tfcheck::lint

#endif  // TFCHECK_LINT_VERSION_ORACLE_H
