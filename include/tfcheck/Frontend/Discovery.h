//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Source discovery for Terraform configuration trees.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_FRONTEND_DISCOVERY_H
#define TFCHECK_FRONTEND_DISCOVERY_H

#include "tfcheck/Frontend/SourceFile.h"
#include "tfcheck/Support/Diagnostics.h"

#include <string>
#include <vector>

namespace tfcheck
{

/// @brief Path filters applied during discovery.
struct DiscoveryOptions final
{
    /// @brief When non-empty, only paths containing one of these substrings are kept.
    std::vector<std::string> includePaths;

    /// @brief Paths containing any of these substrings are dropped.
    std::vector<std::string> excludePaths;
};

/// @brief Discovers and loads `.tf` and `.tfvars` files below the given roots.
///
/// Roots may be directories, searched recursively with hidden directories
/// skipped, or individual files. The result is ordered by directory and then
/// by file name, which is the traversal order used for reporting.
///
/// @param[in] roots Root directories or files.
/// @param[in] options Path filters.
/// @param[in,out] diagnostics Diagnostic sink for discovery and I/O issues.
/// @return Loaded source snapshots in traversal order.
[[nodiscard]] std::vector<SourceFile> discoverSources(const std::vector<std::string>& roots,
                                                      const DiscoveryOptions&         options,
                                                      DiagnosticEngine&               diagnostics);

/// @brief Returns true when a path passes the include and exclude filters.
/// @param[in] path Generic path string.
/// @param[in] options Path filters.
/// @return True when the path is kept.
[[nodiscard]] bool passesPathFilters(const std::string& path, const DiscoveryOptions& options);

/// @brief Orders sources by directory, then by file name.
/// @param[in,out] sources Sources to sort in place.
void sortInTraversalOrder(std::vector<SourceFile>& sources);

}  // namespace tfcheck

#endif  // TFCHECK_FRONTEND_DISCOVERY_H
