//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Source location primitives shared by extraction, diagnostics, and lint rules.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_FRONTEND_SOURCE_LOCATION_H
#define TFCHECK_FRONTEND_SOURCE_LOCATION_H

#include <cstdint>
#include <string>

namespace tfcheck
{

/// @brief Identifies a concrete position in an input source file.
struct SourceLocation
{
    /// @brief Path to the source file or directory.
    std::string file;

    /// @brief 1-based source line.
    std::uint32_t line{1};

    /// @brief 1-based source column.
    std::uint32_t column{1};

    /// @brief Formats this location as a human-readable string.
    /// @return Formatted location text.
    [[nodiscard]] std::string str() const;
};

}  // namespace tfcheck

#endif  // TFCHECK_FRONTEND_SOURCE_LOCATION_H
