//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Per-file analysis snapshot shared by all rules.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_LINT_DOCUMENT_H
#define TFCHECK_LINT_DOCUMENT_H

#include "tfcheck/Frontend/Block.h"
#include "tfcheck/Frontend/LineScanner.h"
#include "tfcheck/Frontend/SourceFile.h"
#include "tfcheck/Lint/Suppression.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace tfcheck::lint
{

/// @brief Structural failure recorded for a document.
struct ParseFailure final
{
    /// @brief 1-based line.
    std::uint32_t line{1};

    /// @brief Description.
    std::string message;
};

/// @brief Source, lexical scan, block tree, and suppressions of one file.
struct LintDocument final
{
    /// @brief Source snapshot.
    SourceFile source;

    /// @brief Lexical scan.
    ScanResult scan;

    /// @brief Block tree; empty when extraction failed.
    std::optional<Block> root;

    /// @brief Extraction failure, when any.
    std::optional<ParseFailure> parseFailure;

    /// @brief Suppression ranges.
    SuppressionMap suppressions;

    /// @brief Position in traversal order.
    std::size_t order{0};

    /// @brief Returns true when the block tree is available.
    [[nodiscard]] bool isParsed() const
    {
        return root.has_value();
    }

    /// @brief Returns true for `.tfvars` documents.
    [[nodiscard]] bool isVariableValues() const
    {
        return source.kind == SourceFileKind::VariableValues;
    }
};

/// @brief Scans, extracts, and collects suppressions for one file.
/// @param[in] source Source snapshot.
/// @param[in] order Position in traversal order.
/// @return Document; extraction failures are recorded, never thrown.
[[nodiscard]] LintDocument buildLintDocument(SourceFile source, std::size_t order);

}  // namespace tfcheck::lint

#endif  // TFCHECK_LINT_DOCUMENT_H
