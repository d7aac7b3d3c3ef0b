//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// In-memory representation of one Terraform source file.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_FRONTEND_SOURCE_FILE_H
#define TFCHECK_FRONTEND_SOURCE_FILE_H

#include "llvm/Support/Error.h"

#include <cstdint>
#include <string>
#include <vector>

namespace tfcheck
{

/// @brief Syntactic flavour of a source file, derived from its extension.
enum class SourceFileKind
{
    /// @brief `.tf` configuration file.
    Configuration,

    /// @brief `.tfvars` variable assignment file.
    VariableValues,
};

/// @brief Immutable snapshot of one source file.
struct SourceFile final
{
    /// @brief Path as discovered, used for reporting.
    std::string path;

    /// @brief Directory containing the file, used to group cross-file checks.
    std::string directory;

    /// @brief File name without directory.
    std::string fileName;

    /// @brief Flavour of the file.
    SourceFileKind kind{SourceFileKind::Configuration};

    /// @brief Full source text.
    std::string text;

    /// @brief Lines without terminators; line `n` lives at index `n - 1`.
    std::vector<std::string> lines;

    /// @brief True when the text ends with a line terminator.
    bool endsWithNewline{false};

    /// @brief Returns the number of lines.
    [[nodiscard]] std::uint32_t lineCount() const
    {
        return static_cast<std::uint32_t>(lines.size());
    }

    /// @brief Returns one line by 1-based number.
    /// @param[in] number 1-based line number within `[1, lineCount()]`.
    /// @return Line text.
    [[nodiscard]] const std::string& line(std::uint32_t number) const
    {
        return lines[number - 1];
    }
};

/// @brief Builds a source snapshot from text already in memory.
/// @param[in] path Path used for reporting and directory grouping.
/// @param[in] text Full file contents.
/// @return Source snapshot.
[[nodiscard]] SourceFile makeSourceFile(std::string path, std::string text);

/// @brief Reads a source file from disk.
/// @param[in] path File path.
/// @return Source snapshot or an I/O error.
[[nodiscard]] llvm::Expected<SourceFile> readSourceFile(const std::string& path);

/// @brief Returns true for file names the analyzer consumes.
/// @param[in] fileName File name or path.
/// @return True for `.tf` and `.tfvars` names.
[[nodiscard]] bool isTerraformSourceName(const std::string& fileName);

}  // namespace tfcheck

#endif  // TFCHECK_FRONTEND_SOURCE_FILE_H
