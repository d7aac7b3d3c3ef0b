//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Cross-file facts of one directory.
///
/// The index is built once per directory after every document of that
/// directory has been extracted, and it is read-only while directory rules
/// run.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_LINT_DIRECTORY_INDEX_H
#define TFCHECK_LINT_DIRECTORY_INDEX_H

#include "tfcheck/Frontend/Block.h"
#include "tfcheck/Lint/Document.h"
#include "tfcheck/Lint/LintConfig.h"

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace tfcheck::lint
{

/// @brief One `variable` block.
struct VariableDefinition final
{
    /// @brief Variable name.
    std::string name;

    /// @brief Defining document.
    const LintDocument* document{nullptr};

    /// @brief Defining block.
    const Block* block{nullptr};

    /// @brief 1-based header line.
    std::uint32_t line{0};

    /// @brief True when the block declares `default`.
    bool hasDefault{false};
};

/// @brief One `var.NAME` occurrence.
struct VariableReference final
{
    /// @brief Referenced variable name.
    std::string name;

    /// @brief Referencing document.
    const LintDocument* document{nullptr};

    /// @brief 1-based line.
    std::uint32_t line{0};

    /// @brief 0-based column of `var`.
    std::uint32_t column{0};
};

/// @brief One entry of a `locals` block.
struct LocalDefinition final
{
    /// @brief Local name.
    std::string name;

    /// @brief Defining document.
    const LintDocument* document{nullptr};

    /// @brief Defining parameter.
    const Parameter* parameter{nullptr};
};

/// @brief Facts shared by the directory-level rules.
class DirectoryIndex final
{
public:
    /// @brief Builds the index of one directory.
    /// @param[in] directory Directory path.
    /// @param[in] documents Documents of the directory in traversal order.
    /// @return Index; documents must outlive it.
    [[nodiscard]] static DirectoryIndex build(std::string directory, std::vector<const LintDocument*> documents);

    /// @brief Returns the directory path.
    [[nodiscard]] const std::string& directory() const
    {
        return directory_;
    }

    /// @brief Returns the documents in traversal order.
    [[nodiscard]] const std::vector<const LintDocument*>& documents() const
    {
        return documents_;
    }

    /// @brief Finds a document by file name.
    [[nodiscard]] const LintDocument* findDocument(const std::string& fileName) const;

    /// @brief Returns all variable definitions in traversal order.
    [[nodiscard]] const std::vector<VariableDefinition>& variables() const
    {
        return variables_;
    }

    /// @brief Finds the first definition of a variable.
    [[nodiscard]] const VariableDefinition* findVariable(const std::string& name) const;

    /// @brief Returns all references in traversal order.
    [[nodiscard]] const std::vector<VariableReference>& references() const
    {
        return references_;
    }

    /// @brief Returns the number of references to a variable.
    [[nodiscard]] std::size_t referenceCount(const std::string& name) const;

    /// @brief Returns the references located in one document, in line order.
    [[nodiscard]] std::vector<const VariableReference*> referencesIn(const LintDocument& document) const;

    /// @brief Returns all `locals` entries.
    [[nodiscard]] const std::vector<LocalDefinition>& locals() const
    {
        return locals_;
    }

    /// @brief Returns top-level keys of the given variable value file.
    /// @param[in] fileName Value file name.
    /// @return Keys; empty when the file does not exist.
    [[nodiscard]] std::set<std::string> valueFileKeys(const std::string& fileName) const;

private:
    std::string                                  directory_;
    std::vector<const LintDocument*>             documents_;
    std::vector<VariableDefinition>              variables_;
    std::vector<VariableReference>               references_;
    std::unordered_map<std::string, std::size_t> referenceCounts_;
    std::vector<LocalDefinition>                 locals_;
};

/// @brief Returns the text searched for references on one line.
///
/// Code lines contribute their comment-free code; heredoc bodies contribute
/// their raw text since templates may interpolate variables.
[[nodiscard]] std::string referenceText(const LintDocument& document, std::uint32_t line);

}  // namespace tfcheck::lint

#endif  // TFCHECK_LINT_DIRECTORY_INDEX_H
