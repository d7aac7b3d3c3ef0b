//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Structural model of a Terraform file: blocks, parameters, and labels.
///
/// The model is line-accurate rather than expression-accurate. Parameter
/// values are kept as raw text and never evaluated.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_FRONTEND_BLOCK_H
#define TFCHECK_FRONTEND_BLOCK_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tfcheck
{

/// @brief Block categories distinguished by the analyzer.
enum class BlockKind
{
    /// @brief Synthetic file-level root.
    Root,

    /// @brief `resource "TYPE" "NAME"`.
    Resource,

    /// @brief `data "TYPE" "NAME"`.
    Data,

    /// @brief `variable "NAME"`.
    Variable,

    /// @brief `output "NAME"`.
    Output,

    /// @brief `locals`.
    Locals,

    /// @brief `terraform`.
    Terraform,

    /// @brief `provider "NAME"`.
    Provider,

    /// @brief `module "NAME"`.
    Module,

    /// @brief `dynamic "NAME"` inside another block.
    Dynamic,

    /// @brief Any other nested block such as `lifecycle` or `ingress`.
    NestedStructure,

    /// @brief Any other top-level block such as `moved` or `import`.
    Other,
};

/// @brief Value shape of a block member.
enum class ParameterShape
{
    /// @brief Single expression such as a literal, reference, or call.
    Scalar,

    /// @brief Object `{ ... }` or tuple `[ ... ]` literal.
    CollectionLiteral,

    /// @brief Nested block without `=`.
    NestedBlock,

    /// @brief `dynamic` block.
    DynamicBlock,
};

/// @brief One block label as written in the header.
struct BlockLabel final
{
    /// @brief Label text without quotes.
    std::string text;

    /// @brief Quote character, or `\0` for a bare label.
    char quote{'\0'};

    /// @brief 0-based column of the label's first character, quote included.
    std::uint32_t column{0};
};

/// @brief `name = value` assignment inside a block or object literal.
struct Parameter final
{
    /// @brief Parameter name without quotes; empty for an anonymous object in a tuple.
    std::string name;

    /// @brief Raw value text after `=`, spanning lines when the value does.
    std::string value;

    /// @brief 1-based line of the name.
    std::uint32_t line{0};

    /// @brief 1-based line where the value ends.
    std::uint32_t endLine{0};

    /// @brief 0-based column of the name, quote included.
    std::uint32_t indent{0};

    /// @brief 0-based column of `=`.
    std::uint32_t equalsColumn{0};

    /// @brief True when the name is written in double quotes.
    bool isQuotedName{false};

    /// @brief True for `count`, `for_each`, `provider`, `lifecycle` and `depends_on`.
    bool isMeta{false};

    /// @brief Value shape.
    ParameterShape shape{ParameterShape::Scalar};

    /// @brief Entries of an object literal value, or anonymous objects of a tuple value.
    std::vector<Parameter> entries;

    /// @brief Returns the name width used for `=` alignment.
    [[nodiscard]] std::uint32_t alignmentWidth() const
    {
        return static_cast<std::uint32_t>(name.size()) + (isQuotedName ? 2U : 0U);
    }
};

/// @brief Brace-delimited construct with its members.
struct Block final
{
    /// @brief Block category.
    BlockKind kind{BlockKind::Root};

    /// @brief Header keyword such as `resource` or `lifecycle`; empty for the root.
    std::string keyword;

    /// @brief First label, such as the resource type or the variable name.
    std::optional<BlockLabel> typeLabel;

    /// @brief Second label, such as the resource instance name.
    std::optional<BlockLabel> nameLabel;

    /// @brief 1-based line of the header.
    std::uint32_t startLine{1};

    /// @brief 1-based line of the closing brace.
    std::uint32_t endLine{1};

    /// @brief Number of enclosing non-root blocks; 0 for top-level blocks and the root.
    std::uint32_t depth{0};

    /// @brief 0-based column of the keyword.
    std::uint32_t indent{0};

    /// @brief Parameters in source order.
    std::vector<Parameter> parameters;

    /// @brief Nested blocks in source order.
    std::vector<Block> children;

    /// @brief Returns the label carrying the block's own name.
    ///
    /// For `resource` and `data` this is the second label; for single-label
    /// blocks it is the first.
    [[nodiscard]] const BlockLabel* instanceLabel() const;

    /// @brief Finds a direct parameter by name.
    [[nodiscard]] const Parameter* findParameter(const std::string& name) const;

    /// @brief Finds the first direct child block by keyword.
    [[nodiscard]] const Block* findChild(const std::string& keyword) const;
};

/// @brief One member of a block body in source order, parameter or nested block.
struct BlockMember final
{
    /// @brief Member name: parameter name, or block keyword (dynamic blocks use their label).
    std::string name;

    /// @brief 1-based first line.
    std::uint32_t line{0};

    /// @brief 1-based last line.
    std::uint32_t endLine{0};

    /// @brief Member shape.
    ParameterShape shape{ParameterShape::Scalar};

    /// @brief True for meta-arguments.
    bool isMeta{false};

    /// @brief Parameter pointer for parameters, otherwise null.
    const Parameter* parameter{nullptr};

    /// @brief Block pointer for nested blocks, otherwise null.
    const Block* block{nullptr};
};

/// @brief Returns true when the name is a Terraform meta-argument.
[[nodiscard]] bool isMetaArgumentName(const std::string& name);

/// @brief Returns a block's parameters and nested blocks merged in line order.
/// @param[in] block Block whose body is listed.
/// @return Members sorted by first line.
[[nodiscard]] std::vector<BlockMember> memberSequence(const Block& block);

/// @brief Visits a block and all descendants depth-first in source order.
/// @tparam Visitor Callable taking `const Block&`.
template <typename Visitor>
void forEachBlock(const Block& block, Visitor&& visitor)
{
    visitor(block);
    for (const Block& child : block.children)
    {
        forEachBlock(child, visitor);
    }
}

/// @brief Returns the printable name of a block kind.
[[nodiscard]] const char* blockKindName(BlockKind kind);

}  // namespace tfcheck

#endif  // TFCHECK_FRONTEND_BLOCK_H
