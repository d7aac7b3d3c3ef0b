//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements block model queries.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Frontend/Block.h"

#include <algorithm>

namespace tfcheck
{

const BlockLabel* Block::instanceLabel() const
{
    if (kind == BlockKind::Resource || kind == BlockKind::Data)
    {
        return nameLabel ? &*nameLabel : nullptr;
    }
    return typeLabel ? &*typeLabel : nullptr;
}

const Parameter* Block::findParameter(const std::string& name) const
{
    for (const Parameter& parameter : parameters)
    {
        if (parameter.name == name)
        {
            return &parameter;
        }
    }
    return nullptr;
}

const Block* Block::findChild(const std::string& childKeyword) const
{
    for (const Block& child : children)
    {
        if (child.keyword == childKeyword)
        {
            return &child;
        }
    }
    return nullptr;
}

bool isMetaArgumentName(const std::string& name)
{
    return name == "count" || name == "for_each" || name == "provider" || name == "lifecycle" ||
           name == "depends_on";
}

std::vector<BlockMember> memberSequence(const Block& block)
{
    std::vector<BlockMember> out;
    out.reserve(block.parameters.size() + block.children.size());
    for (const Parameter& parameter : block.parameters)
    {
        out.push_back(BlockMember{parameter.name,
                                  parameter.line,
                                  parameter.endLine,
                                  parameter.shape,
                                  parameter.isMeta,
                                  &parameter,
                                  nullptr});
    }
    for (const Block& child : block.children)
    {
        const bool  dynamic = child.kind == BlockKind::Dynamic;
        std::string name    = dynamic && child.typeLabel ? child.typeLabel->text : child.keyword;
        out.push_back(BlockMember{std::move(name),
                                  child.startLine,
                                  child.endLine,
                                  dynamic ? ParameterShape::DynamicBlock : ParameterShape::NestedBlock,
                                  isMetaArgumentName(child.keyword),
                                  nullptr,
                                  &child});
    }
    std::stable_sort(out.begin(), out.end(), [](const BlockMember& lhs, const BlockMember& rhs) {
        return lhs.line < rhs.line;
    });
    return out;
}

const char* blockKindName(const BlockKind kind)
{
    switch (kind)
    {
    case BlockKind::Root:
        return "root";
    case BlockKind::Resource:
        return "resource";
    case BlockKind::Data:
        return "data";
    case BlockKind::Variable:
        return "variable";
    case BlockKind::Output:
        return "output";
    case BlockKind::Locals:
        return "locals";
    case BlockKind::Terraform:
        return "terraform";
    case BlockKind::Provider:
        return "provider";
    case BlockKind::Module:
        return "module";
    case BlockKind::Dynamic:
        return "dynamic";
    case BlockKind::NestedStructure:
        return "nested-structure";
    case BlockKind::Other:
        return "other";
    }
    return "other";
}

}  // namespace tfcheck
