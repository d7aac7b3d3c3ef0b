//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements directory index construction.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Lint/DirectoryIndex.h"

#include <regex>
#include <utility>

namespace tfcheck::lint
{
namespace
{

/// Returns the variable block of `document` enclosing `line`, if any.
const Block* enclosingVariableBlock(const LintDocument& document, const std::uint32_t line)
{
    if (!document.root)
    {
        return nullptr;
    }
    for (const Block& block : document.root->children)
    {
        if (block.kind == BlockKind::Variable && line >= block.startLine && line <= block.endLine)
        {
            return &block;
        }
    }
    return nullptr;
}

void collectVariables(const LintDocument& document, std::vector<VariableDefinition>& out)
{
    if (!document.root || document.isVariableValues())
    {
        return;
    }
    for (const Block& block : document.root->children)
    {
        if (block.kind != BlockKind::Variable || !block.typeLabel)
        {
            continue;
        }
        out.push_back(VariableDefinition{block.typeLabel->text,
                                         &document,
                                         &block,
                                         block.startLine,
                                         block.findParameter("default") != nullptr});
    }
}

void collectLocals(const LintDocument& document, std::vector<LocalDefinition>& out)
{
    if (!document.root || document.isVariableValues())
    {
        return;
    }
    for (const Block& block : document.root->children)
    {
        if (block.kind != BlockKind::Locals)
        {
            continue;
        }
        for (const Parameter& parameter : block.parameters)
        {
            out.push_back(LocalDefinition{parameter.name, &document, &parameter});
        }
    }
}

void collectReferences(const LintDocument& document, std::vector<VariableReference>& out)
{
    if (document.isVariableValues())
    {
        return;
    }
    static const std::regex pattern(R"(\bvar\.([A-Za-z_][A-Za-z0-9_-]*))");
    for (std::uint32_t n = 1; n <= document.source.lineCount(); ++n)
    {
        const std::string text = referenceText(document, n);
        for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern); it != std::sregex_iterator(); ++it)
        {
            const std::string name = it->str(1);
            const Block*      self = enclosingVariableBlock(document, n);
            if (self != nullptr && self->typeLabel && self->typeLabel->text == name)
            {
                continue;
            }
            out.push_back(VariableReference{name, &document, n, static_cast<std::uint32_t>(it->position(0))});
        }
    }
}

}  // namespace

std::string referenceText(const LintDocument& document, const std::uint32_t line)
{
    const ScannedLine& scanned = document.scan.line(line);
    const std::string& raw     = document.source.line(line);
    switch (scanned.kind)
    {
    case LineClass::HeredocBody:
        return raw;
    case LineClass::Code:
    {
        std::string text = raw.substr(0, scanned.skeleton.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            if (scanned.skeleton[i] == ' ')
            {
                text[i] = ' ';
            }
        }
        return text;
    }
    case LineClass::Blank:
    case LineClass::CommentOnly:
    case LineClass::BlockCommentBody:
    case LineClass::HeredocTerminator:
        return {};
    }
    return {};
}

DirectoryIndex DirectoryIndex::build(std::string directory, std::vector<const LintDocument*> documents)
{
    DirectoryIndex index;
    index.directory_ = std::move(directory);
    index.documents_ = std::move(documents);
    for (const LintDocument* document : index.documents_)
    {
        collectVariables(*document, index.variables_);
        collectLocals(*document, index.locals_);
        collectReferences(*document, index.references_);
    }
    for (const VariableReference& reference : index.references_)
    {
        ++index.referenceCounts_[reference.name];
    }
    return index;
}

const LintDocument* DirectoryIndex::findDocument(const std::string& fileName) const
{
    for (const LintDocument* document : documents_)
    {
        if (document->source.fileName == fileName)
        {
            return document;
        }
    }
    return nullptr;
}

const VariableDefinition* DirectoryIndex::findVariable(const std::string& name) const
{
    for (const VariableDefinition& definition : variables_)
    {
        if (definition.name == name)
        {
            return &definition;
        }
    }
    return nullptr;
}

std::size_t DirectoryIndex::referenceCount(const std::string& name) const
{
    const auto it = referenceCounts_.find(name);
    return it == referenceCounts_.end() ? 0 : it->second;
}

std::vector<const VariableReference*> DirectoryIndex::referencesIn(const LintDocument& document) const
{
    std::vector<const VariableReference*> out;
    for (const VariableReference& reference : references_)
    {
        if (reference.document == &document)
        {
            out.push_back(&reference);
        }
    }
    return out;
}

std::set<std::string> DirectoryIndex::valueFileKeys(const std::string& fileName) const
{
    std::set<std::string> keys;
    const LintDocument*   document = findDocument(fileName);
    if (document == nullptr)
    {
        return keys;
    }
    if (document->root)
    {
        for (const Parameter& parameter : document->root->parameters)
        {
            keys.insert(parameter.name);
        }
        return keys;
    }

    static const std::regex assignment(R"re(^\s*"?([A-Za-z_][A-Za-z0-9_-]*)"?\s*=)re");
    for (std::uint32_t n = 1; n <= document->source.lineCount(); ++n)
    {
        const ScannedLine& scanned = document->scan.line(n);
        std::smatch        match;
        if (scanned.kind == LineClass::Code && scanned.indentLevel == 0 &&
            std::regex_search(scanned.code, match, assignment))
        {
            keys.insert(match.str(1));
        }
    }
    return keys;
}

}  // namespace tfcheck::lint
