//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements tab, indentation and alignment facts.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Lint/FormattingFacts.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <string>

namespace tfcheck::lint
{
namespace
{

constexpr const char* kTrailingOperators = "?:=+-*/&|<>!";
constexpr const char* kLeadingOperators  = "?:&|+*/.";

char lastCodeChar(const ScannedLine& line)
{
    const auto at = line.code.find_last_not_of(" \t");
    return at == std::string::npos ? '\0' : line.code[at];
}

char firstCodeChar(const ScannedLine& line)
{
    const auto at = line.code.find_first_not_of(" \t");
    return at == std::string::npos ? '\0' : line.code[at];
}

/// True when line `n` continues the expression of the previous code line.
bool isContinuationLine(const LintDocument& document, const std::uint32_t n)
{
    const ScannedLine& current = document.scan.line(n);
    if (current.kind == LineClass::Code && std::strchr(kLeadingOperators, firstCodeChar(current)) != nullptr)
    {
        return true;
    }
    for (std::uint32_t k = n - 1; k >= 1; --k)
    {
        const ScannedLine& previous = document.scan.line(k);
        if (previous.kind == LineClass::Code)
        {
            const char last = lastCodeChar(previous);
            return last != '\0' && std::strchr(kTrailingOperators, last) != nullptr;
        }
        if (previous.kind != LineClass::Blank && previous.kind != LineClass::CommentOnly)
        {
            return false;
        }
    }
    return false;
}

bool isLayoutExempt(const LintDocument& document, const std::uint32_t n)
{
    return document.scan.isHeredocLine(n) || tabProblem(document, n).has_value() ||
           indentationProblem(document, n).has_value();
}

class AlignmentChecker final
{
public:
    AlignmentChecker(const LintDocument& document, std::vector<LayoutIssue>& out)
        : document_(document)
        , out_(out)
    {
    }

    void checkBody(const Block& block)
    {
        std::vector<BlockMember> members = memberSequence(block);
        const std::string        context = describeBlock(block);
        std::vector<const Parameter*> section;
        std::uint32_t                 previousEnd = 0;

        for (const BlockMember& member : members)
        {
            if (member.block != nullptr)
            {
                flush(section, context);
                checkBody(*member.block);
                previousEnd = member.endLine;
                continue;
            }
            previousEnd = takeParameter(*member.parameter, previousEnd, section, context);
        }
        flush(section, context);
    }

private:
    void checkEntries(const Parameter& owner)
    {
        const std::string context = owner.name.empty() ? std::string("list element object")
                                                       : "object '" + owner.name + "'";
        std::vector<const Parameter*> section;
        std::uint32_t                 previousEnd = owner.line;
        for (const Parameter& entry : owner.entries)
        {
            if (entry.name.empty())
            {
                flush(section, context);
                checkEntries(entry);
                previousEnd = entry.endLine;
                continue;
            }
            previousEnd = takeParameter(entry, previousEnd, section, context);
        }
        flush(section, context);
    }

    std::uint32_t takeParameter(const Parameter&               parameter,
                                const std::uint32_t            previousEnd,
                                std::vector<const Parameter*>& section,
                                const std::string&             context)
    {
        if (!section.empty() && blankLinesBetween(document_, previousEnd, parameter.line) > 0)
        {
            flush(section, context);
        }
        // A parameter sharing its line with the previous sibling or the owner cannot be aligned.
        if (previousEnd == 0 || previousEnd != parameter.line)
        {
            section.push_back(&parameter);
        }
        if (!parameter.entries.empty())
        {
            checkEntries(parameter);
        }
        if (parameter.endLine > parameter.line)
        {
            flush(section, context);
        }
        return parameter.endLine;
    }

    void flush(std::vector<const Parameter*>& section, const std::string& context)
    {
        if (section.empty())
        {
            return;
        }
        std::uint32_t width = 0;
        for (const Parameter* parameter : section)
        {
            width = std::max(width, parameter->alignmentWidth());
        }
        for (const Parameter* parameter : section)
        {
            check(*parameter, width, context);
        }
        section.clear();
    }

    void check(const Parameter& parameter, const std::uint32_t width, const std::string& context)
    {
        if (isLayoutExempt(document_, parameter.line))
        {
            return;
        }
        const std::string&       raw      = document_.source.line(parameter.line);
        const std::uint32_t      nameEnd  = parameter.indent + parameter.alignmentWidth();
        const std::uint32_t      expected = parameter.indent + width + 1;
        std::vector<std::string> problems;

        if (parameter.equalsColumn == nameEnd)
        {
            problems.push_back("at least one space is required before '='");
        }
        else if (parameter.equalsColumn != expected)
        {
            problems.push_back("'=' at column " + std::to_string(parameter.equalsColumn + 1) +
                               " is not aligned with other parameters (expected column " +
                               std::to_string(expected + 1) + ")");
        }

        std::size_t after  = parameter.equalsColumn + 1;
        std::size_t spaces = 0;
        while (after + spaces < raw.size() && raw[after + spaces] == ' ')
        {
            ++spaces;
        }
        const bool valueFollows = after + spaces < raw.size() && document_.scan.line(parameter.line).skeleton.size() >
                                                                     after + spaces;
        if (valueFollows && spaces != 1)
        {
            problems.push_back("exactly one space is required after '='");
        }

        if (problems.empty())
        {
            return;
        }
        std::string message = "Parameter '" + parameter.name + "' in " + context + ": " + problems.front();
        for (std::size_t i = 1; i < problems.size(); ++i)
        {
            message += "; " + problems[i];
        }
        out_.push_back(LayoutIssue{parameter.line, std::move(message)});
    }

    const LintDocument&       document_;
    std::vector<LayoutIssue>& out_;
};

}  // namespace

std::uint32_t leadingWhitespaceWidth(const std::string& line)
{
    std::uint32_t width = 0;
    while (width < line.size() && (line[width] == ' ' || line[width] == '\t'))
    {
        ++width;
    }
    return width;
}

bool hasTabIndentation(const std::string& line)
{
    const std::uint32_t width = leadingWhitespaceWidth(line);
    return line.find('\t') < width;
}

std::optional<std::string> tabProblem(const LintDocument& document, const std::uint32_t line)
{
    if (document.scan.isHeredocLine(line) || document.scan.isBlankLine(line))
    {
        return std::nullopt;
    }
    const std::string&  raw    = document.source.line(line);
    const std::uint32_t width  = leadingWhitespaceWidth(raw);
    const auto          tabs   = std::count(raw.begin(), raw.begin() + width, '\t');
    const auto          spaces = static_cast<std::int64_t>(width) - tabs;
    if (tabs == 0)
    {
        // String contents are masked in the skeleton; every other tab is reported.
        const std::string& skeleton = document.scan.line(line).skeleton;
        for (std::size_t column = width; column < raw.size(); ++column)
        {
            if (raw[column] == '\t' && (column >= skeleton.size() || skeleton[column] != 'x'))
            {
                return "Tab character found at column " + std::to_string(column + 1) +
                       ". Use spaces instead for consistent formatting";
            }
        }
        return std::nullopt;
    }
    if (spaces > 0)
    {
        return std::string("Mixed indentation detected (tabs and spaces). Use spaces only for consistent formatting");
    }
    return std::string("Tab character used for indentation. Use spaces instead for consistent formatting");
}

std::optional<std::string> indentationProblem(const LintDocument& document, const std::uint32_t line)
{
    const ScannedLine& scanned = document.scan.line(line);
    if ((scanned.kind != LineClass::Code && scanned.kind != LineClass::CommentOnly) || scanned.startsInInterpolation)
    {
        return std::nullopt;
    }
    const std::string& raw = document.source.line(line);
    if (hasTabIndentation(raw))
    {
        return std::nullopt;
    }
    const std::uint32_t actual   = leadingWhitespaceWidth(raw);
    const std::uint32_t expected = 2U * scanned.indentLevel;
    if (actual == expected)
    {
        return std::nullopt;
    }
    if (actual > expected && actual % 2U == 0U && isContinuationLine(document, line))
    {
        return std::nullopt;
    }
    return "Indentation is " + std::to_string(actual) + " spaces, expected " + std::to_string(expected) +
           " spaces for nesting level " + std::to_string(scanned.indentLevel);
}

std::vector<LayoutIssue> alignmentIssues(const LintDocument& document)
{
    std::vector<LayoutIssue> out;
    if (!document.root)
    {
        return out;
    }
    AlignmentChecker(document, out).checkBody(*document.root);
    std::stable_sort(out.begin(), out.end(), [](const LayoutIssue& lhs, const LayoutIssue& rhs) {
        return lhs.line < rhs.line;
    });
    return out;
}

std::string describeBlock(const Block& block)
{
    if (block.kind == BlockKind::Root)
    {
        return "file scope";
    }
    std::string text = block.keyword;
    for (const std::optional<BlockLabel>* label : {&block.typeLabel, &block.nameLabel})
    {
        if (*label)
        {
            text += " \"" + (*label)->text + "\"";
        }
    }
    return text;
}

bool isSnakeCaseIdentifier(const std::string& text)
{
    if (text.empty() || !std::islower(static_cast<unsigned char>(text.front())))
    {
        return false;
    }
    for (const unsigned char c : text)
    {
        if (!(std::islower(c) || std::isdigit(c) || c == '_'))
        {
            return false;
        }
    }
    return true;
}

std::uint32_t blankLinesBetween(const LintDocument& document, const std::uint32_t after, const std::uint32_t before)
{
    std::uint32_t count = 0;
    for (std::uint32_t n = after + 1; n < before; ++n)
    {
        if (document.scan.isBlankLine(n))
        {
            ++count;
        }
    }
    return count;
}

}  // namespace tfcheck::lint
