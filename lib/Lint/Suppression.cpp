//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements inline suppression scanning.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Lint/Suppression.h"

#include <regex>
#include <utility>

namespace tfcheck::lint
{

void SuppressionMap::add(SuppressionRange range)
{
    ranges_[range.ruleId].push_back(std::move(range));
}

bool SuppressionMap::isSuppressed(const std::string& ruleId, const std::uint32_t line) const
{
    const auto it = ranges_.find(ruleId);
    if (it == ranges_.end())
    {
        return false;
    }
    for (const SuppressionRange& range : it->second)
    {
        if (range.contains(line))
        {
            return true;
        }
    }
    return false;
}

const std::vector<SuppressionRange>& SuppressionMap::rangesFor(const std::string& ruleId) const
{
    static const std::vector<SuppressionRange> empty;
    const auto                                 it = ranges_.find(ruleId);
    return it == ranges_.end() ? empty : it->second;
}

std::optional<SuppressionDirective> parseSuppressionDirective(const std::string& line)
{
    static const std::regex directive(R"(^\s*#\s*([A-Z]{2}\.\d{3})\s+(Enable|Disable)\s*$)");
    std::smatch             match;
    if (!std::regex_match(line, match, directive))
    {
        return std::nullopt;
    }
    return SuppressionDirective{match.str(1), match.str(2) == "Disable"};
}

SuppressionMap scanSuppressions(const SourceFile& source, const ScanResult& scan)
{
    SuppressionMap                       map;
    std::map<std::string, std::uint32_t> open;
    for (std::uint32_t n = 1; n <= source.lineCount(); ++n)
    {
        if (scan.line(n).kind != LineClass::CommentOnly)
        {
            continue;
        }
        const std::optional<SuppressionDirective> directive = parseSuppressionDirective(source.line(n));
        if (!directive)
        {
            continue;
        }
        if (directive->disable)
        {
            // Re-disabling keeps the earliest start.
            open.emplace(directive->ruleId, n + 1);
            continue;
        }
        const auto it = open.find(directive->ruleId);
        if (it == open.end())
        {
            continue;
        }
        map.add(SuppressionRange{directive->ruleId, source.path, it->second, n});
        open.erase(it);
    }
    for (const auto& [ruleId, startLine] : open)
    {
        map.add(SuppressionRange{ruleId, source.path, startLine, std::nullopt});
    }
    return map;
}

}  // namespace tfcheck::lint
