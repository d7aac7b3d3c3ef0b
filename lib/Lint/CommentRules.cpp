//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the DC rule family.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Lint/Registry.h"

#include <memory>
#include <string>

namespace tfcheck::lint
{
namespace
{

class CommentSpacingRule final : public DescribedRule
{
public:
    CommentSpacingRule()
        : DescribedRule({"DC.001",
                         RuleCategory::Documentation,
                         "Comments have exactly one space after '#'",
                         Severity::Error,
                         RuleScope::File,
                         false})
    {
    }

    void check(const RuleContext& context, RuleLog& log) const override
    {
        const LintDocument& document = *context.document;
        for (std::uint32_t n = 1; n <= document.source.lineCount(); ++n)
        {
            const ScannedLine& scanned = document.scan.line(n);
            if ((scanned.kind != LineClass::Code && scanned.kind != LineClass::CommentOnly) ||
                !scanned.commentColumn || scanned.commentMarker != CommentMarker::Hash)
            {
                continue;
            }
            const std::string text = document.source.line(n).substr(*scanned.commentColumn + 1);
            if (text.find_first_not_of(" \t") == std::string::npos)
            {
                continue;
            }
            if (text.front() != ' ')
            {
                log.report(n, "Comment should have one space after '#' character");
            }
            else if (text.size() > 1 && (text[1] == ' ' || text[1] == '\t'))
            {
                log.report(n, "Comment should have exactly one space after '#' character");
            }
        }
    }
};

}  // namespace

void registerCommentRules(LintRegistry& registry)
{
    registry.registerRuleFactory([]() { return std::make_unique<CommentSpacingRule>(); });
}

}  // namespace tfcheck::lint
