//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements violation naming helpers.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Lint/Violation.h"

namespace tfcheck::lint
{

const char* severityName(const Severity severity)
{
    return severity == Severity::Warning ? "warning" : "error";
}

const char* categoryCode(const RuleCategory category)
{
    switch (category)
    {
    case RuleCategory::Style:
        return "ST";
    case RuleCategory::InputOutput:
        return "IO";
    case RuleCategory::Documentation:
        return "DC";
    case RuleCategory::Security:
        return "SC";
    case RuleCategory::System:
        return kSystemRuleId;
    }
    return kSystemRuleId;
}

const char* categoryTitle(const RuleCategory category)
{
    switch (category)
    {
    case RuleCategory::Style:
        return "Style/Format";
    case RuleCategory::InputOutput:
        return "Input/Output";
    case RuleCategory::Documentation:
        return "Documentation/Comments";
    case RuleCategory::Security:
        return "Security Code";
    case RuleCategory::System:
        return "System";
    }
    return "System";
}

std::optional<RuleCategory> parseCategoryCode(const std::string& code)
{
    if (code == "ST")
    {
        return RuleCategory::Style;
    }
    if (code == "IO")
    {
        return RuleCategory::InputOutput;
    }
    if (code == "DC")
    {
        return RuleCategory::Documentation;
    }
    if (code == "SC")
    {
        return RuleCategory::Security;
    }
    return std::nullopt;
}

std::optional<RuleCategory> categoryOfRuleId(const std::string& ruleId)
{
    if (ruleId == kSystemRuleId)
    {
        return RuleCategory::System;
    }
    return parseCategoryCode(ruleId.substr(0, 2));
}

}  // namespace tfcheck::lint
