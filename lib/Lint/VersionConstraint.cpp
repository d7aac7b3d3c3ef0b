//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements version and constraint parsing.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Lint/VersionConstraint.h"

#include <algorithm>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace tfcheck::lint
{

std::string SemanticVersion::str() const
{
    std::ostringstream out;
    out << majorVersion << '.' << minorVersion << '.' << patchVersion;
    return out.str();
}

std::optional<SemanticVersion> parseSemanticVersion(const std::string& text)
{
    static const std::regex pattern(R"(^\s*v?(\d+)(?:\.(\d+))?(?:\.(\d+))?(?:-[0-9A-Za-z.-]+)?\s*$)");
    std::smatch             match;
    if (!std::regex_match(text, match, pattern))
    {
        return std::nullopt;
    }
    SemanticVersion version;
    try
    {
        version.majorVersion = static_cast<std::uint32_t>(std::stoul(match.str(1)));
        version.minorVersion = match[2].matched ? static_cast<std::uint32_t>(std::stoul(match.str(2))) : 0U;
        version.patchVersion = match[3].matched ? static_cast<std::uint32_t>(std::stoul(match.str(3))) : 0U;
    } catch (const std::out_of_range&)
    {
        return std::nullopt;
    }
    return version;
}

llvm::Expected<std::vector<ConstraintClause>> parseVersionConstraint(const std::string& text)
{
    static const std::regex clausePattern(R"(^\s*(~>|>=|<=|!=|=|>|<)?\s*([^\s,]+)\s*$)");

    std::vector<ConstraintClause> clauses;
    std::stringstream             stream(text);
    std::string                   part;
    while (std::getline(stream, part, ','))
    {
        std::smatch match;
        if (!std::regex_match(part, match, clausePattern))
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "malformed version constraint clause '%s'",
                                           part.c_str());
        }
        const std::optional<SemanticVersion> version = parseSemanticVersion(match.str(2));
        if (!version)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "malformed version '%s' in constraint",
                                           match.str(2).c_str());
        }
        clauses.push_back(ConstraintClause{match[1].matched ? match.str(1) : std::string("="), *version});
    }
    if (clauses.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "empty version constraint");
    }
    return clauses;
}

SemanticVersion lowerBound(const std::vector<ConstraintClause>& clauses)
{
    SemanticVersion bound;
    for (const ConstraintClause& clause : clauses)
    {
        if (clause.op == "=" || clause.op == ">=" || clause.op == ">" || clause.op == "~>")
        {
            bound = std::max(bound, clause.version);
        }
    }
    return bound;
}

}  // namespace tfcheck::lint
