//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "tfcheck/Frontend/SourceFile.h"
#include "tfcheck/Lint/Engine.h"
#include "llvm/Support/Error.h"

namespace
{

tfcheck::lint::LintRunResult lintFile(const std::string&                 fileName,
                                      const std::string&                 text,
                                      const tfcheck::lint::LintConfig& config = {})
{
    tfcheck::lint::LintEngine               engine;
    std::vector<tfcheck::SourceFile>        sources{tfcheck::makeSourceFile("/tmp/tfcheck/format/" + fileName, text)};
    llvm::Expected<tfcheck::lint::LintRunResult> result = engine.runSources(std::move(sources), config);
    if (!result)
    {
        std::cerr << "lint run failed: " << llvm::toString(result.takeError()) << "\n";
        return {};
    }
    return std::move(*result);
}

std::vector<std::uint32_t> linesOf(const tfcheck::lint::LintRunResult& result, const std::string& ruleId)
{
    std::vector<std::uint32_t> lines;
    for (const tfcheck::lint::Violation& violation : result.violations)
    {
        if (violation.ruleId == ruleId)
        {
            lines.push_back(violation.line);
        }
    }
    return lines;
}

const tfcheck::lint::Violation* firstOf(const tfcheck::lint::LintRunResult& result, const std::string& ruleId)
{
    for (const tfcheck::lint::Violation& violation : result.violations)
    {
        if (violation.ruleId == ruleId)
        {
            return &violation;
        }
    }
    return nullptr;
}

bool expectLines(const tfcheck::lint::LintRunResult& result,
                 const std::string&                 ruleId,
                 const std::vector<std::uint32_t>&  expected,
                 const char*                        what)
{
    const std::vector<std::uint32_t> actual = linesOf(result, ruleId);
    if (actual == expected)
    {
        return true;
    }
    std::cerr << what << ": unexpected " << ruleId << " lines:";
    for (const std::uint32_t line : actual)
    {
        std::cerr << " " << line;
    }
    std::cerr << "\n";
    return false;
}

bool testAlignment()
{
    // Quote characters of a quoted name count toward the alignment width.
    const auto quoted = lintFile("main.tf",
                                 "resource \"a\" \"test\" {\n"
                                 "  \"quoted\" = 1\n"
                                 "  name     = 2\n"
                                 "}\n");
    if (!expectLines(quoted, "ST.003", {}, "quoted name width"))
    {
        return false;
    }

    const auto misaligned = lintFile("main.tf",
                                     "resource \"a\" \"test\" {\n"
                                     "  name = \"x\"\n"
                                     "  description = \"y\"\n"
                                     "}\n");
    if (!expectLines(misaligned, "ST.003", {2}, "misaligned section"))
    {
        return false;
    }
    const auto* message = firstOf(misaligned, "ST.003");
    if (message->message.find("expected column 15") == std::string::npos)
    {
        std::cerr << "unexpected alignment message: " << message->message << "\n";
        return false;
    }

    const auto realigned = lintFile("main.tf",
                                    "resource \"a\" \"test\" {\n"
                                    "  name        = \"x\"\n"
                                    "  description = \"y\"\n"
                                    "}\n");
    if (!expectLines(realigned, "ST.003", {}, "realigned section"))
    {
        return false;
    }

    const auto split = lintFile("main.tf",
                                "resource \"a\" \"test\" {\n"
                                "  name = \"x\"\n"
                                "\n"
                                "  description = \"y\"\n"
                                "}\n");
    if (!expectLines(split, "ST.003", {}, "blank line split"))
    {
        return false;
    }

    const auto commentGap = lintFile("main.tf",
                                     "resource \"a\" \"test\" {\n"
                                     "  name = \"x\"\n"
                                     "  # note\n"
                                     "  description = \"y\"\n"
                                     "}\n");
    if (!expectLines(commentGap, "ST.003", {2}, "comment gap"))
    {
        return false;
    }

    const auto nested = lintFile("main.tf",
                                 "resource \"a\" \"test\" {\n"
                                 "  name = \"x\"\n"
                                 "  tags = {\n"
                                 "    environment = \"dev\"\n"
                                 "    team        = \"core\"\n"
                                 "  }\n"
                                 "}\n");
    if (!expectLines(nested, "ST.003", {}, "nested object section"))
    {
        return false;
    }

    const auto spacing = lintFile("main.tf",
                                  "resource \"a\" \"test\" {\n"
                                  "  name =  \"x\"\n"
                                  "}\n");
    const auto* spacingViolation = firstOf(spacing, "ST.003");
    if (spacingViolation == nullptr ||
        spacingViolation->message.find("exactly one space is required after '='") == std::string::npos)
    {
        std::cerr << "expected a single-space-after-equals violation\n";
        return false;
    }
    return true;
}

bool testIndentation()
{
    const auto tabs = lintFile("main.tf",
                               "resource \"a\" \"test\" {\n"
                               "\tname = \"x\"\n"
                               "}\n");
    if (!expectLines(tabs, "ST.004", {2}, "tab indentation") || !expectLines(tabs, "ST.005", {}, "tab exemption") ||
        !expectLines(tabs, "ST.003", {}, "tab alignment exemption"))
    {
        return false;
    }

    const auto inner = lintFile("main.tf",
                                "resource \"a\" \"test\" {\n"
                                "  name\t= \"a\"\n"
                                "  tag  = \"x\ty\"\n"
                                "  note = \"z\" #\tcomment\n"
                                "}\n");
    if (!expectLines(inner, "ST.004", {2, 4}, "tab after the indentation"))
    {
        return false;
    }
    const tfcheck::lint::Violation* midLine = firstOf(inner, "ST.004");
    if (midLine == nullptr ||
        midLine->message != "Tab character found at column 7. Use spaces instead for consistent formatting")
    {
        std::cerr << "unexpected message for a tab after the indentation\n";
        return false;
    }

    const auto level = lintFile("main.tf",
                                "resource \"a\" \"test\" {\n"
                                "   name = \"x\"\n"
                                "  tags = {\n"
                                "      env = \"dev\"\n"
                                "  }\n"
                                "}\n");
    if (!expectLines(level, "ST.005", {2, 4}, "indentation level"))
    {
        return false;
    }
    const auto* message = firstOf(level, "ST.005");
    if (message->message != "Indentation is 3 spaces, expected 2 spaces for nesting level 1")
    {
        std::cerr << "unexpected indentation message: " << message->message << "\n";
        return false;
    }

    const auto values = lintFile("terraform.tfvars", "  region = \"eu\"\n");
    return expectLines(values, "ST.005", {1}, "value file top level");
}

bool testHeredocExemption()
{
    const auto result = lintFile("main.tf",
                                 "resource \"a\" \"test\" {\n"
                                 "  script = <<EOF\n"
                                 "\techo hi   \n"
                                 "#no space\n"
                                 "      weird = indent\n"
                                 "EOF\n"
                                 "}\n");
    for (const tfcheck::lint::Violation& violation : result.violations)
    {
        if (violation.line >= 3 && violation.line <= 6)
        {
            std::cerr << "heredoc body produced " << violation.ruleId << " on line " << violation.line << "\n";
            return false;
        }
    }
    return true;
}

bool testSpacing()
{
    const auto missing = lintFile("main.tf",
                                  "resource \"a\" \"test\" {\n"
                                  "  name = \"x\"\n"
                                  "}\n"
                                  "resource \"b\" \"test\" {\n"
                                  "  name = \"y\"\n"
                                  "}\n");
    if (!expectLines(missing, "ST.006", {4}, "missing top-level blank line"))
    {
        return false;
    }
    if (firstOf(missing, "ST.006")->message !=
        "Missing blank line between resource 'a' and resource 'b', the number of blank line should be 1.")
    {
        std::cerr << "unexpected top-level spacing message: " << firstOf(missing, "ST.006")->message << "\n";
        return false;
    }

    const auto tooMany = lintFile("main.tf",
                                  "resource \"a\" \"test\" {\n"
                                  "}\n"
                                  "\n"
                                  "\n"
                                  "variable \"b\" {\n"
                                  "}\n");
    if (!expectLines(tooMany, "ST.006", {4}, "too many top-level blank lines"))
    {
        return false;
    }

    const auto commentOnly = lintFile("main.tf",
                                      "locals {\n"
                                      "}\n"
                                      "# divider\n"
                                      "locals {\n"
                                      "}\n");
    if (!expectLines(commentOnly, "ST.006", {4}, "comment-only separator"))
    {
        return false;
    }

    const auto sameName = lintFile("main.tf",
                                   "resource \"a\" \"test\" {\n"
                                   "  ebs {\n"
                                   "    size = 1\n"
                                   "  }\n"
                                   "\n"
                                   "\n"
                                   "  ebs {\n"
                                   "    size = 2\n"
                                   "  }\n"
                                   "  ebs {\n"
                                   "    size = 3\n"
                                   "  }\n"
                                   "}\n");
    if (!expectLines(sameName, "ST.007", {7}, "same-name blocks") ||
        !expectLines(sameName, "ST.008", {}, "same-name blocks are one kind"))
    {
        return false;
    }

    const auto kinds = lintFile("main.tf",
                                "resource \"a\" \"test\" {\n"
                                "  count = 1\n"
                                "  name  = \"x\"\n"
                                "  ebs {\n"
                                "    size = 1\n"
                                "  }\n"
                                "\n"
                                "  root {\n"
                                "    size = 2\n"
                                "  }\n"
                                "}\n");
    return expectLines(kinds, "ST.008", {3, 4}, "member kinds") &&
           expectLines(kinds, "ST.003", {}, "member kinds alignment");
}

bool testNamingAndLayout()
{
    const auto labels = lintFile("main.tf",
                                 "resource \"a\" \"prod\" {\n"
                                 "}\n"
                                 "\n"
                                 "data a \"test\" {\n"
                                 "}\n"
                                 "\n"
                                 "variable foo {\n"
                                 "}\n");
    if (!expectLines(labels, "ST.001", {1}, "instance label") || !expectLines(labels, "ST.010", {4, 7}, "quoting"))
    {
        return false;
    }
    if (firstOf(labels, "ST.001")->message != "Resource 'a' instance name 'prod' should be 'test'")
    {
        std::cerr << "unexpected instance label message: " << firstOf(labels, "ST.001")->message << "\n";
        return false;
    }

    tfcheck::lint::LintConfig config;
    config.fixedInstanceLabel = "prod";
    const auto custom         = lintFile("main.tf", "resource \"a\" \"prod\" {\n}\n", config);
    if (!expectLines(custom, "ST.001", {}, "configured instance label"))
    {
        return false;
    }

    const auto whitespace = lintFile("main.tf",
                                     "locals {\n"
                                     "  a = 1 \t\n"
                                     "}\n");
    if (!expectLines(whitespace, "ST.011", {2}, "trailing whitespace") ||
        firstOf(whitespace, "ST.011")->message != "Line contains trailing whitespace characters: space, tab")
    {
        return false;
    }

    const auto crlf = lintFile("main.tf", "locals {\r\n  a = 1\r\n}\r\n\r\nlocals {\r\n}\r");
    if (!expectLines(crlf, "ST.011", {}, "carriage returns without a final newline"))
    {
        return false;
    }

    const auto boundaries = lintFile("main.tf", "\n\nlocals {\n}");
    if (!expectLines(boundaries, "ST.012", {3, 4}, "file boundaries"))
    {
        return false;
    }

    const auto blankOnly = lintFile("main.tf", "\n");
    const auto empty     = lintFile("main.tf", "");
    if (!expectLines(blankOnly, "ST.012", {1}, "blank-only file") || !expectLines(empty, "ST.012", {}, "empty file"))
    {
        return false;
    }
    if (firstOf(blankOnly, "ST.012")->message != "File has 1 empty line before first non-empty line (should have 0)")
    {
        std::cerr << "unexpected blank-only file message: " << firstOf(blankOnly, "ST.012")->message << "\n";
        return false;
    }

    const auto badName = lintFile("Bad-Name.tf", "locals {\n}\n");
    const auto goodName = lintFile("network_rules.tf", "locals {\n}\n");
    const auto autoVars = lintFile("x.auto.tfvars", "a = 1\n");
    return expectLines(badName, "ST.014", {1}, "bad file name") &&
           expectLines(goodName, "ST.014", {}, "good file name") &&
           expectLines(autoVars, "ST.014", {}, "auto value file");
}

bool testComments()
{
    const auto result = lintFile("main.tf",
                                 "#missing\n"
                                 "#  doubled\n"
                                 "# fine\n"
                                 "#\n"
                                 "locals {\n"
                                 "  a = 1 #trailing\n"
                                 "  b = \"#not a comment\"\n"
                                 "  // other marker\n"
                                 "}\n");
    if (!expectLines(result, "DC.001", {1, 2, 6}, "comment spacing"))
    {
        return false;
    }
    if (firstOf(result, "DC.001")->message != "Comment should have one space after '#' character")
    {
        std::cerr << "unexpected comment message: " << firstOf(result, "DC.001")->message << "\n";
        return false;
    }
    return true;
}

}  // namespace

bool runFormattingRuleTests()
{
    bool ok = true;
    ok      = testAlignment() && ok;
    ok      = testIndentation() && ok;
    ok      = testHeredocExemption() && ok;
    ok      = testSpacing() && ok;
    ok      = testNamingAndLayout() && ok;
    ok      = testComments() && ok;
    return ok;
}
