//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "tfcheck/Frontend/LineScanner.h"
#include "tfcheck/Frontend/SourceFile.h"
#include "tfcheck/Lint/Suppression.h"

namespace
{

tfcheck::lint::SuppressionMap scan(const std::string& text)
{
    const tfcheck::SourceFile source = tfcheck::makeSourceFile("/tmp/tfcheck/suppression/main.tf", text);
    return tfcheck::lint::scanSuppressions(source, tfcheck::scanLines(source));
}

}  // namespace

bool runSuppressionTests()
{
    {
        const auto disable = tfcheck::lint::parseSuppressionDirective("  # ST.001 Disable");
        const auto enable  = tfcheck::lint::parseSuppressionDirective("# IO.003 Enable  ");
        if (!disable || disable->ruleId != "ST.001" || !disable->disable || !enable || enable->ruleId != "IO.003" ||
            enable->disable)
        {
            std::cerr << "expected Disable and Enable directives to parse\n";
            return false;
        }
        if (tfcheck::lint::parseSuppressionDirective("# st.001 Disable") ||
            tfcheck::lint::parseSuppressionDirective("# ST.001 disable") ||
            tfcheck::lint::parseSuppressionDirective("# ST.01 Disable") ||
            tfcheck::lint::parseSuppressionDirective("# ST.001 Disable please"))
        {
            std::cerr << "directive matching must be exact and case-sensitive\n";
            return false;
        }
    }

    {
        const tfcheck::lint::SuppressionMap map = scan("# ST.001 Disable\n"
                                                       "resource \"a\" \"b\" {\n"
                                                       "}\n"
                                                       "# ST.001 Enable\n"
                                                       "resource \"a\" \"c\" {\n"
                                                       "}\n");
        if (map.isSuppressed("ST.001", 1) || !map.isSuppressed("ST.001", 2) || !map.isSuppressed("ST.001", 4) ||
            map.isSuppressed("ST.001", 5))
        {
            std::cerr << "expected the range to start after Disable and end at Enable\n";
            return false;
        }
        if (map.isSuppressed("ST.003", 2))
        {
            std::cerr << "ranges must be independent per rule ID\n";
            return false;
        }
    }

    {
        const tfcheck::lint::SuppressionMap map = scan("locals {\n"
                                                       "# IO.009 Disable\n"
                                                       "  a = 1\n"
                                                       "# IO.009 Disable\n"
                                                       "  b = 2\n"
                                                       "}\n");
        const auto& ranges = map.rangesFor("IO.009");
        if (ranges.size() != 1 || ranges.front().startLine != 3 || ranges.front().endLine.has_value())
        {
            std::cerr << "expected one open range keeping the earliest start\n";
            return false;
        }
        if (!map.isSuppressed("IO.009", 1000))
        {
            std::cerr << "an unclosed range must run to the end of the file\n";
            return false;
        }
    }

    {
        const tfcheck::lint::SuppressionMap map = scan("# DC.001 Enable\n"
                                                       "x = \"# ST.001 Disable\"\n"
                                                       "y = <<EOT\n"
                                                       "# ST.002 Disable\n"
                                                       "EOT\n");
        if (!map.empty())
        {
            std::cerr << "directives inside strings or heredocs, and stray Enables, must be ignored\n";
            return false;
        }
    }

    return true;
}
