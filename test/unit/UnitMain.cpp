//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>

bool runLineScannerTests();
bool runBlockExtractorTests();
bool runSuppressionTests();
bool runVersionConstraintTests();
bool runLintConfigTests();
bool runWorkerPoolTests();
bool runDiscoveryTests();
bool runFormattingRuleTests();
bool runCrossFileRuleTests();
bool runSafetyRuleTests();
bool runEngineTests();

int main()
{
    bool ok = true;
    ok      = runLineScannerTests() && ok;
    ok      = runBlockExtractorTests() && ok;
    ok      = runSuppressionTests() && ok;
    ok      = runVersionConstraintTests() && ok;
    ok      = runLintConfigTests() && ok;
    ok      = runWorkerPoolTests() && ok;
    ok      = runDiscoveryTests() && ok;
    ok      = runFormattingRuleTests() && ok;
    ok      = runCrossFileRuleTests() && ok;
    ok      = runSafetyRuleTests() && ok;
    ok      = runEngineTests() && ok;
    if (!ok)
    {
        std::cerr << "unit tests failed\n";
        return 1;
    }
    std::cout << "unit tests passed\n";
    return 0;
}
