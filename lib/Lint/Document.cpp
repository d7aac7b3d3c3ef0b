//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements document construction.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Lint/Document.h"

#include "tfcheck/Frontend/BlockExtractor.h"

#include "llvm/Support/Error.h"

#include <utility>

namespace tfcheck::lint
{

LintDocument buildLintDocument(SourceFile source, const std::size_t order)
{
    LintDocument document;
    document.order        = order;
    document.scan         = scanLines(source);
    document.suppressions = scanSuppressions(source, document.scan);

    llvm::Expected<Block> root = extractBlocks(source, document.scan);
    if (root)
    {
        document.root = std::move(*root);
    }
    else
    {
        llvm::handleAllErrors(
            root.takeError(),
            [&document](const ParseError& error) {
                document.parseFailure = ParseFailure{error.line(), error.description()};
            },
            [&document](const llvm::ErrorInfoBase& error) {
                document.parseFailure = ParseFailure{1, error.message()};
            });
    }
    document.source = std::move(source);
    return document;
}

}  // namespace tfcheck::lint
