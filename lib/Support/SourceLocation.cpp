//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements source-location rendering helpers.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Frontend/SourceLocation.h"

#include <sstream>

namespace tfcheck
{

std::string SourceLocation::str() const
{
    std::ostringstream out;
    out << file << ':' << line << ':' << column;
    return out.str();
}

}  // namespace tfcheck
