//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements filesystem discovery for Terraform sources.
///
/// Discovery walks root directories, keeps configuration and variable value
/// files, applies path filters, and loads file contents.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Frontend/Discovery.h"

#include "llvm/Support/Error.h"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <tuple>
#include <unordered_set>
#include <utility>

namespace tfcheck
{
namespace
{

bool isHiddenName(const std::string& name)
{
    return name.size() > 1 && name.front() == '.' && name != "..";
}

void collectFromDirectory(const std::filesystem::path& root,
                          const DiscoveryOptions&      options,
                          std::vector<std::string>&    out,
                          DiagnosticEngine&            diagnostics)
{
    std::error_code ec;
    auto            it = std::filesystem::recursive_directory_iterator(root, ec);
    if (ec)
    {
        diagnostics.error({root.generic_string(), 1, 1}, "failed to open directory: " + ec.message());
        return;
    }
    for (const auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec))
    {
        if (ec)
        {
            diagnostics.error({root.generic_string(), 1, 1}, "failed to traverse directory: " + ec.message());
            return;
        }
        const std::filesystem::path path = it->path();
        const std::string           name = path.filename().string();
        if (it->is_directory(ec))
        {
            if (isHiddenName(name))
            {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(ec) || !isTerraformSourceName(name))
        {
            continue;
        }
        const std::string generic = path.generic_string();
        if (passesPathFilters(generic, options))
        {
            out.push_back(generic);
        }
    }
}

}  // namespace

bool passesPathFilters(const std::string& path, const DiscoveryOptions& options)
{
    const auto contains = [&path](const std::string& needle) {
        return !needle.empty() && path.find(needle) != std::string::npos;
    };
    if (!options.includePaths.empty() &&
        std::none_of(options.includePaths.begin(), options.includePaths.end(), contains))
    {
        return false;
    }
    return std::none_of(options.excludePaths.begin(), options.excludePaths.end(), contains);
}

void sortInTraversalOrder(std::vector<SourceFile>& sources)
{
    std::stable_sort(sources.begin(), sources.end(), [](const SourceFile& a, const SourceFile& b) {
        return std::tie(a.directory, a.fileName) < std::tie(b.directory, b.fileName);
    });
}

std::vector<SourceFile> discoverSources(const std::vector<std::string>& roots,
                                        const DiscoveryOptions&         options,
                                        DiagnosticEngine&               diagnostics)
{
    std::vector<std::string> paths;
    for (const std::string& root : roots)
    {
        const std::filesystem::path rootPath(root);
        std::error_code             ec;
        if (std::filesystem::is_directory(rootPath, ec))
        {
            collectFromDirectory(rootPath, options, paths, diagnostics);
        }
        else if (std::filesystem::is_regular_file(rootPath, ec))
        {
            if (!isTerraformSourceName(rootPath.filename().string()))
            {
                diagnostics.warning({root, 1, 1}, "not a Terraform source file: " + root);
                continue;
            }
            paths.push_back(rootPath.generic_string());
        }
        else
        {
            diagnostics.error({root, 1, 1}, "input path does not exist: " + root);
        }
    }

    std::vector<SourceFile>         sources;
    std::unordered_set<std::string> seen;
    for (const std::string& path : paths)
    {
        if (!seen.insert(path).second)
        {
            continue;
        }
        llvm::Expected<SourceFile> source = readSourceFile(path);
        if (!source)
        {
            diagnostics.error({path, 1, 1}, llvm::toString(source.takeError()));
            continue;
        }
        sources.push_back(std::move(*source));
    }
    sortInTraversalOrder(sources);
    return sources;
}

}  // namespace tfcheck
