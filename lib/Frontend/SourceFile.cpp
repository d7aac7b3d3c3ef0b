//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements source snapshot construction and file reads.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Frontend/SourceFile.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace tfcheck
{

namespace
{

bool endsWith(const std::string& text, const std::string& suffix)
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> splitLines(const std::string& text)
{
    std::vector<std::string> out;
    std::string              current;
    for (const char c : text)
    {
        if (c == '\n')
        {
            if (!current.empty() && current.back() == '\r')
            {
                current.pop_back();
            }
            out.push_back(std::move(current));
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty())
    {
        if (current.back() == '\r')
        {
            current.pop_back();
        }
        out.push_back(std::move(current));
    }
    return out;
}

}  // namespace

bool isTerraformSourceName(const std::string& fileName)
{
    return endsWith(fileName, ".tf") || endsWith(fileName, ".tfvars");
}

SourceFile makeSourceFile(std::string path, std::string text)
{
    SourceFile                  file;
    const std::filesystem::path fsPath(path);
    file.directory = fsPath.parent_path().generic_string();
    if (file.directory.empty())
    {
        file.directory = ".";
    }
    file.fileName        = fsPath.filename().generic_string();
    file.kind            = endsWith(file.fileName, ".tfvars") ? SourceFileKind::VariableValues
                                                              : SourceFileKind::Configuration;
    file.lines           = splitLines(text);
    file.endsWithNewline = !text.empty() && text.back() == '\n';
    file.path            = std::move(path);
    file.text            = std::move(text);
    return file;
}

llvm::Expected<SourceFile> readSourceFile(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.good())
    {
        return llvm::createStringError(std::make_error_code(std::errc::no_such_file_or_directory),
                                       "failed to open Terraform source file '%s'",
                                       path.c_str());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
    {
        return llvm::createStringError(std::make_error_code(std::errc::io_error),
                                       "failed to read Terraform source file '%s'",
                                       path.c_str());
    }
    return makeSourceFile(path, ss.str());
}

}  // namespace tfcheck
