//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "tfcheck/Frontend/Discovery.h"
#include "tfcheck/Lint/Engine.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

bool writeFile(const std::string& root, const std::string& relative, const std::string& text)
{
    llvm::SmallString<256> path(root);
    llvm::sys::path::append(path, relative);
    if (std::error_code ec = llvm::sys::fs::create_directories(llvm::sys::path::parent_path(path)))
    {
        std::cerr << "cannot create directory for " << path.str().str() << ": " << ec.message() << "\n";
        return false;
    }
    std::error_code      ec;
    llvm::raw_fd_ostream out(path, ec, llvm::sys::fs::OF_Text);
    if (ec)
    {
        std::cerr << "cannot write " << path.str().str() << ": " << ec.message() << "\n";
        return false;
    }
    out << text;
    return true;
}

std::vector<std::string> relativeNames(const std::vector<tfcheck::SourceFile>& sources, const std::string& root)
{
    std::vector<std::string> names;
    for (const tfcheck::SourceFile& source : sources)
    {
        names.push_back(source.path.substr(root.size() + 1));
    }
    return names;
}

bool runDiscoveryChecks(const std::string& root)
{
    if (!writeFile(root, "net/main.tf", "locals {\n}\n") ||
        !writeFile(root, "net/terraform.tfvars", "region = \"eu\"\n") ||
        !writeFile(root, "app/variables.tf", "#bad\n") || !writeFile(root, "app/main.tf", "locals {\n}\n") ||
        !writeFile(root, ".terraform/modules/cached/main.tf", "locals {\n}\n") ||
        !writeFile(root, "notes.txt", "not terraform\n"))
    {
        return false;
    }

    {
        tfcheck::DiagnosticEngine diagnostics;
        const auto                sources = tfcheck::discoverSources({root}, {}, diagnostics);
        const std::vector<std::string> expected{"app/main.tf",
                                                "app/variables.tf",
                                                "net/main.tf",
                                                "net/terraform.tfvars"};
        if (relativeNames(sources, root) != expected || !diagnostics.diagnostics().empty())
        {
            std::cerr << "unexpected discovered set:";
            for (const std::string& name : relativeNames(sources, root))
            {
                std::cerr << " " << name;
            }
            std::cerr << "\n";
            return false;
        }
        if (sources[3].kind != tfcheck::SourceFileKind::VariableValues || sources[3].fileName != "terraform.tfvars")
        {
            std::cerr << "expected the value file to be classified\n";
            return false;
        }
    }

    {
        tfcheck::DiagnosticEngine diagnostics;
        tfcheck::DiscoveryOptions options;
        options.excludePaths = {"/net/"};
        const auto excluded  = tfcheck::discoverSources({root}, options, diagnostics);
        options.excludePaths = {};
        options.includePaths = {"/net/"};
        const auto included  = tfcheck::discoverSources({root}, options, diagnostics);
        if (excluded.size() != 2 || included.size() != 2 || included.front().fileName != "main.tf" ||
            included.front().directory.find("/net") == std::string::npos)
        {
            std::cerr << "unexpected path filter result\n";
            return false;
        }
    }

    {
        tfcheck::DiagnosticEngine diagnostics;
        const auto                sources = tfcheck::discoverSources(
            {root + "/app/main.tf", root, root + "/missing", root + "/notes.txt"}, {}, diagnostics);
        if (sources.size() != 4)
        {
            std::cerr << "explicit files must not be discovered twice\n";
            return false;
        }
        const auto& reported = diagnostics.diagnostics();
        if (reported.size() != 2 || reported[0].level != tfcheck::DiagnosticLevel::Error ||
            reported[0].message.find("does not exist") == std::string::npos ||
            reported[1].level != tfcheck::DiagnosticLevel::Warning)
        {
            std::cerr << "expected a missing path error and a non-Terraform warning\n";
            return false;
        }
    }

    {
        tfcheck::lint::LintRunOptions options;
        options.paths             = {root, root + "/missing"};
        options.config.categories = {"DC"};
        const tfcheck::lint::LintEngine engine;
        llvm::Expected<tfcheck::lint::LintRunResult> result = engine.run(options);
        if (!result)
        {
            std::cerr << "lint run failed: " << llvm::toString(result.takeError()) << "\n";
            return false;
        }
        if (result->stats.files != 4 || result->stats.directories != 2 || result->violations.size() != 1 ||
            result->violations.front().ruleId != "DC.001" ||
            result->violations.front().filePath != root + "/app/variables.tf")
        {
            std::cerr << "unexpected lint run over the discovered tree\n";
            return false;
        }
        if (!result->diagnostics.hasErrors() ||
            result->diagnostics.diagnostics().front().message.find("does not exist") == std::string::npos)
        {
            std::cerr << "discovery problems must be reported first\n";
            return false;
        }
    }

    return true;
}

}  // namespace

bool runDiscoveryTests()
{
    {
        tfcheck::DiscoveryOptions options;
        options.includePaths = {"modules/"};
        options.excludePaths = {"modules/legacy/"};
        if (!tfcheck::passesPathFilters("env/modules/vpc/main.tf", options) ||
            tfcheck::passesPathFilters("env/modules/legacy/main.tf", options) ||
            tfcheck::passesPathFilters("env/root/main.tf", options))
        {
            std::cerr << "unexpected path filter decisions\n";
            return false;
        }
        if (!tfcheck::isTerraformSourceName("x.auto.tfvars") || tfcheck::isTerraformSourceName("main.tf.json"))
        {
            std::cerr << "unexpected Terraform source name classification\n";
            return false;
        }
    }

    llvm::SmallString<128> root;
    if (std::error_code ec = llvm::sys::fs::createUniqueDirectory("tfcheck-discovery", root))
    {
        std::cerr << "cannot create temporary directory: " << ec.message() << "\n";
        return false;
    }
    const bool ok = runDiscoveryChecks(root.str().str());
    if (std::error_code ec = llvm::sys::fs::remove_directories(root))
    {
        std::cerr << "cannot remove temporary directory: " << ec.message() << "\n";
        return false;
    }
    return ok;
}
