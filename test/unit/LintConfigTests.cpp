//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <system_error>

#include "tfcheck/Lint/LintConfig.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

std::string applyText(const std::string& json, tfcheck::lint::LintConfig& config)
{
    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(json);
    if (!parsed)
    {
        return "parse: " + llvm::toString(parsed.takeError());
    }
    if (llvm::Error err = tfcheck::lint::applyLintConfigJson(*parsed, config))
    {
        return llvm::toString(std::move(err));
    }
    return {};
}

}  // namespace

bool runLintConfigTests()
{
    {
        const tfcheck::lint::LintConfig defaults;
        if (!defaults.isAllowListed("access_key") || !defaults.isAllowListed("region_id") ||
            defaults.isAllowListed("flavor") || defaults.fixedInstanceLabel != "test" ||
            defaults.files.tfvars != "terraform.tfvars")
        {
            std::cerr << "unexpected default configuration\n";
            return false;
        }
    }

    {
        tfcheck::lint::LintConfig config;
        const std::string         error = applyText(R"({
            "categories": ["ST", "SC"],
            "excludedRules": ["ST.011"],
            "includePaths": ["modules/"],
            "excludePaths": [".terraform/"],
            "oracleProviders": ["huaweicloud"],
            "fixedInstanceLabel": "main",
            "jobs": 4,
            "files": {"variables": "inputs.tf", "main": "resources.tf"},
            "allowList": {"names": ["project_id"], "prefixes": []},
            "futureKey": true
        })",
                                            config);
        if (!error.empty())
        {
            std::cerr << "configuration rejected: " << error << "\n";
            return false;
        }
        if (config.categories.size() != 2 || config.excludedRules.front() != "ST.011" ||
            config.discovery.includePaths.front() != "modules/" ||
            config.discovery.excludePaths.front() != ".terraform/" || config.oracleProviders.size() != 1 ||
            config.fixedInstanceLabel != "main" || config.jobs != 4)
        {
            std::cerr << "top-level keys were not applied\n";
            return false;
        }
        if (config.files.variables != "inputs.tf" || config.files.main != "resources.tf" ||
            config.files.outputs != "outputs.tf")
        {
            std::cerr << "file names must be overridden key by key\n";
            return false;
        }
        if (config.isAllowListed("region") || !config.isAllowListed("project_id") ||
            config.isAllowListed("tenant_id"))
        {
            std::cerr << "allow-list entries must replace the defaults\n";
            return false;
        }
    }

    {
        tfcheck::lint::LintConfig config;
        if (applyText(R"({"categories": "ST"})", config) !=
                "configuration key 'categories' must be an array of strings" ||
            applyText(R"({"jobs": -1})", config) != "configuration key 'jobs' must be a non-negative integer" ||
            applyText(R"({"files": []})", config) != "configuration key 'files' must be an object" ||
            applyText(R"({"allowList": {"names": [1]}})", config) !=
                "configuration key 'names' must be an array of strings" ||
            applyText(R"(["ST"])", config) != "configuration root must be a JSON object")
        {
            std::cerr << "expected type errors for malformed keys\n";
            return false;
        }
        if (!config.categories.empty())
        {
            std::cerr << "a rejected key must leave the configuration unchanged\n";
            return false;
        }
    }

    {
        llvm::SmallString<128> path;
        int                    fd = -1;
        if (std::error_code ec = llvm::sys::fs::createTemporaryFile("tfcheck-config", "json", fd, path))
        {
            std::cerr << "cannot create temporary file: " << ec.message() << "\n";
            return false;
        }
        {
            llvm::raw_fd_ostream out(fd, /*shouldClose=*/true);
            out << R"({"fixedInstanceLabel": "this", "categories": ["IO"]})";
        }
        tfcheck::lint::LintConfig config;
        llvm::Error               loaded = tfcheck::lint::loadLintConfigFile(path.str().str(), config);
        if (std::error_code ec = llvm::sys::fs::remove(path))
        {
            llvm::consumeError(std::move(loaded));
            std::cerr << "cannot remove temporary file: " << ec.message() << "\n";
            return false;
        }
        if (loaded)
        {
            std::cerr << "loading the configuration file failed: " << llvm::toString(std::move(loaded)) << "\n";
            return false;
        }
        if (config.fixedInstanceLabel != "this" || config.categories.front() != "IO")
        {
            std::cerr << "configuration file values were not applied\n";
            return false;
        }

        llvm::Error missing = tfcheck::lint::loadLintConfigFile(path.str().str(), config);
        if (!missing)
        {
            std::cerr << "expected a removed configuration file to fail\n";
            return false;
        }
        const std::string text = llvm::toString(std::move(missing));
        if (text.find("cannot read configuration file") == std::string::npos)
        {
            std::cerr << "unexpected missing file error: " << text << "\n";
            return false;
        }
    }

    return true;
}
