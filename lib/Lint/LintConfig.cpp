//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements lint configuration parsing.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Lint/LintConfig.h"

#include "llvm/Support/MemoryBuffer.h"

#include <algorithm>
#include <utility>

namespace tfcheck::lint
{
namespace
{

llvm::Error typeError(llvm::StringRef key, llvm::StringRef expected)
{
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "configuration key '%s' must be %s",
                                   key.str().c_str(),
                                   expected.str().c_str());
}

llvm::Error readStringArray(const llvm::json::Object& object, llvm::StringRef key, std::vector<std::string>& out)
{
    const auto* value = object.get(key);
    if (!value)
    {
        return llvm::Error::success();
    }

    const auto* array = value->getAsArray();
    if (!array)
    {
        return typeError(key, "an array of strings");
    }

    std::vector<std::string> parsed;
    parsed.reserve(array->size());
    for (const llvm::json::Value& item : *array)
    {
        const auto text = item.getAsString();
        if (!text)
        {
            return typeError(key, "an array of strings");
        }
        parsed.emplace_back(text->str());
    }
    out = std::move(parsed);
    return llvm::Error::success();
}

llvm::Error readString(const llvm::json::Object& object, llvm::StringRef key, std::string& out)
{
    const auto* value = object.get(key);
    if (!value)
    {
        return llvm::Error::success();
    }
    const auto text = value->getAsString();
    if (!text)
    {
        return typeError(key, "a string");
    }
    out = text->str();
    return llvm::Error::success();
}

llvm::Error applyFileNames(const llvm::json::Object& settings, CanonicalFileNames& files)
{
    const auto* filesValue = settings.get("files");
    if (!filesValue)
    {
        return llvm::Error::success();
    }
    const auto* object = filesValue->getAsObject();
    if (!object)
    {
        return typeError("files", "an object");
    }
    if (llvm::Error err = readString(*object, "variables", files.variables))
    {
        return err;
    }
    if (llvm::Error err = readString(*object, "outputs", files.outputs))
    {
        return err;
    }
    if (llvm::Error err = readString(*object, "tfvars", files.tfvars))
    {
        return err;
    }
    if (llvm::Error err = readString(*object, "providers", files.providers))
    {
        return err;
    }
    return readString(*object, "main", files.main);
}

llvm::Error applyAllowList(const llvm::json::Object& settings, LintConfig& config)
{
    const auto* allowValue = settings.get("allowList");
    if (!allowValue)
    {
        return llvm::Error::success();
    }
    const auto* object = allowValue->getAsObject();
    if (!object)
    {
        return typeError("allowList", "an object");
    }
    if (llvm::Error err = readStringArray(*object, "names", config.allowListNames))
    {
        return err;
    }
    return readStringArray(*object, "prefixes", config.allowListPrefixes);
}

}  // namespace

bool LintConfig::isAllowListed(const std::string& variableName) const
{
    if (std::find(allowListNames.begin(), allowListNames.end(), variableName) != allowListNames.end())
    {
        return true;
    }
    return std::any_of(allowListPrefixes.begin(), allowListPrefixes.end(), [&variableName](const std::string& p) {
        return !p.empty() && variableName.compare(0, p.size(), p) == 0;
    });
}

llvm::Error applyLintConfigJson(const llvm::json::Value& value, LintConfig& config)
{
    const auto* settings = value.getAsObject();
    if (!settings)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "configuration root must be a JSON object");
    }

    if (llvm::Error err = readStringArray(*settings, "categories", config.categories))
    {
        return err;
    }
    if (llvm::Error err = readStringArray(*settings, "excludedRules", config.excludedRules))
    {
        return err;
    }
    if (llvm::Error err = readStringArray(*settings, "includePaths", config.discovery.includePaths))
    {
        return err;
    }
    if (llvm::Error err = readStringArray(*settings, "excludePaths", config.discovery.excludePaths))
    {
        return err;
    }
    if (llvm::Error err = readStringArray(*settings, "oracleProviders", config.oracleProviders))
    {
        return err;
    }
    if (llvm::Error err = readString(*settings, "fixedInstanceLabel", config.fixedInstanceLabel))
    {
        return err;
    }
    if (const auto* jobsValue = settings->get("jobs"))
    {
        const auto jobs = jobsValue->getAsInteger();
        if (!jobs || *jobs < 0)
        {
            return typeError("jobs", "a non-negative integer");
        }
        config.jobs = static_cast<std::size_t>(*jobs);
    }
    if (llvm::Error err = applyFileNames(*settings, config.files))
    {
        return err;
    }
    return applyAllowList(*settings, config);
}

llvm::Error loadLintConfigFile(const std::string& path, LintConfig& config)
{
    llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return llvm::createStringError(buffer.getError(),
                                       "cannot read configuration file '%s': %s",
                                       path.c_str(),
                                       buffer.getError().message().c_str());
    }
    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse((*buffer)->getBuffer());
    if (!parsed)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "invalid JSON in configuration file '%s': %s",
                                       path.c_str(),
                                       llvm::toString(parsed.takeError()).c_str());
    }
    return applyLintConfigJson(*parsed, config);
}

}  // namespace tfcheck::lint
