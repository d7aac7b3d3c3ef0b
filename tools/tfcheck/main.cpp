//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `tfcheck` command-line analyzer.
///
/// This tool discovers Terraform sources under the given paths, runs the
/// selected rules, and prints the violations as text or JSON.
///
//===----------------------------------------------------------------------===//

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "tfcheck/Lint/Engine.h"
#include "tfcheck/Lint/LintConfig.h"
#include "tfcheck/Lint/Report.h"
#include "tfcheck/Lint/Telemetry.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

constexpr int kExitClean      = 0;
constexpr int kExitViolations = 1;
constexpr int kExitUsage      = 2;

/// @brief Checks whether a token is a help switch.
bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: tfcheck [options] <path>...\n"
                 << "Try: tfcheck --help\n";
}

/// @brief Prints the full help text.
void printHelp()
{
    llvm::errs()
        << "NAME\n"
        << "  tfcheck - static style, layout and safety analyzer for Terraform configurations\n\n"
        << "SYNOPSIS\n"
        << "  tfcheck [options] <path>...\n"
        << "  tfcheck --list-rules\n"
        << "  tfcheck --help\n\n"
        << "DESCRIPTION\n"
        << "  tfcheck discovers .tf and .tfvars files under each path, checks every file with the\n"
        << "  single-file rules, then checks each directory with the cross-file rules. Rules can be\n"
        << "  silenced for a line range with '# <RULE> Disable' and '# <RULE> Enable' comments.\n\n"
        << "OPTIONS\n"
        << "  --config <file>\n"
        << "      JSON configuration file. Command-line options override its values.\n"
        << "  --categories <ST,IO,DC,SC>\n"
        << "      Comma separated rule categories to run (default: all).\n"
        << "  --exclude-rules <ID,...>\n"
        << "      Comma separated rule IDs that never run.\n"
        << "  --include-path <text>\n"
        << "      Keep only files whose path contains the text. Repeat as needed.\n"
        << "  --exclude-path <text>\n"
        << "      Drop files whose path contains the text. Repeat as needed.\n"
        << "  --fixed-label <name>\n"
        << "      Required instance label of resource and data blocks (default: test).\n"
        << "  --jobs <N>\n"
        << "      Worker threads; 0 uses the hardware concurrency (default: 0).\n"
        << "  --format <text|json>\n"
        << "      Report format (default: text).\n"
        << "  -o <file>\n"
        << "      Write the report to a file instead of stdout.\n"
        << "  --list-rules\n"
        << "      Print the rule catalogue and exit.\n"
        << "  --verbose\n"
        << "      Print progress and per-rule totals to stderr.\n"
        << "  --help, -h\n"
        << "      Print this help text.\n\n"
        << "EXIT STATUS\n"
        << "  0 when no error-severity violation was found, 1 when at least one was found,\n"
        << "  2 on invalid CLI usage or configuration.\n";
}

/// @brief Emits collected diagnostics to stderr.
void printDiagnostics(const tfcheck::DiagnosticEngine& diag)
{
    for (const auto& d : diag.diagnostics())
    {
        llvm::errs() << "[tfcheck] " << d.location.str() << ": " << tfcheck::diagnosticLevelName(d.level) << ": "
                     << d.message << "\n";
    }
}

/// @brief Splits a comma separated option value, dropping empty items.
std::vector<std::string> splitList(llvm::StringRef value)
{
    llvm::SmallVector<llvm::StringRef, 8> parts;
    value.split(parts, ',', -1, false);
    std::vector<std::string> out;
    for (llvm::StringRef part : parts)
    {
        part = part.trim();
        if (!part.empty())
        {
            out.push_back(part.str());
        }
    }
    return out;
}

/// @brief Prints one telemetry event as a progress line.
void printRunEvent(const tfcheck::lint::RunEvent& event)
{
    using tfcheck::lint::RunEventKind;
    switch (event.kind)
    {
    case RunEventKind::FilesDiscovered:
        llvm::errs() << "[tfcheck] discovered " << event.count << " file(s)\n";
        break;
    case RunEventKind::FileAnalyzed:
    case RunEventKind::DirectoryAnalyzed:
        llvm::errs() << llvm::formatv("[tfcheck] {0} {1}: {2} violation(s) in {3} us\n",
                                      tfcheck::lint::runEventKindName(event.kind),
                                      event.subject,
                                      event.count,
                                      event.elapsedMicros);
        break;
    case RunEventKind::RuleSummary:
        llvm::errs() << "[tfcheck] rule " << event.subject << ": " << event.count << " violation(s)\n";
        break;
    case RunEventKind::RunFinished:
        llvm::errs() << llvm::formatv("[tfcheck] finished: {0} violation(s) in {1} ms\n",
                                      event.count,
                                      event.elapsedMicros / 1000U);
        break;
    }
}

}  // namespace

/// @brief Program entry point for `tfcheck`.
///
/// @param[in] argc Argument count.
/// @param[in] argv Argument vector.
/// @return Zero when clean, one on error-severity violations, two on usage or
///         configuration errors.
int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    std::vector<std::string>                paths;
    std::optional<std::string>              configPath;
    std::optional<std::vector<std::string>> categories;
    std::optional<std::vector<std::string>> excludedRules;
    std::vector<std::string>                includePaths;
    std::vector<std::string>                excludePaths;
    std::optional<std::string>              fixedLabel;
    std::optional<std::size_t>              jobs;
    tfcheck::lint::ReportFormat             format    = tfcheck::lint::ReportFormat::Text;
    std::string                             outputPath;
    bool                                    listRules = false;
    bool                                    verbose   = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg          = argv[i];
        bool              missing      = false;
        auto              requireValue = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc)
            {
                llvm::errs() << "Missing value for " << name << "\n";
                missing = true;
                return {};
            }
            return argv[++i];
        };

        if (isHelpToken(arg))
        {
            printHelp();
            return kExitClean;
        }
        if (arg == "--config")
        {
            configPath = requireValue(arg);
        }
        else if (arg == "--categories")
        {
            categories = splitList(requireValue(arg));
        }
        else if (arg == "--exclude-rules")
        {
            excludedRules = splitList(requireValue(arg));
        }
        else if (arg == "--include-path")
        {
            includePaths.push_back(requireValue(arg));
        }
        else if (arg == "--exclude-path")
        {
            excludePaths.push_back(requireValue(arg));
        }
        else if (arg == "--fixed-label")
        {
            fixedLabel = requireValue(arg);
        }
        else if (arg == "--jobs")
        {
            const auto            value = requireValue(arg);
            std::uint64_t         parsedJobs{};
            const llvm::StringRef valueRef(value);
            if (!missing && valueRef.getAsInteger(10, parsedJobs))
            {
                llvm::errs() << "Invalid --jobs value: " << value << "\n";
                printUsage();
                return kExitUsage;
            }
            jobs = static_cast<std::size_t>(parsedJobs);
        }
        else if (arg == "--format")
        {
            const auto value  = requireValue(arg);
            const auto parsed = tfcheck::lint::parseReportFormat(value);
            if (!missing && !parsed)
            {
                llvm::errs() << "Invalid --format value: " << value << "\n";
                printUsage();
                return kExitUsage;
            }
            if (parsed)
            {
                format = *parsed;
            }
        }
        else if (arg == "-o")
        {
            outputPath = requireValue(arg);
        }
        else if (arg == "--list-rules")
        {
            listRules = true;
        }
        else if (arg == "--verbose")
        {
            verbose = true;
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            llvm::errs() << "Unknown option: " << arg << "\n";
            printUsage();
            return kExitUsage;
        }
        else
        {
            paths.push_back(arg);
        }

        if (missing)
        {
            printUsage();
            return kExitUsage;
        }
    }

    tfcheck::lint::LintEngine engine;
    if (listRules)
    {
        tfcheck::lint::writeRuleList(engine.descriptors(), llvm::outs());
        return kExitClean;
    }
    if (paths.empty())
    {
        llvm::errs() << "At least one input path is required\n";
        printUsage();
        return kExitUsage;
    }

    tfcheck::lint::LintRunOptions options;
    options.paths = paths;
    if (configPath)
    {
        if (llvm::Error err = tfcheck::lint::loadLintConfigFile(*configPath, options.config))
        {
            llvm::errs() << "[tfcheck] " << llvm::toString(std::move(err)) << "\n";
            return kExitUsage;
        }
    }
    if (categories)
    {
        options.config.categories = std::move(*categories);
    }
    if (excludedRules)
    {
        options.config.excludedRules = std::move(*excludedRules);
    }
    if (!includePaths.empty())
    {
        options.config.discovery.includePaths = std::move(includePaths);
    }
    if (!excludePaths.empty())
    {
        options.config.discovery.excludePaths = std::move(excludePaths);
    }
    if (fixedLabel)
    {
        options.config.fixedInstanceLabel = std::move(*fixedLabel);
    }
    if (jobs)
    {
        options.config.jobs = *jobs;
    }

    tfcheck::lint::RunTelemetry telemetry;
    if (verbose)
    {
        telemetry.setSink(printRunEvent);
        engine.setTelemetry(&telemetry);
    }

    llvm::Expected<tfcheck::lint::LintRunResult> result = engine.run(options);
    if (!result)
    {
        llvm::errs() << "[tfcheck] " << llvm::toString(result.takeError()) << "\n";
        return kExitUsage;
    }
    if (verbose)
    {
        printDiagnostics(result->diagnostics);
    }

    if (outputPath.empty())
    {
        tfcheck::lint::writeReport(*result, format, llvm::outs());
    }
    else
    {
        std::error_code      ec;
        llvm::raw_fd_ostream out(outputPath, ec, llvm::sys::fs::OF_Text);
        if (ec)
        {
            llvm::errs() << "[tfcheck] cannot open output file '" << outputPath << "': " << ec.message() << "\n";
            return kExitUsage;
        }
        tfcheck::lint::writeReport(*result, format, out);
    }

    return result->hasErrorViolations() ? kExitViolations : kExitClean;
}
