//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `wiregold-gen` golden-vector generator.
///
/// The tool reads the shipped schemas, encodes every corpus case through
/// `protoc --encode`, canonicalizes the bytes and writes one C++ test source
/// per tier.
///
//===----------------------------------------------------------------------===//

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"
#include "wiregold/Oracle/ReferenceEncoder.h"
#include "wiregold/Pipeline/GoldenPipeline.h"
#include "wiregold/Support/Diagnostics.h"
#include "wiregold/Support/GenerationError.h"
#include "wiregold/Support/GeneratorConfig.h"

namespace
{

/// @brief Checks whether a token is a help switch.
bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: wiregold-gen --out-dir <dir> [options]\n"
                 << "Try: wiregold-gen --help\n";
}

/// @brief Prints the full help text.
void printHelp()
{
    llvm::errs()
        << "NAME\n"
        << "  wiregold-gen - golden-vector generator for the protocol-buffers wire format\n\n"
        << "SYNOPSIS\n"
        << "  wiregold-gen --out-dir <dir> [options]\n"
        << "  wiregold-gen --help\n\n"
        << "DESCRIPTION\n"
        << "  wiregold-gen encodes a fixed corpus of field values through protoc --encode, checks that\n"
        << "  the bytes decode and re-encode canonically, and writes self-contained C++ test sources\n"
        << "  exercising an independent codec implementation.\n\n"
        << "OPTIONS\n"
        << "  --config <file>\n"
        << "      JSON configuration file. Command-line options override its values.\n"
        << "  --schema-dir <dir>\n"
        << "      Directory holding simple.proto, middle.proto and difficult.proto (default: proto).\n"
        << "  --include-dir <dir>\n"
        << "      Additional --proto_path root for protoc. Repeat as needed.\n"
        << "  --out-dir <dir>\n"
        << "      Output directory for generated test sources. Required.\n"
        << "  --protoc <path>\n"
        << "      Reference encoder executable (default: protoc, looked up on PATH).\n"
        << "  --codec-header <path>\n"
        << "      Header included by generated sources (default: protobuf/Codec.h).\n"
        << "  --codec-namespace <ns>\n"
        << "      Namespace of the codec under test (default: protobuf).\n"
        << "  --tier <simple|middle|difficult|malformed>\n"
        << "      Tier to generate. Repeat to select several; default is all four.\n"
        << "  --depfile\n"
        << "      Also write <artifact>.d make depfiles listing schema dependencies.\n"
        << "  --trace <off|basic|verbose>\n"
        << "      Console verbosity (default: basic).\n"
        << "  --help, -h\n"
        << "      Print this help text.\n\n"
        << "OUTPUT\n"
        << "  codec_simple_test.cpp     runCodecSimpleGoldenTests()\n"
        << "  codec_middle_test.cpp     runCodecMiddleGoldenTests()\n"
        << "  codec_difficult_test.cpp  runCodecDifficultGoldenTests()\n"
        << "  codec_malformed_test.cpp  runCodecMalformedGoldenTests()\n\n"
        << "EXAMPLES\n"
        << "  wiregold-gen --out-dir build/golden\n"
        << "  wiregold-gen --schema-dir proto --tier middle --tier difficult --out-dir build/golden\n\n"
        << "EXIT STATUS\n"
        << "  0 on success, 1 on invalid usage or any schema, oracle, canonicalization or write failure.\n";
}

/// @brief Values given on the command line; unset members keep configuration values.
struct CliOverrides final
{
    std::optional<std::string>                configPath;
    std::optional<std::string>                schemaDir;
    std::vector<std::string>                  includeDirs;
    std::optional<std::string>                outDir;
    std::optional<std::string>                protocPath;
    std::optional<std::string>                codecHeader;
    std::optional<std::string>                codecNamespace;
    std::vector<wiregold::GoldenTier>         tiers;
    bool                                      writeDepfiles{false};
    std::optional<wiregold::TraceLevel>       traceLevel;
};

void applyOverrides(const CliOverrides& cli, wiregold::GeneratorConfig& config)
{
    if (cli.schemaDir)
    {
        config.schemaDir = *cli.schemaDir;
    }
    for (const auto& dir : cli.includeDirs)
    {
        config.includeDirs.push_back(dir);
    }
    if (cli.outDir)
    {
        config.outDir = *cli.outDir;
    }
    if (cli.protocPath)
    {
        config.protocPath = *cli.protocPath;
    }
    if (cli.codecHeader)
    {
        config.codecHeader = *cli.codecHeader;
    }
    if (cli.codecNamespace)
    {
        config.codecNamespace = *cli.codecNamespace;
    }
    if (!cli.tiers.empty())
    {
        config.tiers = cli.tiers;
    }
    if (cli.writeDepfiles)
    {
        config.writeDepfiles = true;
    }
    if (cli.traceLevel)
    {
        config.traceLevel = *cli.traceLevel;
    }
}

/// @brief Emits collected diagnostics to stderr, filtered by trace level.
void printDiagnostics(const wiregold::DiagnosticEngine& diag, const wiregold::TraceLevel trace)
{
    for (const auto& d : diag.diagnostics())
    {
        llvm::StringRef level = "note";
        if (d.level == wiregold::DiagnosticLevel::Warning)
        {
            level = "warning";
        }
        else if (d.level == wiregold::DiagnosticLevel::Error)
        {
            level = "error";
        }
        if (d.level == wiregold::DiagnosticLevel::Note && trace != wiregold::TraceLevel::Verbose)
        {
            continue;
        }
        if (d.level == wiregold::DiagnosticLevel::Warning && trace == wiregold::TraceLevel::Off)
        {
            continue;
        }
        llvm::errs() << d.site.str() << ": " << level << ": " << d.message << "\n";
    }
}

/// @brief Resolves a path to an absolute output-root string when possible.
std::string resolveOutputRoot(const std::string& root)
{
    std::error_code ec;
    const auto      abs = std::filesystem::absolute(root, ec);
    if (!ec)
    {
        return abs.lexically_normal().string();
    }
    return root;
}

/// @brief Prints the post-run summary.
void printRunSummary(const wiregold::PipelineReport&           report,
                     llvm::StringRef                           outputRoot,
                     const std::uint64_t                       oracleCalls,
                     const std::chrono::steady_clock::duration elapsed)
{
    const auto elapsedMs         = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    const auto elapsedWholeSec   = elapsedMs / 1000;
    const auto elapsedFractionMs = elapsedMs % 1000;

    llvm::errs() << "Run summary:\n";
    llvm::errs() << "  tiers:";
    for (const auto& tier : report.tiers)
    {
        llvm::errs() << " " << wiregold::goldenTierName(tier.tier) << "(" << tier.caseCount << ")";
    }
    llvm::errs() << "\n"
                 << "  output root: " << outputRoot << "\n"
                 << "  files generated: " << report.writtenFiles.size() << "\n"
                 << "  oracle invocations: " << oracleCalls << "\n"
                 << "  elapsed: " << elapsedWholeSec << ".";
    if (elapsedFractionMs < 100)
    {
        llvm::errs() << "0";
    }
    if (elapsedFractionMs < 10)
    {
        llvm::errs() << "0";
    }
    llvm::errs() << elapsedFractionMs << "s\n";
}

}  // namespace

/// @brief Program entry point for `wiregold-gen`.
///
/// @param[in] argc Argument count.
/// @param[in] argv Argument vector.
/// @return Zero on success, one on CLI, configuration or generation failure.
int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    CliOverrides cli;
    bool         helpRequested = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg          = argv[i];
        auto              requireValue = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc)
            {
                llvm::errs() << "Missing value for " << name << "\n";
                printUsage();
                std::exit(1);
            }
            return argv[++i];
        };

        if (isHelpToken(arg))
        {
            helpRequested = true;
        }
        else if (arg == "--config")
        {
            cli.configPath = requireValue(arg);
        }
        else if (arg == "--schema-dir")
        {
            cli.schemaDir = requireValue(arg);
        }
        else if (arg == "--include-dir")
        {
            cli.includeDirs.push_back(requireValue(arg));
        }
        else if (arg == "--out-dir")
        {
            cli.outDir = requireValue(arg);
        }
        else if (arg == "--protoc")
        {
            cli.protocPath = requireValue(arg);
        }
        else if (arg == "--codec-header")
        {
            cli.codecHeader = requireValue(arg);
        }
        else if (arg == "--codec-namespace")
        {
            cli.codecNamespace = requireValue(arg);
        }
        else if (arg == "--tier")
        {
            const auto value = requireValue(arg);
            const auto tier  = wiregold::parseGoldenTier(value);
            if (!tier)
            {
                llvm::errs() << "Invalid --tier value: " << value << "\n";
                printUsage();
                return 1;
            }
            cli.tiers.push_back(*tier);
        }
        else if (arg == "--depfile")
        {
            cli.writeDepfiles = true;
        }
        else if (arg == "--trace")
        {
            const auto value = requireValue(arg);
            const auto level = wiregold::parseTraceLevel(value);
            if (!level)
            {
                llvm::errs() << "Invalid --trace value: " << value << "\n";
                printUsage();
                return 1;
            }
            cli.traceLevel = *level;
        }
        else
        {
            llvm::errs() << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }
    if (helpRequested)
    {
        printHelp();
        return 0;
    }

    wiregold::GeneratorConfig config;
    if (cli.configPath)
    {
        if (llvm::Error err = wiregold::loadConfigFile(*cli.configPath, config))
        {
            llvm::errs() << llvm::toString(std::move(err)) << "\n";
            return 1;
        }
    }
    applyOverrides(cli, config);
    if (llvm::Error err = wiregold::validateConfig(config))
    {
        llvm::errs() << llvm::toString(std::move(err)) << "\n";
        printUsage();
        return 1;
    }

    const auto                       startTime = std::chrono::steady_clock::now();
    wiregold::DiagnosticEngine       diagnostics;
    wiregold::ProtocReferenceEncoder encoder(config.protocPath);
    wiregold::GoldenPipeline         pipeline(config, encoder, diagnostics);

    auto report = pipeline.run();
    if (!report)
    {
        wiregold::reportGenerationError(report.takeError(), "generate", diagnostics);
        printDiagnostics(diagnostics, config.traceLevel);
        return 1;
    }

    printDiagnostics(diagnostics, config.traceLevel);
    if (config.traceLevel != wiregold::TraceLevel::Off)
    {
        printRunSummary(*report,
                        resolveOutputRoot(config.outDir),
                        encoder.invocationCount(),
                        std::chrono::steady_clock::now() - startTime);
    }
    return diagnostics.hasErrors() ? 1 : 0;
}
