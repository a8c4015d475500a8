//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Generator configuration model.
///
/// Settings are loaded from an optional JSON document and then overridden by
/// command-line flags in `wiregold-gen`.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_SUPPORT_GENERATORCONFIG_H
#define WIREGOLD_SUPPORT_GENERATORCONFIG_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wiregold
{

/// @brief Trace verbosity for console diagnostics.
enum class TraceLevel
{
    /// @brief Print errors only.
    Off,

    /// @brief Print errors, warnings and the run summary.
    Basic,

    /// @brief Additionally print per-tier progress notes.
    Verbose,
};

/// @brief One coverage tier, rendered into one artifact file.
enum class GoldenTier
{
    /// @brief One single-field message per scalar kind.
    Simple,

    /// @brief Mid-complexity composite message.
    Middle,

    /// @brief Composite message with packed doubles, nested items, a map and a oneof.
    Difficult,

    /// @brief Hand-authored malformed inputs.
    Malformed,
};

/// @brief Returns the configuration spelling of a tier (`simple`, `middle`, ...).
[[nodiscard]] llvm::StringRef goldenTierName(GoldenTier tier);

/// @brief Parses a tier spelling.
[[nodiscard]] std::optional<GoldenTier> parseGoldenTier(llvm::StringRef text);

/// @brief Parses a trace level spelling (`off`, `basic`, `verbose`).
[[nodiscard]] std::optional<TraceLevel> parseTraceLevel(llvm::StringRef text);

/// @brief Mutable runtime configuration for `wiregold-gen`.
struct GeneratorConfig final
{
    /// @brief Directory holding `simple.proto`, `middle.proto` and `difficult.proto`.
    std::string schemaDir{"proto"};

    /// @brief Additional `--proto_path` roots handed to the reference encoder.
    std::vector<std::string> includeDirs;

    /// @brief Artifact output directory.
    std::string outDir;

    /// @brief Reference encoder executable name or path.
    std::string protocPath{"protoc"};

    /// @brief Header included by generated artifacts to reach the codec under test.
    std::string codecHeader{"protobuf/Codec.h"};

    /// @brief C++ namespace of the codec under test (may be nested with `::`).
    std::string codecNamespace{"protobuf"};

    /// @brief Tiers generated by this run, in order.
    std::vector<GoldenTier> tiers{GoldenTier::Simple, GoldenTier::Middle, GoldenTier::Difficult, GoldenTier::Malformed};

    /// @brief Number of synthetic middle-tier cases appended after the seeds.
    std::uint32_t middleSyntheticCases{80};

    /// @brief Number of synthetic difficult-tier cases appended after the seeds.
    std::uint32_t difficultSyntheticCases{70};

    /// @brief Emits `<artifact>.d` make depfiles next to each artifact.
    bool writeDepfiles{false};

    /// @brief POSIX mode applied to written artifacts.
    std::uint32_t fileMode{0644U};

    /// @brief Console trace verbosity.
    TraceLevel traceLevel{TraceLevel::Basic};
};

/// @brief Applies one JSON settings object to a configuration.
///
/// @details
/// Recognized keys: `schemaDir`, `includeDirs`, `outDir`, `protoc`,
/// `codec.header`, `codec.namespace`, `tiers`, `synthetic.middle`,
/// `synthetic.difficult`, `depfiles`, `trace`. Unknown keys are ignored.
/// Relative directory paths are resolved against `baseDir` when it is not empty.
///
/// @param[in] settings JSON object with generator settings.
/// @param[in] baseDir Directory relative paths are resolved against.
/// @param[in,out] config Configuration instance to update.
/// @return Success, or an error naming the first invalid setting.
llvm::Error applyConfigJson(const llvm::json::Value& settings, llvm::StringRef baseDir, GeneratorConfig& config);

/// @brief Reads a JSON configuration file and applies it.
/// @param[in] path Configuration file path.
/// @param[in,out] config Configuration instance to update.
/// @return Success, or an I/O, JSON syntax, or setting error.
llvm::Error loadConfigFile(llvm::StringRef path, GeneratorConfig& config);

/// @brief Checks cross-field constraints before a run starts.
/// @param[in] config Fully merged configuration.
/// @return Success, or an error naming the offending setting.
llvm::Error validateConfig(const GeneratorConfig& config);

}  // namespace wiregold

#endif  // WIREGOLD_SUPPORT_GENERATORCONFIG_H
