//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// File-write policy, line emission and make-depfile helpers shared by all
/// artifact renderers.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_EMIT_EMITCOMMON_H
#define WIREGOLD_EMIT_EMITCOMMON_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace wiregold
{

/// @brief Controls how generated files are written.
struct EmitWritePolicy final
{
    /// @brief File mode applied after writing (POSIX-like bitmask).
    std::uint32_t fileMode{0644U};

    /// @brief Optional sink of absolute generated output paths.
    std::vector<std::string>* recordedOutputs{nullptr};
};

/// @brief Writes one indented line followed by a newline.
/// @param[in,out] out Destination stream.
/// @param[in] indent Indentation depth in 4-space steps.
/// @param[in] line Line text without trailing newline.
void emitLine(std::ostream& out, int indent, llvm::StringRef line);

/// @brief Renders the machine-generated banner placed at the top of every artifact.
[[nodiscard]] std::string renderGeneratedBanner(llvm::StringRef source);

/// @brief Writes generated content atomically.
///
/// @details Content goes to a unique sibling temporary file which is then
/// renamed over @p path, so a failed run never leaves a partial artifact.
/// Parent directories are created as needed.
///
/// @param[in] path Output file path.
/// @param[in] content File contents.
/// @param[in] policy Write policy.
/// @return Success or write error.
llvm::Error writeGeneratedFile(const std::filesystem::path& path, llvm::StringRef content, const EmitWritePolicy& policy);

/// @brief Renders a make-style dependency rule.
/// @param[in] target Rule target path.
/// @param[in] deps Prerequisite paths; sorted and de-duplicated on output.
/// @return Rule text terminated by a newline.
[[nodiscard]] std::string renderMakeDepfile(const std::string& target, const std::vector<std::string>& deps);

/// @brief Writes `<outputPath>.d` listing @p deps as prerequisites of @p outputPath.
llvm::Error writeDepfileForGeneratedOutput(const std::filesystem::path&    outputPath,
                                           const std::vector<std::string>& deps,
                                           const EmitWritePolicy&          policy);

}  // namespace wiregold

#endif  // WIREGOLD_EMIT_EMITCOMMON_H
