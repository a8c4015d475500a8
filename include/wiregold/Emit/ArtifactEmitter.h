//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Renderers producing one self-contained C++ test source per golden tier.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_EMIT_ARTIFACTEMITTER_H
#define WIREGOLD_EMIT_ARTIFACTEMITTER_H

#include "wiregold/Corpus/MalformedCorpus.h"
#include "wiregold/Emit/CodecContract.h"
#include "wiregold/Emit/GoldenModel.h"
#include "wiregold/Schema/SchemaModel.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace wiregold
{

/// @brief Naming shared by all renderers for one artifact.
struct ArtifactHeader final
{
    /// @brief Source named in the generated banner (`middle.proto`).
    std::string source;

    /// @brief Public entry point (`runCodecMiddleGoldenTests`).
    std::string entryPoint;
};

/// @brief Returns `runCodec<Tier>GoldenTests`.
[[nodiscard]] std::string goldenEntryPointName(llvm::StringRef tierName);

/// @brief Returns `codec_<tier>_test.cpp`.
[[nodiscard]] std::string goldenArtifactFileName(llvm::StringRef tierName);

/// @brief Renders the scalar-tier artifact.
/// @param[in] contract Codec symbol spelling.
/// @param[in] header Banner source and entry point.
/// @param[in] tables One table per scalar kind, emitted in the given order.
/// @return Artifact source text.
[[nodiscard]] std::string renderScalarArtifact(const CodecContract&                  contract,
                                               const ArtifactHeader&                 header,
                                               const std::vector<ScalarGoldenTable>& tables);

/// @brief Renders a composite message-tier artifact.
///
/// @details Emits one struct per message reachable from @p root (nested and
/// map-entry types included), decode/encode helpers, a designated-initializer
/// case table and per-field assertions. Recursive message graphs are
/// rejected with `UnsupportedFieldKind`.
llvm::Expected<std::string> renderMessageArtifact(const CodecContract&                     contract,
                                                  const ArtifactHeader&                    header,
                                                  const SchemaFile&                        schema,
                                                  const MessageSpec&                       root,
                                                  const std::vector<CompositeGoldenEntry>& entries);

/// @brief Renders the negative-path artifact.
[[nodiscard]] std::string renderMalformedArtifact(const CodecContract&              contract,
                                                  const ArtifactHeader&             header,
                                                  const std::vector<MalformedCase>& cases);

}  // namespace wiregold

#endif  // WIREGOLD_EMIT_ARTIFACTEMITTER_H
