//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Tier-by-tier golden-vector generation.
///
/// Each selected tier passes through corpus build, oracle encode,
/// canonicalization, rendering and an atomic write before the next tier
/// starts. The first failure stops the run.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_PIPELINE_GOLDENPIPELINE_H
#define WIREGOLD_PIPELINE_GOLDENPIPELINE_H

#include "wiregold/Corpus/CompositeCorpus.h"
#include "wiregold/Emit/CodecContract.h"
#include "wiregold/Oracle/ReferenceEncoder.h"
#include "wiregold/Schema/SchemaModel.h"
#include "wiregold/Support/Diagnostics.h"
#include "wiregold/Support/GeneratorConfig.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace wiregold
{

/// @brief Outcome of one generated tier.
struct TierReport final
{
    GoldenTier  tier{GoldenTier::Simple};
    std::string artifactPath;
    std::size_t caseCount{0};
};

/// @brief Outcome of a full run.
struct PipelineReport final
{
    std::vector<TierReport> tiers;

    /// @brief Absolute paths of every file written, depfiles included.
    std::vector<std::string> writtenFiles;
};

class GoldenPipeline final
{
public:
    /// @brief Binds the pipeline to a validated configuration.
    /// @param[in] config Run configuration.
    /// @param[in,out] encoder Reference encoder used for every case.
    /// @param[in,out] diagnostics Sink for progress notes and schema diagnostics.
    GoldenPipeline(const GeneratorConfig& config, ReferenceEncoder& encoder, DiagnosticEngine& diagnostics);

    /// @brief Generates every configured tier in order.
    llvm::Expected<PipelineReport> run();

    /// @brief Builds the artifact text of one tier without writing it.
    /// @param[in] tier Tier to render.
    /// @param[out] schemaDeps Schema files the artifact depends on.
    /// @param[out] caseCount Number of cases in the artifact.
    llvm::Expected<std::string> renderTier(GoldenTier tier, std::vector<std::string>& schemaDeps, std::size_t& caseCount);

private:
    llvm::Expected<const SchemaFile*> schema(llvm::StringRef fileName);

    llvm::Expected<ByteString> oracleEncode(const SchemaFile& schema, llvm::StringRef messageType, std::string text);

    llvm::Expected<std::string> renderSimpleTier(std::vector<std::string>& schemaDeps, std::size_t& caseCount);

    llvm::Expected<std::string> renderCompositeTier(GoldenTier                tier,
                                                    const CompositeCorpus&    corpus,
                                                    std::vector<std::string>& schemaDeps,
                                                    std::size_t&              caseCount);

    const GeneratorConfig&            config_;
    ReferenceEncoder&                 encoder_;
    DiagnosticEngine&                 diagnostics_;
    CodecContract                     contract_;
    std::map<std::string, SchemaFile> schemas_;
};

}  // namespace wiregold

#endif  // WIREGOLD_PIPELINE_GOLDENPIPELINE_H
