//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "wiregold/Pipeline/GoldenPipeline.h"

#include "wiregold/Canon/Canonicalize.h"
#include "wiregold/Corpus/MalformedCorpus.h"
#include "wiregold/Corpus/ScalarCorpus.h"
#include "wiregold/Emit/ArtifactEmitter.h"
#include "wiregold/Emit/EmitCommon.h"
#include "wiregold/Oracle/TextFormat.h"
#include "wiregold/Schema/SchemaParser.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Path.h"

#include <filesystem>
#include <utility>

namespace wiregold
{

namespace
{

std::string schemaPath(const GeneratorConfig& config, const SchemaFile& schema)
{
    llvm::SmallString<256> path(config.schemaDir);
    llvm::sys::path::append(path, schema.fileName);
    return path.str().str();
}

}  // namespace

GoldenPipeline::GoldenPipeline(const GeneratorConfig& config, ReferenceEncoder& encoder, DiagnosticEngine& diagnostics)
    : config_(config)
    , encoder_(encoder)
    , diagnostics_(diagnostics)
    , contract_(config.codecHeader, config.codecNamespace)
{
}

llvm::Expected<const SchemaFile*> GoldenPipeline::schema(llvm::StringRef fileName)
{
    const auto cached = schemas_.find(fileName.str());
    if (cached != schemas_.end())
    {
        return &cached->second;
    }
    auto loaded = loadSchemaFile(config_.schemaDir, fileName, diagnostics_);
    if (!loaded)
    {
        return loaded.takeError();
    }
    const auto inserted = schemas_.emplace(fileName.str(), std::move(*loaded));
    return &inserted.first->second;
}

llvm::Expected<ByteString> GoldenPipeline::oracleEncode(const SchemaFile& schema,
                                                        llvm::StringRef   messageType,
                                                        std::string       text)
{
    EncodeRequest request;
    request.schemaFile  = schema.fileName;
    request.schemaDir   = config_.schemaDir;
    request.includeDirs = config_.includeDirs;
    request.messageType = messageType.str();
    request.textFormat  = std::move(text);
    return encoder_.encode(request);
}

llvm::Expected<std::string> GoldenPipeline::renderSimpleTier(std::vector<std::string>& schemaDeps,
                                                             std::size_t&              caseCount)
{
    auto simple = schema(kSimpleSchemaFile);
    if (!simple)
    {
        return simple.takeError();
    }
    const SchemaFile& file = **simple;
    schemaDeps.push_back(schemaPath(config_, file));

    std::vector<ScalarGoldenTable> tables;
    for (const ScalarCorpus& corpus : buildScalarCorpora())
    {
        auto message = file.requireMessage(corpus.messageType);
        if (!message)
        {
            return message.takeError();
        }

        ScalarGoldenTable table;
        table.kind        = corpus.kind;
        table.messageType = corpus.messageType;
        for (const ScalarValue& value : corpus.values)
        {
            MessageValue input;
            input.set("value", value);
            auto text = renderTextFormatMessage(file, **message, input);
            if (!text)
            {
                return text.takeError();
            }
            auto encoded = oracleEncode(file, corpus.messageType, std::move(*text));
            if (!encoded)
            {
                return encoded.takeError();
            }
            auto canonical = canonicalizeScalarCase(file, **message, corpus.kind, value, *encoded);
            if (!canonical)
            {
                return canonical.takeError();
            }
            table.entries.push_back(ScalarGoldenEntry{std::move(*encoded), std::move(*canonical)});
        }
        caseCount += table.entries.size();
        diagnostics_.note(DiagnosticSite::atOperation("corpus", corpus.messageType),
                          std::to_string(table.entries.size()) + " cases canonicalized");
        tables.push_back(std::move(table));
    }

    const ArtifactHeader header{kSimpleSchemaFile, goldenEntryPointName(goldenTierName(GoldenTier::Simple))};
    return renderScalarArtifact(contract_, header, tables);
}

llvm::Expected<std::string> GoldenPipeline::renderCompositeTier(const GoldenTier          tier,
                                                                const CompositeCorpus&    corpus,
                                                                std::vector<std::string>& schemaDeps,
                                                                std::size_t&              caseCount)
{
    auto loaded = schema(corpus.schemaFile);
    if (!loaded)
    {
        return loaded.takeError();
    }
    const SchemaFile& file = **loaded;
    schemaDeps.push_back(schemaPath(config_, file));

    auto message = file.requireMessage(corpus.messageType);
    if (!message)
    {
        return message.takeError();
    }

    std::vector<CompositeGoldenEntry> entries;
    for (const CompositeCase& item : corpus.cases)
    {
        auto text = renderTextFormatMessage(file, **message, item.value);
        if (!text)
        {
            return text.takeError();
        }
        auto encoded = oracleEncode(file, corpus.messageType, std::move(*text));
        if (!encoded)
        {
            return encoded.takeError();
        }
        auto expected = canonicalizeCompositeCase(file, **message, item.value, *encoded);
        if (!expected)
        {
            diagnostics_.note(DiagnosticSite::atOperation("corpus", corpus.messageType), "failing case " + item.label);
            return expected.takeError();
        }
        entries.push_back(CompositeGoldenEntry{item.label, std::move(*encoded), std::move(*expected)});
    }
    caseCount += entries.size();
    diagnostics_.note(DiagnosticSite::atOperation("corpus", corpus.messageType),
                      std::to_string(entries.size()) + " cases canonicalized");

    const ArtifactHeader header{corpus.schemaFile, goldenEntryPointName(goldenTierName(tier))};
    return renderMessageArtifact(contract_, header, file, **message, entries);
}

llvm::Expected<std::string> GoldenPipeline::renderTier(const GoldenTier          tier,
                                                       std::vector<std::string>& schemaDeps,
                                                       std::size_t&              caseCount)
{
    switch (tier)
    {
    case GoldenTier::Simple:
        return renderSimpleTier(schemaDeps, caseCount);
    case GoldenTier::Middle:
        return renderCompositeTier(tier, buildMiddleCorpus(config_.middleSyntheticCases), schemaDeps, caseCount);
    case GoldenTier::Difficult:
        return renderCompositeTier(tier,
                                   buildDifficultCorpus(config_.difficultSyntheticCases),
                                   schemaDeps,
                                   caseCount);
    case GoldenTier::Malformed: {
        const std::vector<MalformedCase> cases = buildMalformedCorpus();
        caseCount += cases.size();
        const ArtifactHeader header{"hand-authored malformed inputs",
                                    goldenEntryPointName(goldenTierName(GoldenTier::Malformed))};
        return renderMalformedArtifact(contract_, header, cases);
    }
    }
    return llvm::createStringError(llvm::inconvertibleErrorCode(), "unknown golden tier");
}

llvm::Expected<PipelineReport> GoldenPipeline::run()
{
    PipelineReport report;

    EmitWritePolicy policy;
    policy.fileMode        = config_.fileMode;
    policy.recordedOutputs = &report.writtenFiles;

    for (const GoldenTier tier : config_.tiers)
    {
        const llvm::StringRef tierName = goldenTierName(tier);
        diagnostics_.note(DiagnosticSite::atOperation("tier", tierName.str()), "generating");

        std::vector<std::string> schemaDeps;
        std::size_t              caseCount = 0;
        auto                     text      = renderTier(tier, schemaDeps, caseCount);
        if (!text)
        {
            return text.takeError();
        }

        const std::filesystem::path artifactPath =
            std::filesystem::path(config_.outDir) / goldenArtifactFileName(tierName);
        if (llvm::Error err = writeGeneratedFile(artifactPath, *text, policy))
        {
            return std::move(err);
        }
        if (config_.writeDepfiles)
        {
            if (llvm::Error err = writeDepfileForGeneratedOutput(artifactPath, schemaDeps, policy))
            {
                return std::move(err);
            }
        }

        diagnostics_.note(DiagnosticSite::atOperation("tier", tierName.str()),
                          "wrote " + artifactPath.string() + " (" + std::to_string(caseCount) + " cases)");
        report.tiers.push_back(TierReport{tier, artifactPath.string(), caseCount});
    }
    return report;
}

}  // namespace wiregold
