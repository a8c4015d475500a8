//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <llvm/Support/Program.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "wiregold/Corpus/ScalarCorpus.h"
#include "wiregold/Emit/ArtifactEmitter.h"
#include "wiregold/Oracle/ReferenceEncoder.h"
#include "wiregold/Pipeline/GoldenPipeline.h"
#include "wiregold/Support/Diagnostics.h"
#include "wiregold/Support/GenerationError.h"

namespace
{

/// Rejects every request, standing in for a broken reference encoder.
class FailingEncoder final : public wiregold::ReferenceEncoder
{
public:
    llvm::Expected<wiregold::ByteString> encode(const wiregold::EncodeRequest& request) override
    {
        ++calls;
        return wiregold::makeGenerationError(wiregold::GenerationErrorKind::OracleInvocationFailed,
                                             "encode",
                                             request.messageType,
                                             "reference encoder unavailable");
    }

    std::size_t calls{0};
};

std::filesystem::path makeUniqueTempDir(const char* prefix)
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / (std::string(prefix) + std::to_string(now));
}

std::string readTextFile(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return {};
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

wiregold::GeneratorConfig baseConfig(const std::filesystem::path& outDir)
{
    wiregold::GeneratorConfig config;
    config.schemaDir = std::string(WIREGOLD_SOURCE_DIR) + "/proto";
    config.outDir    = outDir.string();
    return config;
}

bool runOfflinePipelineTests(const std::filesystem::path& tmpRoot)
{
    using wiregold::GoldenTier;

    {
        wiregold::GeneratorConfig config = baseConfig(tmpRoot / "malformed");
        config.tiers                     = {GoldenTier::Malformed};
        config.writeDepfiles             = true;

        FailingEncoder             encoder;
        wiregold::DiagnosticEngine diag;
        wiregold::GoldenPipeline   pipeline(config, encoder, diag);
        auto                       report = pipeline.run();
        if (!report)
        {
            std::cerr << "malformed tier failed: " << llvm::toString(report.takeError()) << "\n";
            return false;
        }
        if (encoder.calls != 0U)
        {
            std::cerr << "the malformed tier must not consult the reference encoder\n";
            return false;
        }
        if (report->tiers.size() != 1U || report->tiers.front().tier != GoldenTier::Malformed ||
            report->tiers.front().caseCount != 3U)
        {
            std::cerr << "malformed tier report mismatch\n";
            return false;
        }
        const std::filesystem::path artifact = tmpRoot / "malformed" / "codec_malformed_test.cpp";
        if (std::filesystem::path(report->tiers.front().artifactPath) != artifact)
        {
            std::cerr << "malformed artifact path mismatch\n";
            return false;
        }
        const std::string text = readTextFile(artifact);
        if (text.find("bool runCodecMalformedGoldenTests()") == std::string::npos ||
            text.find("#include \"protobuf/Codec.h\"") == std::string::npos)
        {
            std::cerr << "malformed artifact content mismatch\n";
            return false;
        }
        // A tier without schema dependencies still gets an empty depfile rule.
        if (report->writtenFiles.size() != 2U || !std::filesystem::exists(artifact.string() + ".d"))
        {
            std::cerr << "malformed tier must write its artifact and depfile\n";
            return false;
        }
    }

    {
        wiregold::GeneratorConfig config = baseConfig(tmpRoot / "failing");
        config.tiers                     = {GoldenTier::Malformed, GoldenTier::Simple, GoldenTier::Middle};

        FailingEncoder             encoder;
        wiregold::DiagnosticEngine diag;
        wiregold::GoldenPipeline   pipeline(config, encoder, diag);
        auto                       report = pipeline.run();
        const auto kind = report ? std::nullopt : wiregold::consumeGenerationErrorKind(report.takeError());
        if (!kind || *kind != wiregold::GenerationErrorKind::OracleInvocationFailed)
        {
            std::cerr << "oracle failures must stop the run with oracle-invocation-failed\n";
            return false;
        }
        if (encoder.calls != 1U)
        {
            std::cerr << "the run must stop at the first failed encode\n";
            return false;
        }
        if (!std::filesystem::exists(tmpRoot / "failing" / "codec_malformed_test.cpp") ||
            std::filesystem::exists(tmpRoot / "failing" / "codec_simple_test.cpp") ||
            std::filesystem::exists(tmpRoot / "failing" / "codec_middle_test.cpp"))
        {
            std::cerr << "a failed tier must not leave an artifact behind\n";
            return false;
        }
    }

    {
        wiregold::GeneratorConfig config = baseConfig(tmpRoot / "missing-schema");
        config.schemaDir                 = (tmpRoot / "no-such-dir").string();
        config.tiers                     = {GoldenTier::Difficult};

        FailingEncoder             encoder;
        wiregold::DiagnosticEngine diag;
        wiregold::GoldenPipeline   pipeline(config, encoder, diag);
        std::vector<std::string>   deps;
        std::size_t                count = 0;
        auto                       text  = pipeline.renderTier(GoldenTier::Difficult, deps, count);
        const auto kind = text ? std::nullopt : wiregold::consumeGenerationErrorKind(text.takeError());
        if (!kind || *kind != wiregold::GenerationErrorKind::SchemaNotFound || encoder.calls != 0U)
        {
            std::cerr << "a missing schema directory must report schema-not-found before any encode\n";
            return false;
        }
    }

    return true;
}

bool runProtocPipelineTests(const std::filesystem::path& tmpRoot)
{
    using wiregold::GoldenTier;

    if (!llvm::sys::findProgramByName("protoc"))
    {
        std::cerr << "protoc not on PATH; skipping end-to-end golden generation\n";
        return true;
    }

    wiregold::GeneratorConfig config = baseConfig(tmpRoot / "protoc");
    config.tiers                     = {GoldenTier::Simple, GoldenTier::Middle, GoldenTier::Difficult};
    config.middleSyntheticCases      = 4;
    config.difficultSyntheticCases   = 3;
    config.writeDepfiles             = true;

    wiregold::ProtocReferenceEncoder encoder(config.protocPath);
    wiregold::DiagnosticEngine       diag;
    wiregold::GoldenPipeline         pipeline(config, encoder, diag);
    auto                             report = pipeline.run();
    if (!report)
    {
        std::cerr << "end-to-end generation failed: " << llvm::toString(report.takeError()) << "\n";
        return false;
    }

    std::size_t scalarCases = 0;
    for (const wiregold::ScalarCorpus& corpus : wiregold::buildScalarCorpora())
    {
        scalarCases += corpus.values.size();
    }
    // Middle has six seeds and difficult has six seeds ahead of the synthetic cases.
    if (report->tiers.size() != 3U || report->tiers[0].caseCount != scalarCases ||
        report->tiers[1].caseCount != 10U || report->tiers[2].caseCount != 9U)
    {
        std::cerr << "end-to-end case counts mismatch\n";
        return false;
    }
    if (encoder.invocationCount() != scalarCases + 19U)
    {
        std::cerr << "every case must be encoded exactly once\n";
        return false;
    }
    if (report->writtenFiles.size() != 6U)
    {
        std::cerr << "expected three artifacts and three depfiles\n";
        return false;
    }

    const std::string simple = readTextFile(tmpRoot / "protoc" / "codec_simple_test.cpp");
    if (simple.find("{\"CIAB\", 128},") == std::string::npos ||
        simple.find("bool runCodecSimpleGoldenTests()") == std::string::npos)
    {
        std::cerr << "simple artifact lacks the int32 128 golden row\n";
        return false;
    }
    if (simple.find("{\"DQAAwH8=\", 0x7FC00000U},") == std::string::npos ||
        simple.find("{\"CQAAAAAAAPh/\", 0x7FF8000000000000ULL},") == std::string::npos)
    {
        std::cerr << "simple artifact must carry the encoder's exact NaN bit patterns\n";
        return false;
    }

    const std::string depfile = readTextFile(tmpRoot / "protoc" / "codec_middle_test.cpp.d");
    if (depfile.find("middle.proto") == std::string::npos || depfile.find("difficult.proto") != std::string::npos)
    {
        std::cerr << "middle depfile must list exactly its schema\n";
        return false;
    }
    return true;
}

}  // namespace

bool runGoldenPipelineTests()
{
    const std::filesystem::path tmpRoot = makeUniqueTempDir("wiregold-pipeline-tests-");
    std::error_code             ec;
    std::filesystem::create_directories(tmpRoot, ec);
    if (ec)
    {
        std::cerr << "failed to create temp pipeline test dir: " << ec.message() << "\n";
        return false;
    }

    bool ok = runOfflinePipelineTests(tmpRoot);
    ok      = runProtocPipelineTests(tmpRoot) && ok;
    std::filesystem::remove_all(tmpRoot, ec);
    return ok;
}
