//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "wiregold/Emit/EmitCommon.h"

namespace
{

std::filesystem::path makeUniqueTempDir()
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / ("wiregold-depfile-tests-" + std::to_string(now));
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

}  // namespace

bool runDepfileRenderTests()
{
    {
        // Schema prerequisites come out sorted, unique and make-escaped.
        const std::vector<std::string> schemas  = {"schemas#2/middle.proto",
                                                   "proto dir/simple.proto",
                                                   "$ROOT/a:b.proto",
                                                   "proto dir/simple.proto"};
        const std::string rendered = wiregold::renderMakeDepfile("golden out/codec_middle_test.cpp", schemas);
        const std::string expected = "golden\\ out/codec_middle_test.cpp: $$ROOT/a\\:b.proto "
                                     "proto\\ dir/simple.proto schemas\\#2/middle.proto\n";
        if (rendered != expected)
        {
            std::cerr << "depfile rule mismatch: " << rendered;
            return false;
        }
    }

    {
        const std::string rendered = wiregold::renderMakeDepfile("codec_difficult_test.cpp", {"in\\dir\tx.proto"});
        if (rendered != "codec_difficult_test.cpp: in\\\\dir\\\tx.proto\n")
        {
            std::cerr << "backslash and tab escaping mismatch\n";
            return false;
        }
    }

    {
        // The malformed tier has no schema prerequisites.
        const std::string rendered = wiregold::renderMakeDepfile("codec_malformed_test.cpp", {});
        if (rendered != "codec_malformed_test.cpp:\n")
        {
            std::cerr << "a rule without prerequisites must end right after the colon\n";
            return false;
        }
    }

    {
        std::ostringstream out;
        wiregold::emitLine(out, 2, "return true;");
        wiregold::emitLine(out, 3, "");
        if (out.str() != "        return true;\n\n")
        {
            std::cerr << "emitLine indentation mismatch\n";
            return false;
        }
    }

    const std::filesystem::path tmpRoot = makeUniqueTempDir();
    std::error_code             ec;
    std::filesystem::create_directories(tmpRoot, ec);
    if (ec)
    {
        std::cerr << "failed to create temp depfile test dir: " << ec.message() << "\n";
        return false;
    }

    auto fail = [&](std::string_view message) {
        std::cerr << message << "\n";
        std::filesystem::remove_all(tmpRoot, ec);
        return false;
    };

    const std::filesystem::path artifactPath = tmpRoot / "gen" / "codec_simple_test.cpp";
    std::vector<std::string>    recorded;
    wiregold::EmitWritePolicy   policy;
    policy.fileMode        = 0640U;
    policy.recordedOutputs = &recorded;

    for (const char* content : {"first\n", "second\n"})
    {
        if (auto err = wiregold::writeGeneratedFile(artifactPath, content, policy))
        {
            std::cerr << "writeGeneratedFile failed unexpectedly: " << llvm::toString(std::move(err)) << "\n";
            std::filesystem::remove_all(tmpRoot, ec);
            return false;
        }
    }
    if (readTextFile(artifactPath) != "second\n")
    {
        return fail("rewriting an artifact must replace its content");
    }
    for (const auto& entry : std::filesystem::directory_iterator(artifactPath.parent_path(), ec))
    {
        if (entry.path().filename().string().find(".tmp-") != std::string::npos)
        {
            return fail("atomic write left a temporary file behind");
        }
    }
    const auto perms = std::filesystem::status(artifactPath, ec).permissions();
    if (ec || (perms & std::filesystem::perms::all) !=
                  (std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
                   std::filesystem::perms::group_read))
    {
        return fail("artifact mode does not follow the write policy");
    }
    if (recorded.size() != 2U ||
        recorded.front() != std::filesystem::absolute(artifactPath, ec).lexically_normal().string())
    {
        return fail("artifact writes must record absolute normalized paths");
    }

    const std::filesystem::path depA = tmpRoot / "proto" / "a.proto";
    const std::filesystem::path depB = tmpRoot / "proto" / "b.proto";
    std::filesystem::create_directories(depA.parent_path(), ec);
    if (ec)
    {
        return fail("failed to create dependency fixture directory");
    }
    {
        std::ofstream outA(depA);
        std::ofstream outB(depB);
        if (!outA || !outB)
        {
            return fail("failed to create dependency fixture files");
        }
    }

    recorded.clear();
    const std::filesystem::path    outputPath = tmpRoot / "out dir" / "codec_middle_test.cpp";
    const std::vector<std::string> deps       = {depB.string(), depA.string(), depB.string()};
    if (auto err = wiregold::writeDepfileForGeneratedOutput(outputPath, deps, policy))
    {
        std::cerr << "writeDepfileForGeneratedOutput failed unexpectedly: " << llvm::toString(std::move(err)) << "\n";
        std::filesystem::remove_all(tmpRoot, ec);
        return false;
    }

    const std::filesystem::path depfilePath = outputPath.string() + ".d";
    if (!std::filesystem::exists(depfilePath, ec) || ec)
    {
        return fail("expected depfile output was not created");
    }

    const std::string        depfileContent = readTextFile(depfilePath);
    std::vector<std::string> normalizedDeps = {
        std::filesystem::absolute(depA, ec).lexically_normal().string(),
        std::filesystem::absolute(depB, ec).lexically_normal().string(),
    };
    const std::string expectedDepfile =
        wiregold::renderMakeDepfile(std::filesystem::absolute(outputPath, ec).lexically_normal().string(),
                                    normalizedDeps);
    if (depfileContent != expectedDepfile)
    {
        return fail("depfile content did not match expected normalized+escaped rule");
    }

    if (recorded.size() != 1 || !recorded.front().ends_with(".d"))
    {
        return fail("depfile write did not record one .d output path");
    }

    std::filesystem::remove_all(tmpRoot, ec);
    return true;
}
