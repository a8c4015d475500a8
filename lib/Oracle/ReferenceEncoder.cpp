//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "wiregold/Oracle/ReferenceEncoder.h"

#include "wiregold/Support/GenerationError.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Config/llvm-config.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FileUtilities.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Program.h"
#include "llvm/Support/raw_ostream.h"

#if LLVM_VERSION_MAJOR >= 16
#include <optional>
#else
#include "llvm/ADT/Optional.h"
#endif

#include <utility>

namespace wiregold
{
namespace
{

#if LLVM_VERSION_MAJOR >= 16
using RedirectPath = std::optional<llvm::StringRef>;
#else
using RedirectPath = llvm::Optional<llvm::StringRef>;
#endif

llvm::Error oracleFailure(const EncodeRequest& request, std::string detail)
{
    return makeGenerationError(GenerationErrorKind::OracleInvocationFailed,
                               "oracle-encode",
                               request.messageType,
                               std::move(detail));
}

llvm::Expected<std::string> readWholeFile(llvm::StringRef path)
{
    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return llvm::createStringError(buffer.getError(), "failed to read %s", path.str().c_str());
    }
    return (*buffer)->getBuffer().str();
}

}  // namespace

ProtocReferenceEncoder::ProtocReferenceEncoder(std::string protocPath)
    : protocPath_(std::move(protocPath))
{
}

llvm::Expected<std::string> ProtocReferenceEncoder::resolveExecutable()
{
    if (!resolvedPath_.empty())
    {
        return resolvedPath_;
    }
    if (llvm::sys::path::has_parent_path(protocPath_))
    {
        if (!llvm::sys::fs::can_execute(protocPath_))
        {
            return makeGenerationError(GenerationErrorKind::OracleInvocationFailed,
                                       "oracle-resolve",
                                       protocPath_,
                                       "reference encoder is not an executable file");
        }
        resolvedPath_ = protocPath_;
        return resolvedPath_;
    }
    auto found = llvm::sys::findProgramByName(protocPath_);
    if (!found)
    {
        return makeGenerationError(GenerationErrorKind::OracleInvocationFailed,
                                   "oracle-resolve",
                                   protocPath_,
                                   "reference encoder not found on PATH: " + found.getError().message());
    }
    resolvedPath_ = *found;
    return resolvedPath_;
}

llvm::Expected<ByteString> ProtocReferenceEncoder::encode(const EncodeRequest& request)
{
    auto program = resolveExecutable();
    if (!program)
    {
        return program.takeError();
    }

    llvm::SmallString<128> inputPath;
    llvm::SmallString<128> outputPath;
    llvm::SmallString<128> errorPath;
    if (const std::error_code ec = llvm::sys::fs::createTemporaryFile("wiregold-oracle-in", "txtpb", inputPath))
    {
        return oracleFailure(request, "cannot create temporary input: " + ec.message());
    }
    llvm::FileRemover inputRemover(inputPath);
    if (const std::error_code ec = llvm::sys::fs::createTemporaryFile("wiregold-oracle-out", "bin", outputPath))
    {
        return oracleFailure(request, "cannot create temporary output: " + ec.message());
    }
    llvm::FileRemover outputRemover(outputPath);
    if (const std::error_code ec = llvm::sys::fs::createTemporaryFile("wiregold-oracle-err", "txt", errorPath))
    {
        return oracleFailure(request, "cannot create temporary stderr capture: " + ec.message());
    }
    llvm::FileRemover errorRemover(errorPath);

    {
        std::error_code      ec;
        llvm::raw_fd_ostream input(inputPath, ec);
        if (ec)
        {
            return oracleFailure(request, "cannot write text-format input: " + ec.message());
        }
        input << request.textFormat;
        input.close();
        if (input.has_error())
        {
            return oracleFailure(request, "cannot write text-format input: " + input.error().message());
        }
    }

    std::vector<std::string> ownedArgs;
    ownedArgs.push_back(*program);
    ownedArgs.push_back("--proto_path=" + request.schemaDir);
    for (const std::string& includeDir : request.includeDirs)
    {
        ownedArgs.push_back("--proto_path=" + includeDir);
    }
    ownedArgs.push_back("--encode=" + request.messageType);
    ownedArgs.push_back(request.schemaFile);

    std::vector<llvm::StringRef> args;
    args.reserve(ownedArgs.size());
    for (const std::string& arg : ownedArgs)
    {
        args.emplace_back(arg);
    }
    const RedirectPath redirects[] = {llvm::StringRef(inputPath), llvm::StringRef(outputPath), llvm::StringRef(errorPath)};

    std::string errorMessage;
    bool        executionFailed = false;
    const int   status          = llvm::sys::ExecuteAndWait(*program,
                                                 args,
                                                 {},
                                                 redirects,
                                                 0,
                                                 0,
                                                 &errorMessage,
                                                 &executionFailed);
    ++invocations_;
    if (executionFailed || status < 0)
    {
        return oracleFailure(request, "cannot run " + *program + ": " + errorMessage);
    }

    auto errorText = readWholeFile(errorPath);
    if (!errorText)
    {
        return errorText.takeError();
    }
    const llvm::StringRef diagnostics = llvm::StringRef(*errorText).trim();
    if (status != 0)
    {
        return oracleFailure(request,
                             "protoc exited with status " + std::to_string(status) +
                                 (diagnostics.empty() ? std::string() : ": " + diagnostics.str()));
    }
    if (!errorText->empty())
    {
        return oracleFailure(request,
                             diagnostics.empty() ? std::string("protoc wrote whitespace to stderr")
                                                 : "protoc reported: " + diagnostics.str());
    }

    auto encoded = readWholeFile(outputPath);
    if (!encoded)
    {
        return encoded.takeError();
    }
    return ByteString(encoded->begin(), encoded->end());
}

}  // namespace wiregold
