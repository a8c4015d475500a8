//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Reference-encoder interface and its `protoc --encode` implementation.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_ORACLE_REFERENCEENCODER_H
#define WIREGOLD_ORACLE_REFERENCEENCODER_H

#include "wiregold/Domain/FieldValue.h"

#include "llvm/Support/Error.h"

#include <cstdint>
#include <string>
#include <vector>

namespace wiregold
{

/// @brief One encode request sent to the reference encoder.
struct EncodeRequest final
{
    /// @brief Schema file name relative to @ref schemaDir.
    std::string schemaFile;

    /// @brief Directory holding the schema (first `--proto_path`).
    std::string schemaDir;

    /// @brief Additional import roots.
    std::vector<std::string> includeDirs;

    /// @brief Fully-qualified message type to encode.
    std::string messageType;

    /// @brief Text-format message body.
    std::string textFormat;
};

/// @brief Source of ground-truth encodings.
class ReferenceEncoder
{
public:
    virtual ~ReferenceEncoder() = default;

    /// @brief Encodes one text-format message.
    /// @return Encoded bytes or an `OracleInvocationFailed` error.
    virtual llvm::Expected<ByteString> encode(const EncodeRequest& request) = 0;
};

/// @brief Runs `protoc --encode` as a blocking child process per request.
///
/// @details stdin, stdout and stderr are redirected through temporary files
/// that are removed after each call. Any stderr output counts as failure,
/// even with a zero exit status.
class ProtocReferenceEncoder final : public ReferenceEncoder
{
public:
    explicit ProtocReferenceEncoder(std::string protocPath);

    llvm::Expected<ByteString> encode(const EncodeRequest& request) override;

    /// @brief Number of completed child-process runs.
    [[nodiscard]] std::uint64_t invocationCount() const
    {
        return invocations_;
    }

    /// @brief Resolves the configured executable on first use.
    /// @return Absolute program path or `OracleInvocationFailed`.
    llvm::Expected<std::string> resolveExecutable();

private:
    std::string   protocPath_;
    std::string   resolvedPath_;
    std::uint64_t invocations_{0};
};

}  // namespace wiregold

#endif  // WIREGOLD_ORACLE_REFERENCEENCODER_H
