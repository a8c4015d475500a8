//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Hand-authored byte sequences the codec under test must reject.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_CORPUS_MALFORMEDCORPUS_H
#define WIREGOLD_CORPUS_MALFORMEDCORPUS_H

#include "wiregold/Domain/FieldValue.h"

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace wiregold
{

/// @brief Decode failure classification exposed by the codec contract.
enum class DecodeFailure
{
    UnknownWireType,
    TruncatedStream,
    InvalidEncoding,
};

/// @brief Codec operation expected to raise the failure.
enum class FailingOperation
{
    /// @brief The first `readTag` call fails.
    ReadTag,

    /// @brief `readTag` yields field 1 length-delimited, then `readString` fails.
    ReadString,
};

[[nodiscard]] llvm::StringRef decodeFailureName(DecodeFailure failure);

struct MalformedCase final
{
    /// @brief Fixture identifier (`truncated_string`).
    std::string      name;
    ByteString       bytes;
    FailingOperation operation{FailingOperation::ReadTag};
    DecodeFailure    expected{DecodeFailure::UnknownWireType};
};

[[nodiscard]] std::vector<MalformedCase> buildMalformedCorpus();

}  // namespace wiregold

#endif  // WIREGOLD_CORPUS_MALFORMEDCORPUS_H
