//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "wiregold/Corpus/MalformedCorpus.h"

#include <utility>

namespace wiregold
{

llvm::StringRef decodeFailureName(const DecodeFailure failure)
{
    switch (failure)
    {
    case DecodeFailure::UnknownWireType:
        return "UnknownWireType";
    case DecodeFailure::TruncatedStream:
        return "TruncatedStream";
    case DecodeFailure::InvalidEncoding:
        return "InvalidEncoding";
    }
    return "UnknownWireType";
}

std::vector<MalformedCase> buildMalformedCorpus()
{
    // Field 1 with wire type 6.
    MalformedCase unknownWireType{"unknown_wire_type",
                                  makeBytes({0x0E}),
                                  FailingOperation::ReadTag,
                                  DecodeFailure::UnknownWireType};

    // Declares two payload bytes, carries one.
    MalformedCase truncatedString{"truncated_string",
                                  makeBytes({0x0A, 0x02, 0x61}),
                                  FailingOperation::ReadString,
                                  DecodeFailure::TruncatedStream};

    // Lone UTF-8 lead byte.
    MalformedCase invalidString{"invalid_string",
                                makeBytes({0x0A, 0x01, 0xC2}),
                                FailingOperation::ReadString,
                                DecodeFailure::InvalidEncoding};

    return {std::move(unknownWireType), std::move(truncatedString), std::move(invalidString)};
}

}  // namespace wiregold
