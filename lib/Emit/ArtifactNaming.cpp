//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "wiregold/Emit/ArtifactEmitter.h"

#include "llvm/ADT/StringExtras.h"

namespace wiregold
{

std::string goldenEntryPointName(llvm::StringRef tierName)
{
    std::string stem = tierName.str();
    if (!stem.empty())
    {
        stem[0] = llvm::toUpper(stem[0]);
    }
    return "runCodec" + stem + "GoldenTests";
}

std::string goldenArtifactFileName(llvm::StringRef tierName)
{
    return "codec_" + tierName.str() + "_test.cpp";
}

}  // namespace wiregold
